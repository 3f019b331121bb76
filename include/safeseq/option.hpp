#ifndef SAFESEQ_OPTION_HPP
#define SAFESEQ_OPTION_HPP

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

// Option<T> - an optional value
//
// Every total operation in safeseq reports "no result" through Option
// instead of a sentinel or an exception. The only throwing members are
// unwrap() and expect(), which the caller reaches by choosing not to check.

namespace safeseq {

// Tag type for the empty variant
struct None_t {
    constexpr None_t() noexcept = default;
};
inline constexpr None_t None{};

template<typename T>
class Option {
private:
    bool has_value;
    union {
        T value;
        char dummy;
    };

    void reset() {
        if (has_value) {
            value.~T();
            has_value = false;
        }
    }

public:
    using value_type = T;

    Option() : has_value(false), dummy(0) {}

    Option(None_t) : has_value(false), dummy(0) {}

    Option(T val) : has_value(true), value(std::move(val)) {}

    Option(const Option& other) : has_value(other.has_value), dummy(0) {
        if (has_value) {
            new (&value) T(other.value);
        }
    }

    // The source is left None
    Option(Option&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value(other.has_value), dummy(0) {
        if (has_value) {
            new (&value) T(std::move(other.value));
            other.reset();
        }
    }

    Option& operator=(const Option& other) {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(other.value);
                has_value = true;
            }
        }
        return *this;
    }

    Option& operator=(Option&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(std::move(other.value));
                has_value = true;
                other.reset();
            }
        }
        return *this;
    }

    ~Option() {
        reset();
    }

    bool is_some() const { return has_value; }
    bool is_none() const { return !has_value; }

    explicit operator bool() const { return has_value; }

    bool contains(const T& other) const {
        return has_value && value == other;
    }

    // Move the value out, leaving None. Throws on None.
    T unwrap() {
        if (!has_value) {
            throw std::runtime_error("Called unwrap on None");
        }
        T result = std::move(value);
        reset();
        return result;
    }

    T expect(const char* msg) {
        if (!has_value) {
            throw std::runtime_error(msg);
        }
        return unwrap();
    }

    T unwrap_or(T default_value) {
        if (has_value) {
            return unwrap();
        }
        return default_value;
    }

    template<typename F>
    T unwrap_or_else(F&& f) {
        if (has_value) {
            return unwrap();
        }
        return f();
    }

    // Consumes the value
    template<typename F>
    auto map(F&& f) -> Option<std::decay_t<decltype(f(std::declval<T>()))>> {
        using U = std::decay_t<decltype(f(std::declval<T>()))>;
        if (has_value) {
            return Option<U>(f(unwrap()));
        }
        return Option<U>(None);
    }

    template<typename F>
    auto map_ref(F&& f) const -> Option<std::decay_t<decltype(f(std::declval<const T&>()))>> {
        using U = std::decay_t<decltype(f(std::declval<const T&>()))>;
        if (has_value) {
            return Option<U>(f(value));
        }
        return Option<U>(None);
    }

    // f must return an Option
    template<typename F>
    auto and_then(F&& f) -> std::decay_t<decltype(f(std::declval<T>()))> {
        using R = std::decay_t<decltype(f(std::declval<T>()))>;
        if (has_value) {
            return f(unwrap());
        }
        return R(None);
    }

    template<typename P>
    Option<T> filter(P&& pred) {
        if (has_value && pred(static_cast<const T&>(value))) {
            return Option<T>(unwrap());
        }
        reset();
        return Option<T>(None);
    }

    template<typename F>
    Option<T> or_else(F&& f) {
        if (has_value) {
            return take();
        }
        return f();
    }

    Option<T> take() {
        Option<T> result = std::move(*this);
        reset();
        return result;
    }

    void replace(T new_value) {
        if (has_value) {
            value = std::move(new_value);
        } else {
            new (&value) T(std::move(new_value));
            has_value = true;
        }
    }

    Option<T&> as_mut() & {
        if (has_value) {
            return Option<T&>(value);
        }
        return None;
    }

    Option<const T&> as_ref() const & {
        if (has_value) {
            return Option<const T&>(value);
        }
        return None;
    }

    // A view of a temporary would dangle
    Option<const T&> as_ref() const && = delete;
    Option<T&> as_mut() && = delete;
};

// Option<T&> - a nullable mutable reference, pointer backed
template<typename T>
class Option<T&> {
private:
    T* ptr;

public:
    Option() : ptr(nullptr) {}
    Option(None_t) : ptr(nullptr) {}
    Option(T& ref) : ptr(&ref) {}

    Option(const Option& other) = default;
    Option& operator=(const Option& other) = default;

    bool is_some() const { return ptr != nullptr; }
    bool is_none() const { return ptr == nullptr; }

    explicit operator bool() const { return ptr != nullptr; }

    T& unwrap() const {
        if (!ptr) {
            throw std::runtime_error("Called unwrap on None");
        }
        return *ptr;
    }

    T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }

    T& unwrap_or(T& default_ref) const {
        return ptr ? *ptr : default_ref;
    }

    template<typename F>
    auto map(F&& f) const -> Option<std::decay_t<decltype(f(std::declval<T&>()))>> {
        using U = std::decay_t<decltype(f(std::declval<T&>()))>;
        if (ptr) {
            return Option<U>(f(*ptr));
        }
        return Option<U>(None);
    }

    // Detaches the reference into an owned copy
    Option<T> cloned() const {
        if (ptr) {
            return Option<T>(*ptr);
        }
        return None;
    }

    bool contains(const T& other) const {
        return ptr && (*ptr == other);
    }
};

// Option<const T&> - a nullable shared reference
template<typename T>
class Option<const T&> {
private:
    const T* ptr;

public:
    Option() : ptr(nullptr) {}
    Option(None_t) : ptr(nullptr) {}
    Option(const T& ref) : ptr(&ref) {}

    Option(const Option& other) = default;
    Option& operator=(const Option& other) = default;

    bool is_some() const { return ptr != nullptr; }
    bool is_none() const { return ptr == nullptr; }

    explicit operator bool() const { return ptr != nullptr; }

    const T& unwrap() const {
        if (!ptr) {
            throw std::runtime_error("Called unwrap on None");
        }
        return *ptr;
    }

    const T& expect(const char* msg) const {
        if (!ptr) {
            throw std::runtime_error(msg);
        }
        return *ptr;
    }

    const T& unwrap_or(const T& default_ref) const {
        return ptr ? *ptr : default_ref;
    }

    template<typename F>
    auto map(F&& f) const -> Option<std::decay_t<decltype(f(std::declval<const T&>()))>> {
        using U = std::decay_t<decltype(f(std::declval<const T&>()))>;
        if (ptr) {
            return Option<U>(f(*ptr));
        }
        return Option<U>(None);
    }

    Option<T> cloned() const {
        if (ptr) {
            return Option<T>(*ptr);
        }
        return None;
    }

    bool contains(const T& other) const {
        return ptr && (*ptr == other);
    }
};

template<typename T>
Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

template<typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.is_none() && rhs.is_none()) return true;
    if (lhs.is_some() && rhs.is_some()) {
        return lhs.as_ref().unwrap() == rhs.as_ref().unwrap();
    }
    return false;
}

template<typename T>
bool operator!=(const Option<T>& lhs, const Option<T>& rhs) {
    return !(lhs == rhs);
}

template<typename T>
bool operator==(const Option<T>& opt, None_t) {
    return opt.is_none();
}

template<typename T>
bool operator==(None_t, const Option<T>& opt) {
    return opt.is_none();
}

template<typename T>
bool operator!=(const Option<T>& opt, None_t) {
    return opt.is_some();
}

template<typename T>
bool operator!=(None_t, const Option<T>& opt) {
    return opt.is_some();
}

} // namespace safeseq

#endif // SAFESEQ_OPTION_HPP
