#ifndef SAFESEQ_ORDERING_HPP
#define SAFESEQ_ORDERING_HPP

#include <utility>

// Ordering - result of a three-way comparison
//
// Comparators passed to the *_by operations take two elements and return an
// Ordering. They are expected to define a total order.

namespace safeseq {

enum class Ordering {
    Less,
    Equal,
    Greater
};

// Three-way comparison built from operator< alone
template<typename T>
constexpr Ordering cmp(const T& a, const T& b) {
    if (a < b) return Ordering::Less;
    if (b < a) return Ordering::Greater;
    return Ordering::Equal;
}

constexpr Ordering reverse(Ordering ord) noexcept {
    switch (ord) {
        case Ordering::Less: return Ordering::Greater;
        case Ordering::Greater: return Ordering::Less;
        case Ordering::Equal: break;
    }
    return Ordering::Equal;
}

// Lexicographic chaining: ord, or next when ord is Equal
constexpr Ordering then(Ordering ord, Ordering next) noexcept {
    return ord == Ordering::Equal ? next : ord;
}

// comparing(key) orders elements by key(element)
template<typename Key>
auto comparing(Key key) {
    return [key = std::move(key)](const auto& a, const auto& b) {
        return cmp(key(a), key(b));
    };
}

// Adapts an Ordering comparator into a strict-weak "less" predicate for
// the standard algorithms
template<typename Compare>
auto less_from(Compare compare) {
    return [compare = std::move(compare)](const auto& a, const auto& b) {
        return compare(a, b) == Ordering::Less;
    };
}

} // namespace safeseq

#endif // SAFESEQ_ORDERING_HPP
