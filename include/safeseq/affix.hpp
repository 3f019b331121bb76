#ifndef SAFESEQ_AFFIX_HPP
#define SAFESEQ_AFFIX_HPP

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

#include "option.hpp"
#include "traits.hpp"

// Prefix and suffix handling
//
// strip_* return None when the affix is absent. drop_* fall back to the
// input unchanged. Both remove a single occurrence only:
//   drop_prefix("a", "aab") == "ab"
//   drop_prefix("a", drop_prefix("a", "aab")) == "b"
//
// The generic forms accept any two sequences with equality-comparable
// elements. The string forms take any mix of character pointers, literals,
// std::basic_string and std::basic_string_view sharing one character type,
// as long as both arguments are not already sequences; they return an owned
// std::basic_string of that character type.

namespace safeseq {

namespace detail {

template<typename Affix, typename Seq>
using enable_if_affix_t = std::enable_if_t<
    Sequence<Affix> && Sequence<Seq> &&
    EqualityComparable<element_t<Seq>, element_t<Affix>>>;

template<typename Seq>
auto advance_from(typename Seq::const_iterator it, std::size_t n) {
    return std::next(it, static_cast<std::ptrdiff_t>(n));
}

template<typename C>
struct is_char_type : std::bool_constant<
    std::is_same_v<C, char> || std::is_same_v<C, wchar_t> ||
#if defined(__cpp_char8_t)
    std::is_same_v<C, char8_t> ||
#endif
    std::is_same_v<C, char16_t> || std::is_same_v<C, char32_t>> {};

// Character type of a string-like argument; no member for anything else
template<typename S, typename = void>
struct text_char {};

template<typename C>
struct text_char<C*, std::enable_if_t<is_char_type<std::remove_const_t<C>>::value>> {
    using type = std::remove_const_t<C>;
};

template<typename C, typename A>
struct text_char<std::basic_string<C, std::char_traits<C>, A>> {
    using type = C;
};

template<typename C>
struct text_char<std::basic_string_view<C>> {
    using type = C;
};

template<typename S>
using text_char_t = typename text_char<std::decay_t<S>>::type;

template<typename S>
using text_view_t = std::basic_string_view<text_char_t<S>>;

template<typename S>
using text_string_t = std::basic_string<text_char_t<S>>;

// Two sequences go to the generic forms instead
template<typename A, typename B, typename R>
using if_text_t = std::enable_if_t<
    !(Sequence<A> && Sequence<B>) &&
    std::is_same_v<text_char_t<A>, text_char_t<B>>, R>;

template<typename C>
bool starts_with(std::basic_string_view<C> prefix, std::basic_string_view<C> text) {
    return prefix.size() <= text.size() && text.compare(0, prefix.size(), prefix) == 0;
}

template<typename C>
bool ends_with(std::basic_string_view<C> suffix, std::basic_string_view<C> text) {
    return suffix.size() <= text.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace detail

// ============================================================================
// Predicates
// ============================================================================

template<typename Affix, typename Seq, typename = detail::enable_if_affix_t<Affix, Seq>>
bool is_prefix_of(const Affix& prefix, const Seq& seq) {
    if (prefix.size() > seq.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), seq.begin(),
                      [](const auto& a, const auto& b) { return b == a; });
}

template<typename Affix, typename Seq, typename = detail::enable_if_affix_t<Affix, Seq>>
bool is_suffix_of(const Affix& suffix, const Seq& seq) {
    static_assert(BidirectionalSequence<Affix> && BidirectionalSequence<Seq>,
                  "is_suffix_of requires bidirectional iterators");
    if (suffix.size() > seq.size()) {
        return false;
    }
    return std::equal(std::make_reverse_iterator(suffix.end()),
                      std::make_reverse_iterator(suffix.begin()),
                      std::make_reverse_iterator(seq.end()),
                      [](const auto& a, const auto& b) { return b == a; });
}

template<typename Affix, typename Seq, typename = detail::enable_if_affix_t<Affix, Seq>>
bool is_infix_of(const Affix& needle, const Seq& seq) {
    if (needle.empty()) {
        return true;
    }
    return std::search(seq.begin(), seq.end(), needle.begin(), needle.end(),
                       [](const auto& a, const auto& b) { return a == b; }) != seq.end();
}

// ============================================================================
// Stripping
// ============================================================================

template<typename Affix, typename Seq, typename = detail::enable_if_affix_t<Affix, Seq>>
Option<Seq> strip_prefix(const Affix& prefix, const Seq& seq) {
    if (!is_prefix_of(prefix, seq)) {
        return None;
    }
    return Option<Seq>(Seq(detail::advance_from<Seq>(seq.begin(), prefix.size()), seq.end()));
}

// Prefix strip on the reversed inputs, matched through reverse iterators
// instead of reversed copies
template<typename Affix, typename Seq, typename = detail::enable_if_affix_t<Affix, Seq>>
Option<Seq> strip_suffix(const Affix& suffix, const Seq& seq) {
    if (!is_suffix_of(suffix, seq)) {
        return None;
    }
    return Option<Seq>(Seq(seq.begin(), detail::advance_from<Seq>(seq.begin(), seq.size() - suffix.size())));
}

// seq is copied only when the affix is absent
template<typename Affix, typename Seq, typename = detail::enable_if_affix_t<Affix, Seq>>
Seq drop_prefix(const Affix& prefix, const Seq& seq) {
    auto stripped = strip_prefix(prefix, seq);
    if (stripped.is_some()) {
        return stripped.unwrap();
    }
    return seq;
}

template<typename Affix, typename Seq, typename = detail::enable_if_affix_t<Affix, Seq>>
Seq drop_suffix(const Affix& suffix, const Seq& seq) {
    auto stripped = strip_suffix(suffix, seq);
    if (stripped.is_some()) {
        return stripped.unwrap();
    }
    return seq;
}

// ============================================================================
// String forms
// ============================================================================

template<typename A, typename B>
detail::if_text_t<A, B, bool> is_prefix_of(const A& prefix, const B& text) {
    using View = detail::text_view_t<A>;
    return detail::starts_with(View(prefix), View(text));
}

template<typename A, typename B>
detail::if_text_t<A, B, bool> is_suffix_of(const A& suffix, const B& text) {
    using View = detail::text_view_t<A>;
    return detail::ends_with(View(suffix), View(text));
}

template<typename A, typename B>
detail::if_text_t<A, B, bool> is_infix_of(const A& needle, const B& text) {
    using View = detail::text_view_t<A>;
    return View(text).find(View(needle)) != View::npos;
}

template<typename A, typename B>
detail::if_text_t<A, B, Option<detail::text_string_t<A>>>
strip_prefix(const A& prefix, const B& text) {
    using View = detail::text_view_t<A>;
    using String = detail::text_string_t<A>;
    const View p(prefix);
    const View t(text);
    if (!detail::starts_with(p, t)) {
        return None;
    }
    return Option<String>(String(t.substr(p.size())));
}

template<typename A, typename B>
detail::if_text_t<A, B, Option<detail::text_string_t<A>>>
strip_suffix(const A& suffix, const B& text) {
    using View = detail::text_view_t<A>;
    using String = detail::text_string_t<A>;
    const View s(suffix);
    const View t(text);
    if (!detail::ends_with(s, t)) {
        return None;
    }
    return Option<String>(String(t.substr(0, t.size() - s.size())));
}

template<typename A, typename B>
detail::if_text_t<A, B, detail::text_string_t<A>>
drop_prefix(const A& prefix, const B& text) {
    using View = detail::text_view_t<A>;
    using String = detail::text_string_t<A>;
    const View p(prefix);
    const View t(text);
    if (!detail::starts_with(p, t)) {
        return String(t);
    }
    return String(t.substr(p.size()));
}

template<typename A, typename B>
detail::if_text_t<A, B, detail::text_string_t<A>>
drop_suffix(const A& suffix, const B& text) {
    using View = detail::text_view_t<A>;
    using String = detail::text_string_t<A>;
    const View s(suffix);
    const View t(text);
    if (!detail::ends_with(s, t)) {
        return String(t);
    }
    return String(t.substr(0, t.size() - s.size()));
}

} // namespace safeseq

#endif // SAFESEQ_AFFIX_HPP
