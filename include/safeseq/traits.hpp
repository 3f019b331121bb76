#pragma once

#include <iterator>
#include <type_traits>
#include <utility>

#include "ordering.hpp"

namespace safeseq {

// ============================================================================
// Iterable - can be walked from first to last element
// ============================================================================

// Covers containers, std::array, std::string_view and built-in arrays.
// Read-only operations need nothing more.
template<typename S, typename = void>
struct is_iterable : std::false_type {};

template<typename S>
struct is_iterable<S, std::void_t<
    decltype(std::begin(std::declval<const S&>())),
    decltype(std::end(std::declval<const S&>())),
    decltype(std::empty(std::declval<const S&>()))
>> : std::true_type {};

template<typename S>
using iterator_t = decltype(std::begin(std::declval<const S&>()));

template<typename S>
using element_t = std::decay_t<decltype(*std::begin(std::declval<const S&>()))>;

// Operations that look at the back need bidirectional iterators
template<typename S, typename = void>
struct is_bidirectional_iterable : std::false_type {};

template<typename S>
struct is_bidirectional_iterable<S, std::enable_if_t<is_iterable<S>::value>>
    : std::is_base_of<
        std::bidirectional_iterator_tag,
        typename std::iterator_traits<iterator_t<S>>::iterator_category> {};

// ============================================================================
// Sequence - an Iterable container that can build a new instance of itself
// from an iterator range
// ============================================================================

// Required only by operations that return a sequence
template<typename S, typename = void>
struct is_sequence : std::false_type {};

template<typename S>
struct is_sequence<S, std::void_t<
    std::enable_if_t<is_iterable<S>::value>,
    typename S::value_type,
    decltype(std::declval<const S&>().size()),
    decltype(S(std::declval<const S&>().begin(), std::declval<const S&>().end()))
>> : std::true_type {};

template<typename S, typename = void>
struct is_bidirectional_sequence : std::false_type {};

template<typename S>
struct is_bidirectional_sequence<S, std::enable_if_t<is_sequence<S>::value>>
    : is_bidirectional_iterable<S> {};

// ============================================================================
// Element capabilities
// ============================================================================

template<typename T, typename U = T, typename = void>
struct is_equality_comparable : std::false_type {};

template<typename T, typename U>
struct is_equality_comparable<T, U, std::enable_if_t<std::is_convertible_v<
    decltype(std::declval<const T&>() == std::declval<const U&>()), bool>>>
    : std::true_type {};

// Orderable through operator<
template<typename T, typename = void>
struct is_ordered : std::false_type {};

template<typename T>
struct is_ordered<T, std::enable_if_t<std::is_convertible_v<
    decltype(std::declval<const T&>() < std::declval<const T&>()), bool>>>
    : std::true_type {};

// A callable (const T&, const T&) -> Ordering
template<typename F, typename T, typename = void>
struct is_comparator : std::false_type {};

template<typename F, typename T>
struct is_comparator<F, T, std::enable_if_t<std::is_same_v<
    std::invoke_result_t<F&, const T&, const T&>, Ordering>>>
    : std::true_type {};

// A callable (const T&) -> bool
template<typename P, typename T, typename = void>
struct is_predicate : std::false_type {};

template<typename P, typename T>
struct is_predicate<P, T, std::enable_if_t<std::is_convertible_v<
    std::invoke_result_t<P&, const T&>, bool>>>
    : std::true_type {};

// ============================================================================
// Helper constexpr variables
// ============================================================================

template<typename S>
inline constexpr bool Iterable = is_iterable<S>::value;

template<typename S>
inline constexpr bool BidirectionalIterable = is_bidirectional_iterable<S>::value;

template<typename S>
inline constexpr bool Sequence = is_sequence<S>::value;

template<typename S>
inline constexpr bool BidirectionalSequence = is_bidirectional_sequence<S>::value;

template<typename T, typename U = T>
inline constexpr bool EqualityComparable = is_equality_comparable<T, U>::value;

template<typename T>
inline constexpr bool Ordered = is_ordered<T>::value;

template<typename F, typename T>
inline constexpr bool Comparator = is_comparator<F, T>::value;

template<typename P, typename T>
inline constexpr bool Predicate = is_predicate<P, T>::value;

} // namespace safeseq
