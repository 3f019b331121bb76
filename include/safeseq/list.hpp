#ifndef SAFESEQ_LIST_HPP
#define SAFESEQ_LIST_HPP

#include <cstddef>
#include <iterator>
#include <utility>

#include "option.hpp"
#include "ordering.hpp"
#include "traits.hpp"

// Total element access for sequences
//
// Each function here is defined for every input, including the empty
// sequence. Read-only operations accept anything Iterable (std::array,
// std::string_view and built-in arrays included); those returning a new
// sequence need a range-constructible Sequence. Absence of a result is
// returned as None; nothing throws.
//
// Extremum tie-break: maximum_maybe and maximum_by_maybe return the LAST of
// several equal greatest elements, minimum_maybe and minimum_by_maybe the
// FIRST of several equal least elements (the same pair std::minmax_element
// picks).

namespace safeseq {

namespace detail {

// Left-to-right scan keeping the current candidate; replace(best, x)
// decides whether x takes over.
template<typename Seq, typename Replace>
Option<element_t<Seq>> select(const Seq& seq, Replace replace) {
    auto it = std::begin(seq);
    const auto last = std::end(seq);
    if (it == last) {
        return None;
    }
    auto best = it;
    for (++it; it != last; ++it) {
        if (replace(*best, *it)) {
            best = it;
        }
    }
    return Option<element_t<Seq>>(*best);
}

} // namespace detail

// ============================================================================
// Ends of a sequence
// ============================================================================

template<typename Seq>
Option<element_t<Seq>> head_maybe(const Seq& seq) {
    static_assert(Iterable<Seq>, "head_maybe requires an iterable type");
    if (std::empty(seq)) {
        return None;
    }
    return Option<element_t<Seq>>(*std::begin(seq));
}

template<typename Seq>
Option<element_t<Seq>> last_maybe(const Seq& seq) {
    static_assert(BidirectionalIterable<Seq>,
                  "last_maybe requires bidirectional iterators");
    if (std::empty(seq)) {
        return None;
    }
    return Option<element_t<Seq>>(*std::prev(std::end(seq)));
}

// None only for an empty input; a single element yields Some(empty)
template<typename Seq>
Option<Seq> tail_maybe(const Seq& seq) {
    static_assert(Sequence<Seq>, "tail_maybe requires a sequence type");
    if (seq.empty()) {
        return None;
    }
    return Option<Seq>(Seq(std::next(seq.begin()), seq.end()));
}

// None only for an empty input; a single element yields Some(empty)
template<typename Seq>
Option<Seq> init_maybe(const Seq& seq) {
    static_assert(BidirectionalSequence<Seq>,
                  "init_maybe requires a sequence with bidirectional iterators");
    if (seq.empty()) {
        return None;
    }
    return Option<Seq>(Seq(seq.begin(), std::prev(seq.end())));
}

// Head and tail in one step
template<typename Seq>
Option<std::pair<element_t<Seq>, Seq>> uncons(const Seq& seq) {
    static_assert(Sequence<Seq>, "uncons requires a sequence type");
    using Pair = std::pair<element_t<Seq>, Seq>;
    if (seq.empty()) {
        return None;
    }
    auto first = seq.begin();
    return Option<Pair>(Pair(*first, Seq(std::next(first), seq.end())));
}

// ============================================================================
// Extrema
// ============================================================================

template<typename Seq>
Option<element_t<Seq>> maximum_maybe(const Seq& seq) {
    static_assert(Iterable<Seq>, "maximum_maybe requires an iterable type");
    static_assert(Ordered<element_t<Seq>>, "maximum_maybe requires operator<");
    return detail::select(seq, [](const auto& best, const auto& x) {
        return !(x < best);
    });
}

template<typename Seq>
Option<element_t<Seq>> minimum_maybe(const Seq& seq) {
    static_assert(Iterable<Seq>, "minimum_maybe requires an iterable type");
    static_assert(Ordered<element_t<Seq>>, "minimum_maybe requires operator<");
    return detail::select(seq, [](const auto& best, const auto& x) {
        return x < best;
    });
}

template<typename Seq, typename Compare>
Option<element_t<Seq>> maximum_by_maybe(const Seq& seq, Compare compare) {
    static_assert(Iterable<Seq>, "maximum_by_maybe requires an iterable type");
    static_assert(Comparator<Compare, element_t<Seq>>,
                  "maximum_by_maybe requires a comparator returning Ordering");
    return detail::select(seq, [&compare](const auto& best, const auto& x) {
        return compare(best, x) != Ordering::Greater;
    });
}

template<typename Seq, typename Compare>
Option<element_t<Seq>> minimum_by_maybe(const Seq& seq, Compare compare) {
    static_assert(Iterable<Seq>, "minimum_by_maybe requires an iterable type");
    static_assert(Comparator<Compare, element_t<Seq>>,
                  "minimum_by_maybe requires a comparator returning Ordering");
    return detail::select(seq, [&compare](const auto& best, const auto& x) {
        return compare(best, x) == Ordering::Greater;
    });
}

// ============================================================================
// Searching and indexing
// ============================================================================

template<typename Seq>
Option<element_t<Seq>> at_maybe(const Seq& seq, std::size_t index) {
    static_assert(Iterable<Seq>, "at_maybe requires an iterable type");
    auto it = std::begin(seq);
    const auto last = std::end(seq);
    while (it != last && index > 0) {
        ++it;
        --index;
    }
    if (it == last) {
        return None;
    }
    return Option<element_t<Seq>>(*it);
}

template<typename Seq, typename Pred>
Option<element_t<Seq>> find(const Seq& seq, Pred pred) {
    static_assert(Iterable<Seq>, "find requires an iterable type");
    static_assert(Predicate<Pred, element_t<Seq>>, "find requires a predicate");
    for (const auto& x : seq) {
        if (pred(x)) {
            return Option<element_t<Seq>>(x);
        }
    }
    return None;
}

template<typename Seq, typename Pred>
Option<std::size_t> find_index(const Seq& seq, Pred pred) {
    static_assert(Iterable<Seq>, "find_index requires an iterable type");
    static_assert(Predicate<Pred, element_t<Seq>>, "find_index requires a predicate");
    std::size_t index = 0;
    for (const auto& x : seq) {
        if (pred(x)) {
            return Option<std::size_t>(index);
        }
        ++index;
    }
    return None;
}

template<typename Seq>
Option<std::size_t> elem_index(const Seq& seq, const element_t<Seq>& value) {
    static_assert(EqualityComparable<element_t<Seq>>, "elem_index requires operator==");
    return find_index(seq, [&value](const element_t<Seq>& x) { return x == value; });
}

// First value associated with key in a sequence of pairs
template<typename Key, typename Assoc>
Option<typename element_t<Assoc>::second_type> lookup(const Key& key, const Assoc& assoc) {
    static_assert(Iterable<Assoc>, "lookup requires an iterable of pairs");
    using V = typename element_t<Assoc>::second_type;
    for (const auto& entry : assoc) {
        if (entry.first == key) {
            return Option<V>(entry.second);
        }
    }
    return None;
}

} // namespace safeseq

#endif // SAFESEQ_LIST_HPP
