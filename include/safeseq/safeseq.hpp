#ifndef SAFESEQ_HPP
#define SAFESEQ_HPP

// safeseq - total sequence utilities for C++
//
// Standard containers already supply the bulk sequence operations through
// <algorithm> and <numeric>. This library adds the pieces that are partial
// there (front() of an empty vector, max_element of an empty range) or
// missing (suffix stripping, line splitting):
// - Explicit absence (Option) instead of undefined behaviour
// - Element access and extrema that are defined on empty input
// - Prefix/suffix stripping with an Option or fall-back result
// - Line splitting aware of CRLF endings

#include "safeseq/option.hpp"
#include "safeseq/ordering.hpp"
#include "safeseq/traits.hpp"
#include "safeseq/list.hpp"
#include "safeseq/affix.hpp"
#include "safeseq/text.hpp"

namespace safeseq {
    // Option of a sequence's element type
    template<typename Seq>
    using OptionElem = Option<element_t<Seq>>;
}

#endif // SAFESEQ_HPP
