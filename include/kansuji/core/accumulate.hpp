// include/kansuji/core/accumulate.hpp — Grammar validation and magnitude accumulation.

#pragma once

#include <span>

#include <kansuji/core/parsed_number.hpp>
#include <kansuji/core/tokenizer.hpp>

namespace kansuji::core {

    // Folds a token sequence into a parsed_number.
    //
    // Integer part: groups separated by large units (垓 京 兆 億 万) in strictly
    // decreasing order; within a group the units 千 百 十 strictly decrease and
    // may omit a leading 一. Fractional part: digit + small unit pairs (分 厘 毛)
    // in strictly decreasing order, each with an explicit digit. 零 is only
    // accepted as the entire integer part.
    //
    // Throws parse_error (empty_input, unit_out_of_order, duplicate_unit,
    // malformed_group). Group values are capped at 9999 and large exponents
    // strictly decrease, so a decoded total never exceeds 10^24 - 1; the
    // checked additions report overflow_error only if the unit set grows.
    parsed_number accumulate(std::span<const token> tokens);

} // namespace kansuji::core
