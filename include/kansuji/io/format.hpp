// include/kansuji/io/format.hpp — Declarations for rendering canonical kansuji text.

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include <kansuji/core/parsed_number.hpp>

namespace kansuji::io {

    // Appends the 千百十 rendering of a 1..9999 group value. A digit of 一 is
    // elided before 千, 百 and 十 but kept in the ones place.
    void append_group(std::string &out, std::uint32_t value);

    // Canonical minimal UTF-8 text: 零 for a zero integer part, zero groups
    // and zero fractional digits omitted, no separators.
    std::string to_string(const core::parsed_number &value);

    inline std::ostream &operator<<(std::ostream &os, const core::parsed_number &value) {
        return os << to_string(value);
    }

} // namespace kansuji::io
