#pragma once

#include <ostream>

#include <kansuji/core/tokenizer.hpp>
#include <kansuji/core/uint128.hpp>
#include <kansuji/io/format.hpp>
#include <kansuji/kansuji.hpp>

namespace kansuji::util {

inline const char* symbol_kind_name(core::symbol_kind kind) noexcept {
    switch (kind) {
    case core::symbol_kind::zero:
        return "zero";
    case core::symbol_kind::digit:
        return "digit";
    case core::symbol_kind::intra_unit:
        return "intra_unit";
    case core::symbol_kind::large_unit:
        return "large_unit";
    case core::symbol_kind::small_unit:
        return "small_unit";
    case core::symbol_kind::invalid:
        break;
    }
    return "invalid";
}

inline std::ostream& dump(std::ostream& os, const core::token& value) {
    os << "token(" << symbol_kind_name(value.sym.kind) << '@' << value.position;
    if (value.sym.kind == core::symbol_kind::digit) {
        os << ", digit=" << static_cast<int>(value.sym.digit);
    } else if (value.sym.kind != core::symbol_kind::zero) {
        os << ", exponent=" << value.sym.exponent;
    }
    return os << ')';
}

inline std::ostream& dump(std::ostream& os, const core::parsed_number& value) {
    return os << "parsed_number(" << to_decimal_string(value.integer()) << " + "
              << value.thousandths() << "/1000)";
}

inline std::ostream& dump(std::ostream& os, const Kansuji& value) {
    os << "Kansuji(" << value.to_string() << ", ";
    return dump(os, value.parsed()) << ')';
}

} // namespace kansuji::util
