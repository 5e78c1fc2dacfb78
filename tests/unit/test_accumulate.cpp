// tests/unit/test_accumulate.cpp — Grammar validation and magnitude accumulation.

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <kansuji/kansuji.hpp>
#include <kansuji/util/debug.hpp>

namespace {

using kansuji::error_kind;
using kansuji::uint128;
using kansuji::core::parsed_number;

constexpr uint128 power_of_ten(int exponent) {
    return kansuji::core::detail::POW10[static_cast<std::size_t>(exponent)];
}

parsed_number decode(std::string_view text) {
    const auto tokens = kansuji::core::tokenize(text);
    return kansuji::core::accumulate(tokens);
}

bool check_integer(std::string_view text, uint128 expected) {
    const auto parsed = decode(text);
    if (parsed.integer() != expected || parsed.thousandths() != 0) {
        std::cerr << "decode mismatch for " << text << ": expected "
                  << kansuji::to_decimal_string(expected) << ", got ";
        kansuji::util::dump(std::cerr, parsed) << '\n';
        return false;
    }
    return true;
}

bool expect_error(std::string_view text, error_kind kind, std::optional<std::size_t> position) {
    try {
        const auto parsed = decode(text);
        std::cerr << "accepted malformed numeral " << text << " as ";
        kansuji::util::dump(std::cerr, parsed) << '\n';
        return false;
    } catch (const kansuji::parse_error& error) {
        if (error.kind() != kind || error.position() != position) {
            std::cerr << "unexpected error for " << text << ": " << error.what() << '\n';
            return false;
        }
    }
    return true;
}

bool test_intra_group() {
    const std::vector<std::pair<std::string_view, uint128>> cases = {
        {"一", 1},          {"九", 9},          {"十", 10},         {"十一", 11},
        {"十五", 15},       {"二十", 20},       {"二十一", 21},     {"百", 100},
        {"二百", 200},      {"百三十一", 131},  {"千", 1000},       {"一千", 1000},
        {"一百一十一", 111}, {"千一", 1001},     {"九千九百九十九", 9999},
    };
    for (const auto& [text, expected] : cases) {
        if (!check_integer(text, expected)) {
            return false;
        }
    }
    return true;
}

bool test_large_units() {
    const std::vector<std::pair<std::string_view, uint128>> cases = {
        {"万", power_of_ten(4)},
        {"一万", power_of_ten(4)},
        {"百万一", power_of_ten(6) + 1},
        {"百二万一", 102 * power_of_ten(4) + 1},
        {"千万", power_of_ten(7)},
        {"一億", power_of_ten(8)},
        {"七十六億四千九百二十三万三千四百十一", 7649233411},
        {"百二十三兆五百四十万二", 123000005400002},
        {"二百五垓百万二十一", 205 * power_of_ten(20) + power_of_ten(6) + 21},
        {"一京", power_of_ten(16)},
        {"九千九百九十九垓九千九百九十九京九千九百九十九兆九千九百九十九億九千九百九十九万九千九"
         "百九十九",
         kansuji::max_integer},
    };
    for (const auto& [text, expected] : cases) {
        if (!check_integer(text, expected)) {
            return false;
        }
    }
    return true;
}

bool test_zero_symbol() {
    const auto zero = decode("零");
    if (!zero.is_zero()) {
        std::cerr << "零 must decode to zero\n";
        return false;
    }
    const auto half = decode("零五分");
    if (half.integer() != 0 || half.thousandths() != 500) {
        std::cerr << "零五分 must decode to 0.5\n";
        return false;
    }
    if (!expect_error("零一", error_kind::malformed_group, 0)) {
        return false;
    }
    if (!expect_error("十零", error_kind::malformed_group, 1)) {
        return false;
    }
    if (!expect_error("一分零厘", error_kind::malformed_group, 2)) {
        return false;
    }
    return true;
}

bool test_fraction() {
    const std::vector<std::pair<std::string_view, std::pair<uint128, std::uint32_t>>> cases = {
        {"一二分三厘四毛", {1, 234}},
        {"一二分三毛", {1, 203}},
        {"十二分", {10, 200}},
        {"五分", {0, 500}},
        {"一毛", {0, 1}},
        {"百万三厘", {power_of_ten(6), 30}},
    };
    for (const auto& [text, expected] : cases) {
        const auto parsed = decode(text);
        if (parsed.integer() != expected.first || parsed.thousandths() != expected.second) {
            std::cerr << "fraction decode mismatch for " << text << ": ";
            kansuji::util::dump(std::cerr, parsed) << '\n';
            return false;
        }
    }
    return true;
}

bool test_ordering_errors() {
    const std::vector<std::pair<std::string_view, std::pair<error_kind, std::size_t>>> cases = {
        {"一万二兆", {error_kind::unit_out_of_order, 3}},
        {"万兆", {error_kind::unit_out_of_order, 1}},
        {"一万二万", {error_kind::duplicate_unit, 3}},
        {"十百", {error_kind::unit_out_of_order, 1}},
        {"二十三十", {error_kind::duplicate_unit, 3}},
        {"千千", {error_kind::duplicate_unit, 1}},
        {"一毛二分", {error_kind::unit_out_of_order, 3}},
        {"一分二分", {error_kind::duplicate_unit, 3}},
        {"一分二", {error_kind::unit_out_of_order, 2}},
        {"一分万", {error_kind::unit_out_of_order, 2}},
        {"一分二十", {error_kind::unit_out_of_order, 2}},
    };
    for (const auto& [text, expected] : cases) {
        if (!expect_error(text, expected.first, expected.second)) {
            return false;
        }
    }
    return true;
}

bool test_malformed_groups() {
    const std::vector<std::pair<std::string_view, std::size_t>> cases = {
        {"一二", 1},
        {"三百二三", 3},
        {"分", 0},
        {"十分", 1},
        {"一万分", 2},
    };
    for (const auto& [text, position] : cases) {
        if (!expect_error(text, error_kind::malformed_group, position)) {
            return false;
        }
    }
    return true;
}

bool test_empty_tokens() {
    try {
        (void)kansuji::core::accumulate({});
    } catch (const kansuji::parse_error& error) {
        return error.kind() == error_kind::empty_input;
    }
    std::cerr << "empty token sequence accepted\n";
    return false;
}

bool test_checked_arithmetic() {
    using kansuji::core::detail::checked_add;
    using kansuji::core::detail::checked_mul;
    constexpr uint128 max = ~uint128{0};
    if (checked_add(max, 1) || checked_mul(max / 2 + 1, 2) ||
        checked_mul(power_of_ten(20), power_of_ten(19))) {
        std::cerr << "checked arithmetic failed to report overflow\n";
        return false;
    }
    if (checked_add(max - 1, 1) != max ||
        checked_mul(power_of_ten(12), power_of_ten(12)) != power_of_ten(24) ||
        checked_mul(0, max) != uint128{0}) {
        std::cerr << "checked arithmetic rejected representable results\n";
        return false;
    }
    try {
        (void)parsed_number::from_parts(kansuji::max_integer + 1, 0);
    } catch (const kansuji::overflow_error& error) {
        if (error.kind() != error_kind::overflow) {
            std::cerr << "wrong kind for overflow\n";
            return false;
        }
        return true;
    }
    std::cerr << "integer above the 垓 range accepted\n";
    return false;
}

} // namespace

int main() {
    if (!test_intra_group()) {
        return 1;
    }
    if (!test_large_units()) {
        return 1;
    }
    if (!test_zero_symbol()) {
        return 1;
    }
    if (!test_fraction()) {
        return 1;
    }
    if (!test_ordering_errors()) {
        return 1;
    }
    if (!test_malformed_groups()) {
        return 1;
    }
    if (!test_empty_tokens()) {
        return 1;
    }
    if (!test_checked_arithmetic()) {
        return 1;
    }
    std::cout << "accumulate passed\n";
    return 0;
}
