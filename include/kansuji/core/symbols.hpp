// include/kansuji/core/symbols.hpp — Numeral character table and unit metadata.

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <kansuji/core/uint128.hpp>

namespace kansuji {

    // Enumerator values are the base-10 exponents of each unit.
    enum class large_unit : int { one = 0, man = 4, oku = 8, cho = 12, kei = 16, gai = 20 };
    enum class small_unit : int { bu = -1, rin = -2, mo = -3 };

    inline constexpr std::array<large_unit, 6> LARGE_UNITS = {
        large_unit::gai, large_unit::kei, large_unit::cho,
        large_unit::oku, large_unit::man, large_unit::one};
    inline constexpr std::array<small_unit, 3> SMALL_UNITS = {small_unit::bu, small_unit::rin,
                                                              small_unit::mo};

    constexpr int exponent_of(large_unit unit) noexcept { return static_cast<int>(unit); }
    constexpr int exponent_of(small_unit unit) noexcept { return static_cast<int>(unit); }

namespace core {

    enum class symbol_kind : std::uint8_t { invalid, zero, digit, intra_unit, large_unit, small_unit };

    struct symbol {
        symbol_kind kind = symbol_kind::invalid;
        std::uint8_t digit = 0;
        int exponent = 0;

        constexpr bool operator==(const symbol &) const noexcept = default;
    };

namespace detail {

    struct symbol_entry {
        char32_t code;
        symbol value;
    };

    constexpr symbol make_digit(std::uint8_t digit) noexcept {
        return {symbol_kind::digit, digit, 0};
    }
    constexpr symbol make_unit(symbol_kind kind, int exponent) noexcept {
        return {kind, 0, exponent};
    }

    // Sorted by code point for binary search.
    inline constexpr std::array<symbol_entry, 21> SYMBOL_TABLE = {{
        {U'一', make_digit(1)},
        {U'七', make_digit(7)},
        {U'万', make_unit(symbol_kind::large_unit, 4)},
        {U'三', make_digit(3)},
        {U'九', make_digit(9)},
        {U'二', make_digit(2)},
        {U'五', make_digit(5)},
        {U'京', make_unit(symbol_kind::large_unit, 16)},
        {U'億', make_unit(symbol_kind::large_unit, 8)},
        {U'兆', make_unit(symbol_kind::large_unit, 12)},
        {U'八', make_digit(8)},
        {U'六', make_digit(6)},
        {U'分', make_unit(symbol_kind::small_unit, -1)},
        {U'十', make_unit(symbol_kind::intra_unit, 1)},
        {U'千', make_unit(symbol_kind::intra_unit, 3)},
        {U'厘', make_unit(symbol_kind::small_unit, -2)},
        {U'四', make_digit(4)},
        {U'垓', make_unit(symbol_kind::large_unit, 20)},
        {U'毛', make_unit(symbol_kind::small_unit, -3)},
        {U'百', make_unit(symbol_kind::intra_unit, 2)},
        {U'零', {symbol_kind::zero, 0, 0}},
    }};

    constexpr bool symbol_table_sorted() noexcept {
        for (std::size_t index = 1; index < SYMBOL_TABLE.size(); ++index) {
            if (!(SYMBOL_TABLE[index - 1].code < SYMBOL_TABLE[index].code)) {
                return false;
            }
        }
        return true;
    }
    static_assert(symbol_table_sorted(), "SYMBOL_TABLE must be sorted by code point");

    inline constexpr std::array<std::string_view, 10> DIGIT_TEXT = {
        "零", "一", "二", "三", "四", "五", "六", "七", "八", "九"};
    // Indexed by exponent; slot 0 is the implicit ones place.
    inline constexpr std::array<std::string_view, 4> INTRA_UNIT_TEXT = {"", "十", "百", "千"};
    // Indexed by exponent / 4.
    inline constexpr std::array<std::string_view, 6> LARGE_UNIT_TEXT = {"",   "万", "億",
                                                                        "兆", "京", "垓"};
    // Indexed by -exponent.
    inline constexpr std::array<std::string_view, 4> SMALL_UNIT_TEXT = {"", "分", "厘", "毛"};

    // 10^(4k) for k = 0..5.
    inline constexpr std::array<uint128, 6> GROUP_SCALE = {POW10[0],  POW10[4],  POW10[8],
                                                           POW10[12], POW10[16], POW10[20]};
    inline constexpr std::uint32_t GROUP_RADIX = 10000;

} // namespace detail

    constexpr symbol classify(char32_t code) noexcept {
        const auto first = detail::SYMBOL_TABLE.begin();
        const auto last = detail::SYMBOL_TABLE.end();
        const auto it = std::lower_bound(
            first, last, code,
            [](const detail::symbol_entry &entry, char32_t key) { return entry.code < key; });
        if (it == last || it->code != code) {
            return {};
        }
        return it->value;
    }

    inline std::string_view digit_text(int digit) noexcept {
        return detail::DIGIT_TEXT[static_cast<std::size_t>(digit)];
    }

    inline std::string_view intra_unit_text(int exponent) noexcept {
        return detail::INTRA_UNIT_TEXT[static_cast<std::size_t>(exponent)];
    }

    inline std::string_view large_unit_text(large_unit unit) noexcept {
        return detail::LARGE_UNIT_TEXT[static_cast<std::size_t>(exponent_of(unit) / 4)];
    }

    inline std::string_view small_unit_text(small_unit unit) noexcept {
        return detail::SMALL_UNIT_TEXT[static_cast<std::size_t>(-exponent_of(unit))];
    }

} // namespace core

} // namespace kansuji
