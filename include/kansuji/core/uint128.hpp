// include/kansuji/core/uint128.hpp — 128-bit magnitude type and checked arithmetic.

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

namespace kansuji {

#if !defined(__SIZEOF_INT128__)
#error "kansuji requires unsigned __int128 support"
#endif

using uint128 = unsigned __int128;

namespace core::detail {

    inline constexpr uint128 UINT128_MAX_VALUE = ~uint128{0};

    inline constexpr std::array<uint128, 25> build_pow10() {
        std::array<uint128, 25> powers{};
        uint128 value{1};
        for (std::size_t index = 0; index < powers.size(); ++index) {
            powers[index] = value;
            value *= 10;
        }
        return powers;
    }

    inline constexpr auto POW10 = build_pow10();

    // std::is_integral<unsigned __int128> is false under -std=c++20 (strict ANSI).
    template <typename T>
    inline constexpr bool is_unsigned_integer_v =
        std::is_same_v<std::remove_cv_t<T>, uint128> ||
        (std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<std::remove_cv_t<T>, bool>);

    template <typename T>
    inline constexpr uint128 max_of() noexcept {
        if constexpr (std::is_same_v<std::remove_cv_t<T>, uint128>) {
            return UINT128_MAX_VALUE;
        } else {
            return static_cast<uint128>(static_cast<T>(~T{0}));
        }
    }

    inline constexpr std::optional<uint128> checked_add(uint128 lhs, uint128 rhs) noexcept {
        if (lhs > UINT128_MAX_VALUE - rhs) {
            return std::nullopt;
        }
        return lhs + rhs;
    }

    inline constexpr std::optional<uint128> checked_mul(uint128 lhs, uint128 rhs) noexcept {
        if (lhs != 0 && rhs > UINT128_MAX_VALUE / lhs) {
            return std::nullopt;
        }
        return lhs * rhs;
    }

} // namespace core::detail

inline constexpr uint128 max_integer = core::detail::POW10[24] - 1;
inline constexpr std::uint32_t fraction_scale = 1000;

inline std::string to_decimal_string(uint128 value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

} // namespace kansuji
