// include/kansuji/kansuji.hpp — Umbrella header that exposes the kansuji value type.

#pragma once

// Umbrella header for kansujilib.
// Users should generally include only this file.

#include <kansuji/core/accumulate.hpp>
#include <kansuji/core/error.hpp>
#include <kansuji/core/parsed_number.hpp>
#include <kansuji/core/symbols.hpp>
#include <kansuji/core/tokenizer.hpp>
#include <kansuji/core/uint128.hpp>
#include <kansuji/io/format.hpp>
#include <kansuji/io/parse.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace kansuji {

    // Immutable numeral value covering 垓 (10^20) down to 毛 (10^-3).
    class Kansuji {
      public:
        Kansuji() noexcept = default;
        explicit Kansuji(core::parsed_number value) noexcept : value_(value) {}

        static Kansuji zero() noexcept { return {}; }

        // Throws parse_error, or overflow_error when the magnitude cannot be held.
        static Kansuji from_string(std::string_view text) {
            return Kansuji(io::from_string(text));
        }

        // Not total over uint128: throws overflow_error above max_integer rather
        // than dropping the digits beyond the 垓 group.
        static Kansuji from_u128(uint128 value) {
            return Kansuji(core::parsed_number::from_u128(value));
        }

        template <typename Unsigned>
        static Kansuji from_integer(Unsigned value) {
            return Kansuji(core::parsed_number::from_integer(value));
        }

        // Throws range_error for negative, non-finite or too large values. The
        // fraction is rounded to the nearest 毛 (0.001).
        static Kansuji from_double(double value) {
            return Kansuji(core::parsed_number::from_double(value));
        }

        static Kansuji from_float(float value) {
            return Kansuji(core::parsed_number::from_float(value));
        }

        // Throws conversion_error when a fractional part is present.
        uint128 to_u128() const { return value_.to_u128(); }

        template <typename Unsigned>
        Unsigned to_integer() const {
            return value_.to_integer<Unsigned>();
        }

        double to_double() const noexcept { return value_.to_double(); }
        float to_float() const noexcept { return value_.to_float(); }

        explicit operator double() const noexcept { return to_double(); }
        explicit operator float() const noexcept { return to_float(); }

        std::string to_string() const { return io::to_string(value_); }

        uint128 integer() const noexcept { return value_.integer(); }
        double fraction() const noexcept { return value_.fraction(); }
        bool is_zero() const noexcept { return value_.is_zero(); }
        bool is_integer() const noexcept { return value_.is_integer(); }

        std::uint32_t group(large_unit unit) const noexcept { return value_.group(unit); }
        int fraction_digit(small_unit unit) const noexcept { return value_.fraction_digit(unit); }

        const core::parsed_number &parsed() const noexcept { return value_; }

        bool operator==(const Kansuji &) const noexcept = default;
        std::strong_ordering operator<=>(const Kansuji &other) const noexcept {
            return value_ <=> other.value_;
        }

      private:
        core::parsed_number value_;
    };

    inline std::string to_string(const Kansuji &value) { return value.to_string(); }

    inline std::ostream &operator<<(std::ostream &os, const Kansuji &value) {
        return os << value.to_string();
    }

    namespace literals {

        inline Kansuji operator""_kansuji(const char *literal, std::size_t length) {
            return Kansuji::from_string(std::string_view(literal, length));
        }

        inline Kansuji operator""_kansuji(unsigned long long value) {
            return Kansuji::from_integer(value);
        }

    } // namespace literals

} // namespace kansuji

namespace std {

template <>
struct hash<kansuji::Kansuji> {
    std::size_t operator()(const kansuji::Kansuji &value) const noexcept {
        const kansuji::uint128 integer = value.integer();
        const auto low = static_cast<std::uint64_t>(integer);
        const auto high = static_cast<std::uint64_t>(integer >> 64);
        std::uint64_t mixed = low ^ (high * 0x9E3779B97F4A7C15ULL);
        mixed ^= static_cast<std::uint64_t>(value.parsed().thousandths()) + 0x9E3779B97F4A7C15ULL +
                 (mixed << 6) + (mixed >> 2);
        return static_cast<std::size_t>(mixed);
    }
};

} // namespace std
