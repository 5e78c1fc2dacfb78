// include/kansuji/core/parsed_number.hpp — Decoded magnitude and its numeric conversions.

#pragma once

#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <type_traits>

#include <kansuji/core/error.hpp>
#include <kansuji/core/symbols.hpp>
#include <kansuji/core/uint128.hpp>

namespace kansuji::core {

    // Integer part in [0, max_integer]; fraction held exactly as thousandths.
    class parsed_number {
      public:
        constexpr parsed_number() noexcept = default;

        static constexpr parsed_number zero() noexcept { return {}; }

        static parsed_number from_parts(uint128 integer, std::uint32_t thousandths) {
            if (integer > max_integer) {
                throw overflow_error(error_kind::overflow,
                                     "integer part exceeds the 垓 unit range");
            }
            if (thousandths >= fraction_scale) {
                throw std::logic_error("fractional thousandths must be below 1000");
            }
            return parsed_number(integer, thousandths);
        }

        static parsed_number from_u128(uint128 value) { return from_parts(value, 0); }

        template <typename Unsigned>
        static parsed_number from_integer(Unsigned value) {
            static_assert(detail::is_unsigned_integer_v<Unsigned>,
                          "from_integer supports unsigned integer types");
            return from_u128(static_cast<uint128>(value));
        }

        static parsed_number from_double(double value) {
            if (!std::isfinite(value)) {
                throw range_error(error_kind::out_of_range, "value must be finite");
            }
            if (value < 0.0) {
                throw range_error(error_kind::out_of_range, "value must not be negative");
            }
            const double whole = std::floor(value);
            // max_integer rounds down to 999999999999999983222784, the largest double
            // that still fits; the next double up is past the 垓 group.
            if (!(whole <= static_cast<double>(max_integer))) {
                throw range_error(error_kind::out_of_range, "integer part exceeds the 垓 unit range");
            }
            uint128 integer = static_cast<uint128>(whole);
            auto thousandths = static_cast<std::uint32_t>(
                std::llround((value - whole) * static_cast<double>(fraction_scale)));
            if (thousandths == fraction_scale) {
                ++integer;
                thousandths = 0;
            }
            return parsed_number(integer, thousandths);
        }

        static parsed_number from_float(float value) {
            return from_double(static_cast<double>(value));
        }

        constexpr uint128 integer() const noexcept { return integer_; }
        constexpr std::uint32_t thousandths() const noexcept { return thousandths_; }
        constexpr double fraction() const noexcept {
            return static_cast<double>(thousandths_) / static_cast<double>(fraction_scale);
        }
        constexpr bool is_zero() const noexcept { return integer_ == 0 && thousandths_ == 0; }
        constexpr bool is_integer() const noexcept { return thousandths_ == 0; }

        uint128 to_u128() const {
            if (!is_integer()) {
                throw conversion_error(error_kind::non_integer_conversion,
                                       "value has a nonzero fractional part");
            }
            return integer_;
        }

        template <typename Unsigned>
        Unsigned to_integer() const {
            static_assert(detail::is_unsigned_integer_v<Unsigned>,
                          "to_integer supports unsigned integer types");
            const uint128 value = to_u128();
            if (value > detail::max_of<Unsigned>()) {
                throw overflow_error(error_kind::overflow, "value does not fit in target integer");
            }
            return static_cast<Unsigned>(value);
        }

        constexpr double to_double() const noexcept {
            return static_cast<double>(integer_) + fraction();
        }

        constexpr float to_float() const noexcept { return static_cast<float>(to_double()); }

        // Value 0..9999 of the 10^4 group the unit names.
        constexpr std::uint32_t group(large_unit unit) const noexcept {
            const auto scale = detail::GROUP_SCALE[static_cast<std::size_t>(exponent_of(unit) / 4)];
            return static_cast<std::uint32_t>((integer_ / scale) % detail::GROUP_RADIX);
        }

        constexpr int fraction_digit(small_unit unit) const noexcept {
            const auto divisor = detail::POW10[static_cast<std::size_t>(3 + exponent_of(unit))];
            return static_cast<int>((thousandths_ / static_cast<std::uint32_t>(divisor)) % 10);
        }

        constexpr bool operator==(const parsed_number &) const noexcept = default;

        constexpr std::strong_ordering operator<=>(const parsed_number &other) const noexcept {
            if (integer_ != other.integer_) {
                return integer_ < other.integer_ ? std::strong_ordering::less
                                                 : std::strong_ordering::greater;
            }
            return thousandths_ <=> other.thousandths_;
        }

      private:
        constexpr parsed_number(uint128 integer, std::uint32_t thousandths) noexcept
            : integer_(integer), thousandths_(thousandths) {}

        uint128 integer_ = 0;
        std::uint32_t thousandths_ = 0;
    };

} // namespace kansuji::core
