#include <cstddef>
#include <cstdint>
#include <optional>

#include "kansuji/core/accumulate.hpp"

namespace kansuji::core {

namespace {

    // Sentinels one step above the highest exponent of each level.
    constexpr int LARGE_EXPONENT_CEILING = 24;
    constexpr int INTRA_EXPONENT_CEILING = 4;
    constexpr int SMALL_EXPONENT_CEILING = 0;

    [[noreturn]] void throw_order_error(int previous, int current, std::size_t position) {
        throw parse_error(previous == current ? error_kind::duplicate_unit
                                              : error_kind::unit_out_of_order,
                          position);
    }

    bool is_kind(const token &tok, symbol_kind kind) noexcept { return tok.sym.kind == kind; }

    class integer_accumulator {
      public:
        void push(const token &tok) {
            switch (tok.sym.kind) {
            case symbol_kind::digit:
                push_digit(tok);
                break;
            case symbol_kind::intra_unit:
                push_intra_unit(tok);
                break;
            case symbol_kind::large_unit:
                push_large_unit(tok);
                break;
            default:
                throw parse_error(error_kind::malformed_group, tok.position,
                                  "零 must stand alone as the integer part");
            }
        }

        uint128 finish() {
            close_group(0, std::nullopt, false);
            return total_;
        }

      private:
        void push_digit(const token &tok) {
            if (pending_digit_) {
                throw parse_error(error_kind::malformed_group, tok.position,
                                  "consecutive digits without a unit");
            }
            pending_digit_ = tok.sym.digit;
        }

        void push_intra_unit(const token &tok) {
            const int exponent = tok.sym.exponent;
            if (exponent >= last_intra_) {
                throw_order_error(last_intra_, exponent, tok.position);
            }
            const std::uint32_t digit = pending_digit_.value_or(1);
            group_value_ += digit * static_cast<std::uint32_t>(detail::POW10[exponent]);
            group_has_content_ = true;
            pending_digit_.reset();
            last_intra_ = exponent;
        }

        void push_large_unit(const token &tok) {
            const int exponent = tok.sym.exponent;
            if (exponent >= last_large_) {
                throw_order_error(last_large_, exponent, tok.position);
            }
            close_group(exponent, tok.position, true);
            last_large_ = exponent;
        }

        // An empty group before a large unit stands for 一 (万 == 一万).
        void close_group(int exponent, std::optional<std::size_t> position, bool implicit_one) {
            if (pending_digit_) {
                group_value_ += *pending_digit_;
                group_has_content_ = true;
            }
            if (!group_has_content_) {
                if (!implicit_one) {
                    return;
                }
                group_value_ = 1;
            }
            const auto scaled = detail::checked_mul(
                group_value_, detail::GROUP_SCALE[static_cast<std::size_t>(exponent / 4)]);
            const auto sum = scaled ? detail::checked_add(total_, *scaled) : std::nullopt;
            if (!sum) {
                throw overflow_error(error_kind::overflow, position,
                                     "magnitude exceeds 128 bits");
            }
            total_ = *sum;
            group_value_ = 0;
            group_has_content_ = false;
            pending_digit_.reset();
            last_intra_ = INTRA_EXPONENT_CEILING;
        }

        uint128 total_ = 0;
        std::uint32_t group_value_ = 0;
        bool group_has_content_ = false;
        std::optional<std::uint8_t> pending_digit_;
        int last_large_ = LARGE_EXPONENT_CEILING;
        int last_intra_ = INTRA_EXPONENT_CEILING;
    };

    std::uint32_t accumulate_fraction(std::span<const token> tokens) {
        std::uint32_t thousandths = 0;
        int last_small = SMALL_EXPONENT_CEILING;
        std::size_t index = 0;
        while (index < tokens.size()) {
            const token &tok = tokens[index];
            if (is_kind(tok, symbol_kind::small_unit)) {
                throw parse_error(error_kind::malformed_group, tok.position,
                                  "fractional unit requires an explicit digit");
            }
            if (is_kind(tok, symbol_kind::zero)) {
                throw parse_error(error_kind::malformed_group, tok.position,
                                  "零 must stand alone as the integer part");
            }
            if (!is_kind(tok, symbol_kind::digit) || index + 1 == tokens.size() ||
                !is_kind(tokens[index + 1], symbol_kind::small_unit)) {
                throw parse_error(error_kind::unit_out_of_order, tok.position,
                                  "integer part must precede the fractional part");
            }
            const token &unit = tokens[index + 1];
            if (unit.sym.exponent >= last_small) {
                throw_order_error(last_small, unit.sym.exponent, unit.position);
            }
            thousandths += static_cast<std::uint32_t>(tok.sym.digit) *
                           static_cast<std::uint32_t>(detail::POW10[3 + unit.sym.exponent]);
            last_small = unit.sym.exponent;
            index += 2;
        }
        return thousandths;
    }

} // namespace

    parsed_number accumulate(std::span<const token> tokens) {
        if (tokens.empty()) {
            throw parse_error(error_kind::empty_input);
        }

        std::size_t fraction_begin = tokens.size();
        for (std::size_t index = 0; index < tokens.size(); ++index) {
            if (is_kind(tokens[index], symbol_kind::small_unit)) {
                if (index == 0 || !is_kind(tokens[index - 1], symbol_kind::digit)) {
                    throw parse_error(error_kind::malformed_group, tokens[index].position,
                                      "fractional unit requires an explicit digit");
                }
                fraction_begin = index - 1;
                break;
            }
        }

        const auto integer_tokens = tokens.first(fraction_begin);
        const auto fraction_tokens = tokens.subspan(fraction_begin);

        uint128 integer = 0;
        const bool lone_zero =
            integer_tokens.size() == 1 && is_kind(integer_tokens.front(), symbol_kind::zero);
        if (!lone_zero) {
            integer_accumulator accumulator;
            for (const token &tok : integer_tokens) {
                accumulator.push(tok);
            }
            integer = accumulator.finish();
        }

        return parsed_number::from_parts(integer, accumulate_fraction(fraction_tokens));
    }

} // namespace kansuji::core
