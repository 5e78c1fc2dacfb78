// include/kansuji/core/error.hpp — Exception types raised by decoding and conversions.

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kansuji {

    enum class error_kind {
        empty_input,
        invalid_character,
        unit_out_of_order,
        duplicate_unit,
        malformed_group,
        overflow,
        out_of_range,
        non_integer_conversion,
    };

    constexpr std::string_view to_string(error_kind kind) noexcept {
        switch (kind) {
        case error_kind::empty_input:
            return "empty input";
        case error_kind::invalid_character:
            return "invalid character";
        case error_kind::unit_out_of_order:
            return "unit out of order";
        case error_kind::duplicate_unit:
            return "duplicate unit";
        case error_kind::malformed_group:
            return "malformed group";
        case error_kind::overflow:
            return "overflow";
        case error_kind::out_of_range:
            return "out of range";
        case error_kind::non_integer_conversion:
            return "non-integer conversion";
        }
        return "unknown error";
    }

namespace detail {

    inline std::string error_message(error_kind kind, std::optional<std::size_t> position,
                                     std::string_view context) {
        std::string message("kansuji: ");
        message.append(to_string(kind));
        if (position) {
            message.append(" at position ");
            message.append(std::to_string(*position));
        }
        if (!context.empty()) {
            message.append(": ");
            message.append(context);
        }
        return message;
    }

} // namespace detail

    // Carries the error kind and, for text errors, the code point position.
    template <typename Base> class basic_error : public Base {
      public:
        basic_error(error_kind kind, std::optional<std::size_t> position,
                    std::string_view context = {})
            : Base(detail::error_message(kind, position, context)), kind_(kind),
              position_(position) {}

        explicit basic_error(error_kind kind, std::string_view context = {})
            : basic_error(kind, std::nullopt, context) {}

        error_kind kind() const noexcept { return kind_; }
        std::optional<std::size_t> position() const noexcept { return position_; }

      private:
        error_kind kind_;
        std::optional<std::size_t> position_;
    };

    using parse_error = basic_error<std::invalid_argument>;
    using overflow_error = basic_error<std::overflow_error>;
    using range_error = basic_error<std::out_of_range>;
    using conversion_error = basic_error<std::domain_error>;

} // namespace kansuji
