#include <cstddef>

#include "kansuji/core/symbols.hpp"
#include "kansuji/io/format.hpp"

namespace kansuji::io {

    void append_group(std::string &out, std::uint32_t value) {
        for (int exponent = 3; exponent >= 1; --exponent) {
            const auto scale = static_cast<std::uint32_t>(core::detail::POW10[exponent]);
            const std::uint32_t digit = (value / scale) % 10;
            if (digit == 0) {
                continue;
            }
            if (digit != 1) {
                out.append(core::digit_text(static_cast<int>(digit)));
            }
            out.append(core::intra_unit_text(exponent));
        }
        const std::uint32_t ones = value % 10;
        if (ones != 0) {
            out.append(core::digit_text(static_cast<int>(ones)));
        }
    }

    std::string to_string(const core::parsed_number &value) {
        std::string out;
        // Every character is three UTF-8 bytes; 53 characters is the longest form.
        out.reserve(53 * 3);
        if (value.integer() == 0) {
            out.append(core::digit_text(0));
        } else {
            for (const large_unit unit : LARGE_UNITS) {
                const std::uint32_t group = value.group(unit);
                if (group == 0) {
                    continue;
                }
                append_group(out, group);
                out.append(core::large_unit_text(unit));
            }
        }
        for (const small_unit unit : SMALL_UNITS) {
            const int digit = value.fraction_digit(unit);
            if (digit == 0) {
                continue;
            }
            out.append(core::digit_text(digit));
            out.append(core::small_unit_text(unit));
        }
        return out;
    }

} // namespace kansuji::io
