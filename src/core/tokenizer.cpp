#include "kansuji/core/tokenizer.hpp"

namespace kansuji::core {

namespace detail {

    decoded_code_point decode_utf8(std::string_view text, std::size_t offset) noexcept {
        const auto lead = static_cast<unsigned char>(text[offset]);
        std::size_t length = 0;
        char32_t code = 0;
        char32_t minimum = 0;
        if (lead < 0x80) {
            return {lead, 1};
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code = lead & 0x07;
            minimum = 0x10000;
        } else {
            return {0, 0};
        }
        if (offset + length > text.size()) {
            return {0, 0};
        }
        for (std::size_t index = 1; index < length; ++index) {
            const auto continuation = static_cast<unsigned char>(text[offset + index]);
            if ((continuation & 0xC0) != 0x80) {
                return {0, 0};
            }
            code = (code << 6) | (continuation & 0x3F);
        }
        if (code < minimum || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return {0, 0};
        }
        return {code, length};
    }

} // namespace detail

    std::vector<token> tokenize(std::string_view text) {
        if (text.empty()) {
            throw parse_error(error_kind::empty_input);
        }
        std::vector<token> tokens;
        // Kansuji characters are three UTF-8 bytes each.
        tokens.reserve(text.size() / 3 + 1);
        std::size_t offset = 0;
        std::size_t position = 0;
        while (offset < text.size()) {
            const auto decoded = detail::decode_utf8(text, offset);
            if (decoded.length == 0) {
                throw parse_error(error_kind::invalid_character, position, "malformed UTF-8");
            }
            const symbol sym = classify(decoded.code);
            if (sym.kind == symbol_kind::invalid) {
                throw parse_error(error_kind::invalid_character, position,
                                  text.substr(offset, decoded.length));
            }
            tokens.push_back({sym, position});
            offset += decoded.length;
            ++position;
        }
        return tokens;
    }

} // namespace kansuji::core
