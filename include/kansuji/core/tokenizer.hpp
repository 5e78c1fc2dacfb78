// include/kansuji/core/tokenizer.hpp — Classifies UTF-8 numeral text into tokens.

#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <kansuji/core/error.hpp>
#include <kansuji/core/symbols.hpp>

namespace kansuji::core {

    struct token {
        symbol sym;
        // Code point index into the source text.
        std::size_t position = 0;

        constexpr bool operator==(const token &) const noexcept = default;
    };

namespace detail {

    struct decoded_code_point {
        char32_t code;
        std::size_t length;
    };

    // Returns length 0 for a malformed or truncated sequence.
    decoded_code_point decode_utf8(std::string_view text, std::size_t offset) noexcept;

} // namespace detail

    // Throws parse_error (empty_input, invalid_character).
    std::vector<token> tokenize(std::string_view text);

} // namespace kansuji::core
