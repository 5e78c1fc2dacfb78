#pragma once

#include <string_view>
#include <vector>

#include <kansuji/core/accumulate.hpp>
#include <kansuji/core/parsed_number.hpp>
#include <kansuji/core/tokenizer.hpp>

namespace kansuji::io {

inline core::parsed_number from_string(std::string_view text) {
    const std::vector<core::token> tokens = core::tokenize(text);
    return core::accumulate(tokens);
}

} // namespace kansuji::io
