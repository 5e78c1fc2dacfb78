// tests/unit/test_symbols_tokenizer.cpp — Character classification and tokenization.

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <kansuji/kansuji.hpp>
#include <kansuji/util/debug.hpp>

namespace {

using kansuji::core::classify;
using kansuji::core::symbol_kind;

bool test_classify_digits() {
    const std::u32string digits = U"一二三四五六七八九";
    for (std::size_t index = 0; index < digits.size(); ++index) {
        const auto sym = classify(digits[index]);
        if (sym.kind != symbol_kind::digit || sym.digit != index + 1) {
            std::cerr << "digit classification failed at index " << index << '\n';
            return false;
        }
    }
    if (classify(U'零').kind != symbol_kind::zero) {
        std::cerr << "零 must classify as the zero symbol\n";
        return false;
    }
    return true;
}

bool test_classify_units() {
    const std::vector<std::pair<char32_t, std::pair<symbol_kind, int>>> cases = {
        {U'十', {symbol_kind::intra_unit, 1}},  {U'百', {symbol_kind::intra_unit, 2}},
        {U'千', {symbol_kind::intra_unit, 3}},  {U'万', {symbol_kind::large_unit, 4}},
        {U'億', {symbol_kind::large_unit, 8}},  {U'兆', {symbol_kind::large_unit, 12}},
        {U'京', {symbol_kind::large_unit, 16}}, {U'垓', {symbol_kind::large_unit, 20}},
        {U'分', {symbol_kind::small_unit, -1}}, {U'厘', {symbol_kind::small_unit, -2}},
        {U'毛', {symbol_kind::small_unit, -3}},
    };
    for (const auto& [code, expected] : cases) {
        const auto sym = classify(code);
        if (sym.kind != expected.first || sym.exponent != expected.second) {
            std::cerr << "unit classification failed for exponent " << expected.second << '\n';
            return false;
        }
    }
    for (char32_t code : {U'a', U'0', U'〇', U'壱', U'萬', U'円', U'\0'}) {
        if (classify(code).kind != symbol_kind::invalid) {
            std::cerr << "unexpected symbol accepted: U+" << std::hex
                      << static_cast<unsigned>(code) << std::dec << '\n';
            return false;
        }
    }
    return true;
}

bool test_reverse_tables() {
    if (kansuji::core::digit_text(7) != "七" || kansuji::core::intra_unit_text(2) != "百" ||
        kansuji::core::large_unit_text(kansuji::large_unit::cho) != "兆" ||
        kansuji::core::small_unit_text(kansuji::small_unit::rin) != "厘") {
        std::cerr << "reverse lookup tables mismatch\n";
        return false;
    }
    return true;
}

bool test_tokenize_positions() {
    const auto tokens = kansuji::core::tokenize("百二十三兆");
    if (tokens.size() != 5) {
        std::cerr << "expected five tokens, got " << tokens.size() << '\n';
        return false;
    }
    for (std::size_t index = 0; index < tokens.size(); ++index) {
        if (tokens[index].position != index) {
            std::cerr << "token position mismatch: ";
            kansuji::util::dump(std::cerr, tokens[index]) << '\n';
            return false;
        }
    }
    if (tokens[1].sym.kind != symbol_kind::digit || tokens[1].sym.digit != 2 ||
        tokens[4].sym.kind != symbol_kind::large_unit || tokens[4].sym.exponent != 12) {
        std::cerr << "token classification mismatch\n";
        return false;
    }
    return true;
}

bool expect_tokenize_error(std::string_view text, kansuji::error_kind kind,
                           std::optional<std::size_t> position) {
    try {
        (void)kansuji::core::tokenize(text);
    } catch (const kansuji::parse_error& error) {
        if (error.kind() != kind || error.position() != position) {
            std::cerr << "unexpected tokenizer error: " << error.what() << '\n';
            return false;
        }
        return true;
    }
    std::cerr << "tokenizer accepted invalid input\n";
    return false;
}

bool test_tokenize_errors() {
    using kansuji::error_kind;
    if (!expect_tokenize_error("", error_kind::empty_input, std::nullopt)) {
        return false;
    }
    if (!expect_tokenize_error("二百五垓ほ百万二十一", error_kind::invalid_character, 4)) {
        return false;
    }
    if (!expect_tokenize_error("百に万一", error_kind::invalid_character, 1)) {
        return false;
    }
    if (!expect_tokenize_error("123", error_kind::invalid_character, 0)) {
        return false;
    }
    // Truncated three-byte sequence for 万.
    if (!expect_tokenize_error(std::string_view("一\xe4\xb8", 5), error_kind::invalid_character,
                               1)) {
        return false;
    }
    // Overlong encoding of '/'.
    if (!expect_tokenize_error(std::string_view("\xc0\xaf", 2), error_kind::invalid_character,
                               0)) {
        return false;
    }
    return true;
}

bool test_error_message() {
    try {
        (void)kansuji::core::tokenize("一x");
    } catch (const std::invalid_argument& error) {
        const std::string message = error.what();
        if (message.find("invalid character at position 1") == std::string::npos) {
            std::cerr << "error message lacks position: " << message << '\n';
            return false;
        }
        return true;
    }
    std::cerr << "parse_error must derive from std::invalid_argument\n";
    return false;
}

} // namespace

int main() {
    if (!test_classify_digits()) {
        return 1;
    }
    if (!test_classify_units()) {
        return 1;
    }
    if (!test_reverse_tables()) {
        return 1;
    }
    if (!test_tokenize_positions()) {
        return 1;
    }
    if (!test_tokenize_errors()) {
        return 1;
    }
    if (!test_error_message()) {
        return 1;
    }
    std::cout << "symbols_tokenizer passed\n";
    return 0;
}
