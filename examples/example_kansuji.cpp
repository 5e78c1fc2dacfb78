// examples/example_kansuji.cpp — Decodes, converts and re-encodes a few kansuji numerals.

#include <iostream>
#include <stdexcept>

#include <kansuji/kansuji.hpp>

int
main() {
    using kansuji::Kansuji;
    using namespace kansuji::literals;

    const auto amount = "百二十三兆五百四十万二"_kansuji;
    std::cout << amount << " = " << kansuji::to_decimal_string(amount.to_u128()) << "\n";

    const auto rate = Kansuji::from_double(3.14159);
    std::cout << "3.14159 rounds to " << rate << " = " << rate.to_double() << "\n";

    const auto large = Kansuji::from_integer(18446744073709551615ULL);
    std::cout << "uint64 max = " << large << "\n";

    try {
        (void)Kansuji::from_string("一万二兆");
    } catch (const kansuji::parse_error& error) {
        std::cout << "rejected: " << error.what() << "\n";
    }
    try {
        (void)rate.to_u128();
    } catch (const kansuji::conversion_error& error) {
        std::cout << "rejected: " << error.what() << "\n";
    }
    return 0;
}
