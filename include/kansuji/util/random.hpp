#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

#include <kansuji/core/symbols.hpp>
#include <kansuji/core/uint128.hpp>

namespace kansuji::util {

// Uniform over [0, max_integer], built one 10^4 group at a time.
inline uint128 random_integer(std::mt19937_64& generator) {
    static std::uniform_int_distribution<std::uint32_t> group_dist(0, core::detail::GROUP_RADIX - 1);
    uint128 value = 0;
    for (int group = 0; group < 6; ++group) {
        value = value * core::detail::GROUP_RADIX + group_dist(generator);
    }
    return value;
}

// Random value with only the given number of nonzero 10^4 groups, which
// exercises group omission in the formatter.
inline uint128 random_sparse_integer(std::mt19937_64& generator, int nonzero_groups) {
    static std::uniform_int_distribution<std::uint32_t> group_dist(1, core::detail::GROUP_RADIX - 1);
    static std::uniform_int_distribution<int> slot_dist(0, 5);
    uint128 value = 0;
    for (int count = 0; count < nonzero_groups; ++count) {
        const auto scale = core::detail::GROUP_SCALE[static_cast<std::size_t>(slot_dist(generator))];
        if ((value / scale) % core::detail::GROUP_RADIX == 0) {
            value += scale * group_dist(generator);
        }
    }
    return value;
}

inline std::uint32_t random_thousandths(std::mt19937_64& generator) {
    static std::uniform_int_distribution<std::uint32_t> dist(0, fraction_scale - 1);
    return dist(generator);
}

} // namespace kansuji::util
