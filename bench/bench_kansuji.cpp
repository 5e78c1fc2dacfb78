// bench/bench_kansuji.cpp — Benchmarks for decoding, encoding and numeric conversion.

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include <kansuji/kansuji.hpp>
#include <kansuji/util/random.hpp>

namespace {

constexpr std::size_t SAMPLE_COUNT = 1024;

std::vector<kansuji::uint128> make_integers(std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<kansuji::uint128> values;
    values.reserve(SAMPLE_COUNT);
    for (std::size_t index = 0; index < SAMPLE_COUNT; ++index) {
        values.push_back(kansuji::util::random_integer(rng));
    }
    return values;
}

std::vector<std::string> make_texts(std::uint64_t seed) {
    std::vector<std::string> texts;
    texts.reserve(SAMPLE_COUNT);
    for (const auto value : make_integers(seed)) {
        texts.push_back(kansuji::Kansuji::from_u128(value).to_string());
    }
    return texts;
}

static void BM_Tokenize(benchmark::State& state) {
    const auto texts = make_texts(0x7a11);
    std::size_t index = 0;
    for (auto _ : state) {
        auto tokens = kansuji::core::tokenize(texts[index++ % texts.size()]);
        benchmark::DoNotOptimize(tokens.data());
    }
}
BENCHMARK(BM_Tokenize);

static void BM_Decode(benchmark::State& state) {
    const auto texts = make_texts(0xdec0de);
    std::size_t index = 0;
    for (auto _ : state) {
        const auto value = kansuji::Kansuji::from_string(texts[index++ % texts.size()]);
        benchmark::DoNotOptimize(value.integer());
    }
}
BENCHMARK(BM_Decode);

static void BM_Encode(benchmark::State& state) {
    const auto integers = make_integers(0xe2c0de);
    std::size_t index = 0;
    for (auto _ : state) {
        auto text = kansuji::Kansuji::from_u128(integers[index++ % integers.size()]).to_string();
        benchmark::DoNotOptimize(text.data());
    }
}
BENCHMARK(BM_Encode);

static void BM_FromDouble(benchmark::State& state) {
    std::mt19937_64 rng(0xd0b1e);
    std::uniform_real_distribution<double> dist(0.0, 1e15);
    std::vector<double> inputs(SAMPLE_COUNT);
    for (auto& input : inputs) {
        input = dist(rng);
    }
    std::size_t index = 0;
    for (auto _ : state) {
        const auto value = kansuji::Kansuji::from_double(inputs[index++ % inputs.size()]);
        benchmark::DoNotOptimize(value.to_double());
    }
}
BENCHMARK(BM_FromDouble);

} // namespace

BENCHMARK_MAIN();
