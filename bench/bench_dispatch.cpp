/**
 * @file  bench/bench_dispatch.cpp
 * @brief Google Benchmark suite comparing static and type-erased evaluation.
 *
 * Benchmarks
 * ----------
 *   BM_Over_Static / Dynamic: batch over() per indicator kind
 *   BM_Next_Static / Dynamic: streaming next() per candle
 *   BM_IndicatorSet_Push: three boxed indicators, one push per candle
 *   BM_Registry_Configure: text description → boxed configuration
 *
 * Build (CMake):
 *   cmake -DTACORE_BUILD_BENCH=ON ..
 *   cmake --build . --target bench_dispatch
 *   ./bench_dispatch --benchmark_format=json
 *
 * Throughput units: items/second (candles processed).
 * Custom counter "Mbars_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "tacore/indicator_set.hpp"
#include "tacore/indicators.hpp"
#include "tacore/random_candles.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace tacore;
using namespace tacore::indicator;
using namespace tacore::indicators;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static std::vector<Candle> make_candles(std::size_t n) {
    RandomCandles gen(RandomCandlesConfig{.seed = 2024});
    return gen.take(n);
}

static void set_throughput(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    state.counters["Mbars_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(n) / 1e6,
        benchmark::Counter::kIsRate);
}

// ── Batch over() ──────────────────────────────────────────────────────────────

template <typename C>
static void BM_Over_Static(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto candles = make_candles(n);
    for (auto _ : state) {
        auto results = C(14).over(candles);
        benchmark::DoNotOptimize(results);
    }
    set_throughput(state, n);
}
BENCHMARK_TEMPLATE(BM_Over_Static, SimpleMovingAverage)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_Over_Static, PriceChannel)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_Over_Static, LinearRegression)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

template <typename C>
static void BM_Over_Dynamic(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto candles = make_candles(n);
    const BoxedConfig<Candle> config = make_dynamic<Candle>(C(14));
    for (auto _ : state) {
        auto results = config->over(candles);
        benchmark::DoNotOptimize(results);
    }
    set_throughput(state, n);
}
BENCHMARK_TEMPLATE(BM_Over_Dynamic, SimpleMovingAverage)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_Over_Dynamic, PriceChannel)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);
BENCHMARK_TEMPLATE(BM_Over_Dynamic, LinearRegression)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Streaming next() ──────────────────────────────────────────────────────────

static void BM_Next_Static(benchmark::State& state) {
    const auto candles = make_candles(4096);
    auto instance = SimpleMovingAverage(14).init(candles.front());
    if (!instance) {
        state.SkipWithError("SMA failed to initialize");
        return;
    }
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(instance->next(candles[i]));
        i = (i + 1) % candles.size();
    }
    set_throughput(state, 1);
}
BENCHMARK(BM_Next_Static);

static void BM_Next_Dynamic(benchmark::State& state) {
    const auto candles = make_candles(4096);
    auto instance = make_dynamic<Candle>(SimpleMovingAverage(14))->init(candles.front());
    if (!instance) {
        state.SkipWithError("SMA failed to initialize");
        return;
    }
    std::size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize((*instance)->next(candles[i]));
        i = (i + 1) % candles.size();
    }
    set_throughput(state, 1);
}
BENCHMARK(BM_Next_Dynamic);

// ── Collections and configuration ─────────────────────────────────────────────

static void BM_IndicatorSet_Push(benchmark::State& state) {
    const auto candles = make_candles(4096);
    IndicatorSet<Candle> set;
    set.add(make_dynamic<Candle>(SimpleMovingAverage(14)));
    set.add(make_dynamic<Candle>(PriceChannel(20, 0.1)));
    set.add(make_dynamic<Candle>(LinearRegression(14)));
    if (!set.start(candles.front())) {
        state.SkipWithError("IndicatorSet failed to start");
        return;
    }
    std::size_t i = 0;
    for (auto _ : state) {
        auto row = set.push(candles[i]);
        benchmark::DoNotOptimize(row.data());
        i = (i + 1) % candles.size();
    }
    set_throughput(state, 1);
}
BENCHMARK(BM_IndicatorSet_Push);

static void BM_Registry_Configure(benchmark::State& state) {
    const auto registry = make_default_registry<Candle>();
    for (auto _ : state) {
        auto config = registry.configure("PC period=20 zone=0.15");
        benchmark::DoNotOptimize(config);
    }
}
BENCHMARK(BM_Registry_Configure);

BENCHMARK_MAIN();
