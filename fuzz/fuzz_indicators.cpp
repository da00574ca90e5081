/**
 * @file  fuzz_indicators.cpp
 * @brief libFuzzer target feeding raw doubles to every reference indicator.
 *
 * Build:
 *   cmake -DTACORE_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_indicators
 *
 * Run for 60 seconds:
 *   ./fuzz_indicators -max_total_time=60
 *
 * Input layout: byte 0 selects the period, the remaining bytes are read as
 * doubles and grouped five at a time into (open, high, low, close, volume).
 * Candles are NOT validated, so NaN, infinities and inverted ranges reach
 * next() directly.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. next() never changes the result arity.
 *   3. over() on the same input equals streaming next().
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "tacore/indicators.hpp"

using namespace tacore;
using namespace tacore::indicator;
using namespace tacore::indicators;

namespace {

std::vector<Candle> decode(const uint8_t* data, size_t size) {
    std::vector<Candle> candles;
    constexpr size_t stride = 5 * sizeof(double);
    for (size_t off = 0; off + stride <= size; off += stride) {
        double f[5];
        std::memcpy(f, data + off, stride);
        candles.push_back(Candle{
            .timestamp = static_cast<double>(candles.size()),
            .open = f[0], .high = f[1], .low = f[2], .close = f[3], .volume = f[4],
        });
    }
    return candles;
}

void check(const DynIndicatorConfig<Candle>& config, const std::vector<Candle>& candles) {
    auto instance = config.init(candles.front());
    auto batch    = config.over(candles);
    assert(instance.has_value() == batch.has_value());
    if (!instance) {
        return;
    }
    const Arity arity = config.size();
    for (std::size_t i = 0; i < candles.size(); ++i) {
        const IndicatorResult r = (*instance)->next(candles[i]);
        assert(r.size() == arity);                 // Invariant 2
        assert(r == (*batch)[i]);                  // Invariant 3
    }
}

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 1) {
        return 0;
    }
    const std::size_t period = static_cast<std::size_t>(data[0] % 64) + 1;
    const auto candles = decode(data + 1, size - 1);
    if (candles.empty()) {
        return 0;
    }

    check(ConfigAdapter<Candle, SimpleMovingAverage>(SimpleMovingAverage(period)), candles);
    check(ConfigAdapter<Candle, PriceChannel>(PriceChannel(period, 0.25)), candles);
    check(ConfigAdapter<Candle, LinearRegression>(LinearRegression(period + 1)), candles);

    return 0;
}
