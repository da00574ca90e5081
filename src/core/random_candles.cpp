/// @file src/core/random_candles.cpp
/// @brief Seeded random-walk candle generator.

#include "tacore/random_candles.hpp"

#include <algorithm>
#include <cmath>

namespace tacore {

RandomCandles::RandomCandles(RandomCandlesConfig config)
    : config_(config)
    , engine_(config.seed)
    , step_(0.0, config.volatility > 0.0 ? config.volatility : 1e-12)
    , volume_(config.mean_volume > 0.0 ? 1.0 / config.mean_volume : 1.0)
    , wick_(0.0, 0.5)
    , price_(config.start_price > 0.0 ? config.start_price : 1.0)
{}

Candle RandomCandles::next() {
    const double open  = price_;
    const double close = open * std::exp(step_(engine_));

    const double body_high = std::max(open, close);
    const double body_low  = std::min(open, close);
    const double range     = std::max(body_high - body_low, open * config_.volatility);

    Candle candle{
        .timestamp = timestamp_,
        .open      = open,
        .high      = body_high + wick_(engine_) * range,
        .low       = std::max(body_low - wick_(engine_) * range, body_low * 0.5),
        .close     = close,
        .volume    = volume_(engine_),
    };

    price_ = close;
    timestamp_ += 1.0;
    return candle;
}

std::vector<Candle> RandomCandles::take(std::size_t count) {
    std::vector<Candle> candles;
    candles.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        candles.push_back(next());
    }
    return candles;
}

} // namespace tacore
