#pragma once

/// @file include/tacore/random_candles.hpp
/// @brief Deterministic synthetic candle generator for tests, benchmarks and
///        the CLI demo mode.
///
/// Produces a geometric random walk of closes; each candle opens at the
/// previous close and its high/low bracket both. Every generated candle
/// passes `is_valid`.

#include "tacore/types.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace tacore {

struct RandomCandlesConfig {
    std::uint64_t seed        = 42;
    double        start_price = 100.0;
    double        volatility  = 0.01;   ///< std-dev of per-bar log return
    double        mean_volume = 1000.0;
};

class RandomCandles {
public:
    explicit RandomCandles(RandomCandlesConfig config = RandomCandlesConfig{});

    /// Generate the next candle of the walk.
    [[nodiscard]] Candle next();

    /// Generate `count` consecutive candles.
    [[nodiscard]] std::vector<Candle> take(std::size_t count);

private:
    RandomCandlesConfig              config_;
    std::mt19937_64                  engine_;
    std::normal_distribution<double> step_;
    std::exponential_distribution<double> volume_;
    std::uniform_real_distribution<double> wick_;
    double                           price_;
    double                           timestamp_ = 0.0;
};

} // namespace tacore
