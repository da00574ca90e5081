#pragma once

/// @file include/tacore/indicators/simple_moving_average.hpp
/// @brief Simple moving average with a price-cross signal.
///
/// # Parameters
///   - `period` ∈ [1, MAX_PERIOD]: window length (default 20)
///   - `source`: series read from each candle (default close)
///
/// # Output: arity (1, 1)
///   - value[0]  : arithmetic mean of the last `period` source values
///   - signal[0] : buy when the source crosses above the mean, sell when it
///                 crosses below
///
/// The window is pre-filled with the seed's source value, so the first
/// `period − 1` results average the seed with the newer candles.

#include "tacore/constants.hpp"
#include "tacore/error.hpp"
#include "tacore/indicator.hpp"
#include "tacore/parameters.hpp"
#include "tacore/types.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace tacore::indicators {

class SimpleMovingAverageInstance;

// ─── Configuration ────────────────────────────────────────────────────────────

class SimpleMovingAverage : public indicator::ConfigBase<SimpleMovingAverage> {
public:
    using Instance = SimpleMovingAverageInstance;
    static constexpr std::string_view NAME = "SMA";

    std::size_t period = constants::DEFAULT_PERIOD;
    Source      source = Source::Close;

    SimpleMovingAverage() = default;
    explicit SimpleMovingAverage(std::size_t period,
                                 Source source = Source::Close) noexcept;

    [[nodiscard]] bool validate() const noexcept;
    [[nodiscard]] Status set(std::string_view name, std::string_view value);
    [[nodiscard]] Arity size() const noexcept;

    [[nodiscard]] static const ParameterSet<SimpleMovingAverage>& parameters();

    template <OHLCV T>
    [[nodiscard]] Result<SimpleMovingAverageInstance> initialize(const T& seed) &&;

    bool operator==(const SimpleMovingAverage&) const = default;
};

// ─── Instance ─────────────────────────────────────────────────────────────────

class SimpleMovingAverageInstance
    : public indicator::InstanceBase<SimpleMovingAverageInstance> {
public:
    using Config = SimpleMovingAverage;

    /// Seed a fresh window. Fails with `IncompatibleSeed` if the seed's source
    /// value is not finite.
    [[nodiscard]] static Result<SimpleMovingAverageInstance>
    create(SimpleMovingAverage config, const Candle& seed);

    template <OHLCV T>
    [[nodiscard]] IndicatorResult next(const T& candle) {
        return step(to_candle(candle));
    }

    [[nodiscard]] IndicatorResult step(const Candle& candle) noexcept;

    [[nodiscard]] const SimpleMovingAverage& config() const noexcept { return config_; }

    /// Current mean of the window.
    [[nodiscard]] double average() const noexcept;

private:
    SimpleMovingAverageInstance(SimpleMovingAverage config, double seed_value);

    SimpleMovingAverage config_;
    std::vector<double> window_;
    std::size_t         head_ = 0;
    double              sum_  = 0.0;
    double              last_value_   = 0.0;
    double              last_average_ = 0.0;
};

template <OHLCV T>
Result<SimpleMovingAverageInstance> SimpleMovingAverage::initialize(const T& seed) && {
    return SimpleMovingAverageInstance::create(std::move(*this), to_candle(seed));
}

} // namespace tacore::indicators
