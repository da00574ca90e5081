#pragma once

/// @file include/tacore/indicators/price_channel.hpp
/// @brief Highest-high / lowest-low channel with a breakout-zone signal.
///
/// # Parameters
///   - `period` ∈ [1, MAX_PERIOD]: window length (default 20)
///   - `zone`   ∈ [0, 1): fraction of the channel width treated as
///     the breakout zone at each edge (default 0)
///
/// # Output: arity (2, 1)
///   - value[0]  : highest high of the window
///   - value[1]  : lowest low of the window
///   - signal[0] : buy when the close enters the upper zone
///                 (close ≥ upper − zone·width), sell when it enters the
///                 lower zone (close ≤ lower + zone·width); emitted only on
///                 the transition. A zero-width channel has no zones.

#include "tacore/constants.hpp"
#include "tacore/error.hpp"
#include "tacore/indicator.hpp"
#include "tacore/parameters.hpp"
#include "tacore/types.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace tacore::indicators {

class PriceChannelInstance;

class PriceChannel : public indicator::ConfigBase<PriceChannel> {
public:
    using Instance = PriceChannelInstance;
    static constexpr std::string_view NAME = "PC";

    std::size_t period = constants::DEFAULT_PERIOD;
    double      zone   = 0.0;

    PriceChannel() = default;
    explicit PriceChannel(std::size_t period, double zone = 0.0) noexcept;

    [[nodiscard]] bool validate() const noexcept;
    [[nodiscard]] Status set(std::string_view name, std::string_view value);
    [[nodiscard]] Arity size() const noexcept;

    [[nodiscard]] static const ParameterSet<PriceChannel>& parameters();

    template <OHLCV T>
    [[nodiscard]] Result<PriceChannelInstance> initialize(const T& seed) &&;

    bool operator==(const PriceChannel&) const = default;
};

class PriceChannelInstance : public indicator::InstanceBase<PriceChannelInstance> {
public:
    using Config = PriceChannel;

    /// Fails with `IncompatibleSeed` unless `seed` is a valid candle.
    [[nodiscard]] static Result<PriceChannelInstance>
    create(PriceChannel config, const Candle& seed);

    template <OHLCV T>
    [[nodiscard]] IndicatorResult next(const T& candle) {
        return step(to_candle(candle));
    }

    [[nodiscard]] IndicatorResult step(const Candle& candle) noexcept;

    [[nodiscard]] const PriceChannel& config() const noexcept { return config_; }

private:
    PriceChannelInstance(PriceChannel config, const Candle& seed);

    /// -1 lower zone, 0 inside, +1 upper zone.
    [[nodiscard]] int classify(double close, double upper, double lower) const noexcept;

    PriceChannel        config_;
    std::vector<double> highs_;
    std::vector<double> lows_;
    std::size_t         head_ = 0;
    int                 last_zone_ = 0;
};

template <OHLCV T>
Result<PriceChannelInstance> PriceChannel::initialize(const T& seed) && {
    return PriceChannelInstance::create(std::move(*this), to_candle(seed));
}

} // namespace tacore::indicators
