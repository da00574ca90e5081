/// @file src/indicators/price_channel.cpp
/// @brief Price channel over ring buffers of highs and lows.

#include "tacore/indicators/price_channel.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tacore::indicators {

// ─── Configuration ────────────────────────────────────────────────────────────

PriceChannel::PriceChannel(std::size_t period, double zone) noexcept
    : period(period), zone(zone) {}

bool PriceChannel::validate() const noexcept {
    return period >= 1 && period <= constants::MAX_PERIOD &&
           std::isfinite(zone) && zone >= 0.0 && zone < 1.0;
}

const ParameterSet<PriceChannel>& PriceChannel::parameters() {
    static const auto params = ParameterSet<PriceChannel>{}
        .field("period", &PriceChannel::period,
               in_range<std::size_t>(1, constants::MAX_PERIOD))
        .field("zone", &PriceChannel::zone, in_half_open(0.0, 1.0));
    return params;
}

Status PriceChannel::set(std::string_view name, std::string_view value) {
    return parameters().apply(*this, name, value);
}

Arity PriceChannel::size() const noexcept {
    return Arity{.values = 2, .signals = 1};
}

// ─── Instance ─────────────────────────────────────────────────────────────────

Result<PriceChannelInstance>
PriceChannelInstance::create(PriceChannel config, const Candle& seed) {
    if (!is_valid(seed)) {
        return Error::incompatible_seed(PriceChannel::NAME,
                                        "seed candle is not a valid OHLCV bar");
    }
    return PriceChannelInstance(std::move(config), seed);
}

PriceChannelInstance::PriceChannelInstance(PriceChannel config, const Candle& seed)
    : config_(std::move(config))
    , highs_(config_.period, seed.high)
    , lows_(config_.period, seed.low)
    , last_zone_(classify(seed.close, seed.high, seed.low))
{}

int PriceChannelInstance::classify(double close, double upper, double lower) const noexcept {
    const double width = upper - lower;
    if (!(width > constants::FLOAT_EPSILON)) {
        return 0;
    }
    if (close >= upper - config_.zone * width) return 1;
    if (close <= lower + config_.zone * width) return -1;
    return 0;
}

IndicatorResult PriceChannelInstance::step(const Candle& candle) noexcept {
    highs_[head_] = candle.high;
    lows_[head_]  = candle.low;
    head_ = (head_ + 1) % highs_.size();

    constexpr double nan = std::numeric_limits<double>::quiet_NaN();

    const bool finite = std::all_of(highs_.begin(), highs_.end(),
                                    [](double v) { return std::isfinite(v); }) &&
                        std::all_of(lows_.begin(), lows_.end(),
                                    [](double v) { return std::isfinite(v); });

    if (!finite || !std::isfinite(candle.close)) {
        last_zone_ = 0;
        const double values[]  = {finite ? *std::max_element(highs_.begin(), highs_.end()) : nan,
                                  finite ? *std::min_element(lows_.begin(), lows_.end()) : nan};
        const Action signals[] = {Action::none()};
        return IndicatorResult(values, signals);
    }

    const double upper = *std::max_element(highs_.begin(), highs_.end());
    const double lower = *std::min_element(lows_.begin(), lows_.end());

    const int zone = classify(candle.close, upper, lower);
    Action signal = Action::none();
    if (zone != last_zone_) {
        if (zone > 0)      signal = Action::buy();
        else if (zone < 0) signal = Action::sell();
    }
    last_zone_ = zone;

    const double values[]  = {upper, lower};
    const Action signals[] = {signal};
    return IndicatorResult(values, signals);
}

} // namespace tacore::indicators
