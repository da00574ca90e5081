/// @file src/indicators/simple_moving_average.cpp
/// @brief Simple moving average: ring-buffer window with a running sum.

#include "tacore/indicators/simple_moving_average.hpp"

#include <cmath>
#include <limits>
#include <numeric>

namespace tacore::indicators {

// ─── Configuration ────────────────────────────────────────────────────────────

SimpleMovingAverage::SimpleMovingAverage(std::size_t period, Source source) noexcept
    : period(period), source(source) {}

bool SimpleMovingAverage::validate() const noexcept {
    return period >= 1 && period <= constants::MAX_PERIOD;
}

const ParameterSet<SimpleMovingAverage>& SimpleMovingAverage::parameters() {
    static const auto params = ParameterSet<SimpleMovingAverage>{}
        .field("period", &SimpleMovingAverage::period,
               in_range<std::size_t>(1, constants::MAX_PERIOD))
        .field("source", &SimpleMovingAverage::source);
    return params;
}

Status SimpleMovingAverage::set(std::string_view name, std::string_view value) {
    return parameters().apply(*this, name, value);
}

Arity SimpleMovingAverage::size() const noexcept {
    return Arity{.values = 1, .signals = 1};
}

// ─── Instance ─────────────────────────────────────────────────────────────────

Result<SimpleMovingAverageInstance>
SimpleMovingAverageInstance::create(SimpleMovingAverage config, const Candle& seed) {
    const double value = source_value(seed, config.source);
    if (!std::isfinite(value)) {
        return Error::incompatible_seed(SimpleMovingAverage::NAME,
                                        "source value is not finite");
    }
    return SimpleMovingAverageInstance(std::move(config), value);
}

SimpleMovingAverageInstance::SimpleMovingAverageInstance(SimpleMovingAverage config,
                                                         double seed_value)
    : config_(std::move(config))
    , window_(config_.period, seed_value)
    , sum_(seed_value * static_cast<double>(config_.period))
    , last_value_(seed_value)
    , last_average_(seed_value)
{}

double SimpleMovingAverageInstance::average() const noexcept {
    return sum_ / static_cast<double>(window_.size());
}

IndicatorResult SimpleMovingAverageInstance::step(const Candle& candle) noexcept {
    const double value = source_value(candle, config_.source);

    sum_ += value - window_[head_];
    window_[head_] = value;
    head_ = (head_ + 1) % window_.size();

    // A non-finite value poisons the running sum; rebuild it once the window
    // is clean again.
    if (!std::isfinite(sum_)) {
        sum_ = std::accumulate(window_.begin(), window_.end(), 0.0);
    }

    const double avg = average();

    Action signal = Action::none();
    if (std::isfinite(value) && std::isfinite(avg) &&
        std::isfinite(last_value_) && std::isfinite(last_average_)) {
        if (last_value_ <= last_average_ && value > avg) {
            signal = Action::buy();
        } else if (last_value_ >= last_average_ && value < avg) {
            signal = Action::sell();
        }
    }

    last_value_   = value;
    last_average_ = avg;

    const double values[]  = {std::isfinite(avg) ? avg
                                                 : std::numeric_limits<double>::quiet_NaN()};
    const Action signals[] = {signal};
    return IndicatorResult(values, signals);
}

} // namespace tacore::indicators
