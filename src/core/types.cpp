/// @file src/core/types.cpp
/// @brief Candle validation, sources, actions, and IndicatorResult.

#include "tacore/types.hpp"
#include "tacore/parameters.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/ranges.h>

namespace tacore {

namespace {

bool same_value(double a, double b) noexcept {
    if (std::isnan(a) && std::isnan(b)) return true;
    return a == b;
}

} // anonymous namespace

// ─── Candle ───────────────────────────────────────────────────────────────────

bool is_valid(const Candle& candle) noexcept {
    if (!std::isfinite(candle.timestamp) ||
        !std::isfinite(candle.open)      ||
        !std::isfinite(candle.high)      ||
        !std::isfinite(candle.low)       ||
        !std::isfinite(candle.close)     ||
        !std::isfinite(candle.volume)) {
        return false;
    }

    if (candle.high  < candle.low)  return false;
    if (candle.open  > candle.high) return false;
    if (candle.open  < candle.low)  return false;
    if (candle.close > candle.high) return false;
    if (candle.close < candle.low)  return false;

    return candle.volume >= 0.0;
}

// ─── Source ───────────────────────────────────────────────────────────────────

std::optional<Source> parse_source(std::string_view text) noexcept {
    struct Alias {
        std::string_view name;
        Source           source;
    };
    static constexpr Alias aliases[] = {
        {"open", Source::Open},     {"o", Source::Open},
        {"high", Source::High},     {"h", Source::High},
        {"low", Source::Low},       {"l", Source::Low},
        {"close", Source::Close},   {"c", Source::Close},
        {"hl2", Source::HL2},       {"median", Source::HL2},
        {"hlc3", Source::HLC3},     {"tp", Source::HLC3},
        {"ohlc4", Source::OHLC4},
        {"volume", Source::Volume}, {"v", Source::Volume},
    };

    for (const auto& alias : aliases) {
        if (iequals(text, alias.name)) {
            return alias.source;
        }
    }
    return std::nullopt;
}

std::string_view to_string(Source source) noexcept {
    switch (source) {
        case Source::Open:   return "open";
        case Source::High:   return "high";
        case Source::Low:    return "low";
        case Source::Close:  return "close";
        case Source::HL2:    return "hl2";
        case Source::HLC3:   return "hlc3";
        case Source::OHLC4:  return "ohlc4";
        case Source::Volume: return "volume";
    }
    return "close";
}

double source_value(const Candle& candle, Source source) noexcept {
    switch (source) {
        case Source::Open:   return candle.open;
        case Source::High:   return candle.high;
        case Source::Low:    return candle.low;
        case Source::Close:  return candle.close;
        case Source::HL2:    return (candle.high + candle.low) / 2.0;
        case Source::HLC3:   return (candle.high + candle.low + candle.close) / 3.0;
        case Source::OHLC4:
            return (candle.open + candle.high + candle.low + candle.close) / 4.0;
        case Source::Volume: return candle.volume;
    }
    return candle.close;
}

// ─── Action ───────────────────────────────────────────────────────────────────

Action Action::buy(double strength) noexcept {
    return from_strength(std::abs(strength));
}

Action Action::sell(double strength) noexcept {
    return from_strength(-std::abs(strength));
}

Action Action::from_strength(double strength) noexcept {
    Action action;
    if (std::isnan(strength)) {
        return action;
    }
    action.strength_ = std::clamp(strength, -1.0, 1.0);
    return action;
}

// ─── IndicatorResult ──────────────────────────────────────────────────────────

IndicatorResult::IndicatorResult(std::span<const double> values,
                                 std::span<const Action> signals) noexcept
    : value_count_(static_cast<std::uint8_t>(
          std::min(values.size(), constants::MAX_RESULT_VALUES)))
    , signal_count_(static_cast<std::uint8_t>(
          std::min(signals.size(), constants::MAX_RESULT_SIGNALS)))
{
    std::copy_n(values.begin(), value_count_, values_.begin());
    std::copy_n(signals.begin(), signal_count_, signals_.begin());
}

std::span<const double> IndicatorResult::values() const noexcept {
    return std::span<const double>(values_.data(), value_count_);
}

std::span<const Action> IndicatorResult::signals() const noexcept {
    return std::span<const Action>(signals_.data(), signal_count_);
}

double IndicatorResult::value(std::size_t index) const noexcept {
    if (index >= value_count_) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return values_[index];
}

Action IndicatorResult::signal(std::size_t index) const noexcept {
    if (index >= signal_count_) {
        return Action::none();
    }
    return signals_[index];
}

Arity IndicatorResult::size() const noexcept {
    return Arity{.values = value_count_, .signals = signal_count_};
}

std::string IndicatorResult::to_string() const {
    return fmt::format("values=[{:.6f}] signals=[{}]",
                       fmt::join(values(), ", "),
                       fmt::join(signals(), ", "));
}

bool IndicatorResult::operator==(const IndicatorResult& other) const noexcept {
    if (value_count_ != other.value_count_ || signal_count_ != other.signal_count_) {
        return false;
    }
    for (std::size_t i = 0; i < value_count_; ++i) {
        if (!same_value(values_[i], other.values_[i])) return false;
    }
    for (std::size_t i = 0; i < signal_count_; ++i) {
        if (signals_[i] != other.signals_[i]) return false;
    }
    return true;
}

} // namespace tacore
