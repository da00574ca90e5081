#pragma once

/// @file include/tacore/types.hpp
/// @brief Shared value types: candles, signals, and indicator results.
///
/// Every module includes this file. It defines the `OHLCV` capability that a
/// host's candle type must satisfy, the library's own `Candle`, and the
/// fixed-shape `IndicatorResult` produced once per processed candle.

#include "tacore/constants.hpp"

#include <fmt/format.h>

#include <array>
#include <concepts>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tacore {

// ─── OHLCV Capability ─────────────────────────────────────────────────────────

/// A read-only market-data record.
///
/// Candle types are supplied by the host. The core only reads the five price
/// fields, copies candles, compares them, and formats them for diagnostics.
template <typename T>
concept OHLCV = std::copyable<T> && std::equality_comparable<T> &&
                fmt::is_formattable<T>::value &&
                requires(const T& candle) {
                    { candle.open } -> std::convertible_to<double>;
                    { candle.high } -> std::convertible_to<double>;
                    { candle.low } -> std::convertible_to<double>;
                    { candle.close } -> std::convertible_to<double>;
                    { candle.volume } -> std::convertible_to<double>;
                };

// ─── Candle ───────────────────────────────────────────────────────────────────

/// A single OHLCV bar of market data.
struct Candle {
    double timestamp = 0.0; ///< Bar index or Unix epoch seconds
    double open      = 0.0; ///< Opening price
    double high      = 0.0; ///< High price
    double low       = 0.0; ///< Low price
    double close     = 0.0; ///< Closing price
    double volume    = 0.0; ///< Traded volume

    bool operator==(const Candle&) const = default;
};

/// A candle is valid if:
/// - All fields are finite
/// - low <= open, close <= high
/// - volume >= 0
[[nodiscard]] bool is_valid(const Candle& candle) noexcept;

/// Copy any OHLCV record into a `Candle`.
/// Types without a `timestamp` member get timestamp 0.
template <OHLCV T>
[[nodiscard]] Candle to_candle(const T& candle) noexcept {
    Candle out{
        .open   = static_cast<double>(candle.open),
        .high   = static_cast<double>(candle.high),
        .low    = static_cast<double>(candle.low),
        .close  = static_cast<double>(candle.close),
        .volume = static_cast<double>(candle.volume),
    };
    if constexpr (requires { candle.timestamp; }) {
        out.timestamp = static_cast<double>(candle.timestamp);
    }
    return out;
}

// ─── Source ───────────────────────────────────────────────────────────────────

/// Which series of a candle an indicator reads.
enum class Source : std::uint8_t {
    Open,
    High,
    Low,
    Close,
    HL2,    ///< (high + low) / 2
    HLC3,   ///< typical price (high + low + close) / 3
    OHLC4,  ///< (open + high + low + close) / 4
    Volume,
};

/// Parse a source name ("close", "hl2", "tp", ...). Case-insensitive.
[[nodiscard]] std::optional<Source> parse_source(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(Source source) noexcept;

/// Extract the selected series value from a candle.
[[nodiscard]] double source_value(const Candle& candle, Source source) noexcept;

// ─── Action ───────────────────────────────────────────────────────────────────

/// A trading signal with a strength in [-1, 1].
///
/// Positive strength is a buy, negative a sell, zero means no signal.
class Action {
public:
    constexpr Action() noexcept = default;

    [[nodiscard]] static Action buy(double strength = 1.0) noexcept;
    [[nodiscard]] static Action sell(double strength = 1.0) noexcept;
    [[nodiscard]] static constexpr Action none() noexcept { return Action{}; }

    /// Build from a signed strength; clamped to [-1, 1], NaN becomes none.
    [[nodiscard]] static Action from_strength(double strength) noexcept;

    [[nodiscard]] constexpr double strength() const noexcept { return strength_; }
    [[nodiscard]] constexpr bool is_buy() const noexcept { return strength_ > 0.0; }
    [[nodiscard]] constexpr bool is_sell() const noexcept { return strength_ < 0.0; }
    [[nodiscard]] constexpr bool is_none() const noexcept { return strength_ == 0.0; }

    bool operator==(const Action&) const = default;

private:
    double strength_ = 0.0;
};

// ─── Arity ────────────────────────────────────────────────────────────────────

/// Output shape of an indicator: (count of raw values, count of signals).
struct Arity {
    std::uint8_t values  = 0;
    std::uint8_t signals = 0;

    bool operator==(const Arity&) const = default;
};

// ─── IndicatorResult ──────────────────────────────────────────────────────────

/// Fixed-shape output of one indicator for one candle.
///
/// Holds up to MAX_RESULT_VALUES raw values and MAX_RESULT_SIGNALS signals.
/// Slots beyond the active counts are zero and never observable.
class IndicatorResult {
public:
    IndicatorResult() noexcept = default;

    /// Copies `values` and `signals`; inputs longer than the capacity are
    /// truncated.
    IndicatorResult(std::span<const double> values,
                    std::span<const Action> signals) noexcept;

    [[nodiscard]] std::span<const double> values() const noexcept;
    [[nodiscard]] std::span<const Action> signals() const noexcept;

    /// Raw value at `index`, or NaN when `index` is outside the active range.
    [[nodiscard]] double value(std::size_t index) const noexcept;

    /// Signal at `index`, or `Action::none()` outside the active range.
    [[nodiscard]] Action signal(std::size_t index) const noexcept;

    [[nodiscard]] Arity size() const noexcept;

    [[nodiscard]] std::string to_string() const;

    /// Element-wise equality of the active slots. Two NaN values compare
    /// equal so that sentinel outputs are reproducible.
    bool operator==(const IndicatorResult& other) const noexcept;

private:
    std::array<double, constants::MAX_RESULT_VALUES> values_{};
    std::array<Action, constants::MAX_RESULT_SIGNALS> signals_{};
    std::uint8_t value_count_  = 0;
    std::uint8_t signal_count_ = 0;
};

} // namespace tacore

// ─── fmt formatters ───────────────────────────────────────────────────────────

template <>
struct fmt::formatter<tacore::Candle> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tacore::Candle& c, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(),
                              "Candle(t={} o={} h={} l={} c={} v={})",
                              c.timestamp, c.open, c.high, c.low, c.close,
                              c.volume);
    }
};

template <>
struct fmt::formatter<tacore::Action> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tacore::Action& a, FormatContext& ctx) const {
        if (a.is_buy())  return fmt::format_to(ctx.out(), "+{:.2f}", a.strength());
        if (a.is_sell()) return fmt::format_to(ctx.out(), "{:.2f}", a.strength());
        return fmt::format_to(ctx.out(), "-");
    }
};

template <>
struct fmt::formatter<tacore::IndicatorResult> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tacore::IndicatorResult& r, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", r.to_string());
    }
};
