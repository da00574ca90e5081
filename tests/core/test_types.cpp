/// @file tests/core/test_types.cpp
/// @brief Tests for Candle, Source, Action and IndicatorResult.

#include "tacore/types.hpp"

#include "support/candle_fixtures.hpp"

#include <gtest/gtest.h>
#include <fmt/format.h>

#include <array>
#include <cmath>
#include <limits>

using namespace tacore;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

/// Host-defined candle without a timestamp, used to exercise the OHLCV bound.
struct HostBar {
    float  open, high, low, close;
    long   volume;
    bool operator==(const HostBar&) const = default;
};

} // anonymous namespace

template <>
struct fmt::formatter<HostBar> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const HostBar& b, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "HostBar({})", b.close);
    }
};

// ─── OHLCV capability ─────────────────────────────────────────────────────────

static_assert(OHLCV<Candle>);
static_assert(OHLCV<HostBar>);
static_assert(!OHLCV<double>);

TEST(OHLCVCapability, ToCandleCopiesPriceFields) {
    const HostBar host{.open = 1.0f, .high = 4.0f, .low = 0.5f, .close = 2.0f, .volume = 7};
    const Candle c = to_candle(host);
    EXPECT_DOUBLE_EQ(c.open, 1.0);
    EXPECT_DOUBLE_EQ(c.high, 4.0);
    EXPECT_DOUBLE_EQ(c.low, 0.5);
    EXPECT_DOUBLE_EQ(c.close, 2.0);
    EXPECT_DOUBLE_EQ(c.volume, 7.0);
    EXPECT_DOUBLE_EQ(c.timestamp, 0.0);
}

TEST(OHLCVCapability, ToCandleKeepsTimestampWhenPresent) {
    const Candle c = to_candle(fixtures::bar(10.0, 42.0));
    EXPECT_DOUBLE_EQ(c.timestamp, 42.0);
}

// ─── Candle validity ──────────────────────────────────────────────────────────

TEST(CandleValidity, WellFormedBarIsValid) {
    EXPECT_TRUE(is_valid(fixtures::bar(100.0)));
}

TEST(CandleValidity, HighBelowLowIsInvalid) {
    Candle c = fixtures::bar(100.0);
    c.high = 98.0;
    EXPECT_FALSE(is_valid(c));
}

TEST(CandleValidity, CloseOutsideRangeIsInvalid) {
    Candle c = fixtures::bar(100.0);
    c.close = 102.0;
    EXPECT_FALSE(is_valid(c));
}

TEST(CandleValidity, NegativeVolumeIsInvalid) {
    Candle c = fixtures::bar(100.0);
    c.volume = -1.0;
    EXPECT_FALSE(is_valid(c));
}

TEST(CandleValidity, NonFiniteFieldIsInvalid) {
    Candle c = fixtures::bar(100.0);
    c.open = kNaN;
    EXPECT_FALSE(is_valid(c));
    c = fixtures::bar(100.0);
    c.high = kInf;
    EXPECT_FALSE(is_valid(c));
}

// ─── Source ───────────────────────────────────────────────────────────────────

TEST(SourceParse, AcceptsNamesAndAliasesCaseInsensitively) {
    EXPECT_EQ(parse_source("close"), Source::Close);
    EXPECT_EQ(parse_source("CLOSE"), Source::Close);
    EXPECT_EQ(parse_source("c"), Source::Close);
    EXPECT_EQ(parse_source("tp"), Source::HLC3);
    EXPECT_EQ(parse_source("median"), Source::HL2);
    EXPECT_EQ(parse_source("OHLC4"), Source::OHLC4);
    EXPECT_EQ(parse_source("v"), Source::Volume);
}

TEST(SourceParse, RejectsUnknownName) {
    EXPECT_FALSE(parse_source("vwap").has_value());
    EXPECT_FALSE(parse_source("").has_value());
}

TEST(SourceParse, ToStringRoundTripsThroughParse) {
    for (Source s : {Source::Open, Source::High, Source::Low, Source::Close,
                     Source::HL2, Source::HLC3, Source::OHLC4, Source::Volume}) {
        EXPECT_EQ(parse_source(to_string(s)), s);
    }
}

TEST(SourceValue, DerivedSeries) {
    const Candle c{.timestamp = 0, .open = 2, .high = 6, .low = 1, .close = 3, .volume = 9};
    EXPECT_DOUBLE_EQ(source_value(c, Source::HL2), 3.5);
    EXPECT_DOUBLE_EQ(source_value(c, Source::HLC3), 10.0 / 3.0);
    EXPECT_DOUBLE_EQ(source_value(c, Source::OHLC4), 3.0);
    EXPECT_DOUBLE_EQ(source_value(c, Source::Volume), 9.0);
}

// ─── Action ───────────────────────────────────────────────────────────────────

TEST(ActionSignal, BuySellNone) {
    EXPECT_TRUE(Action::buy().is_buy());
    EXPECT_TRUE(Action::sell().is_sell());
    EXPECT_TRUE(Action::none().is_none());
    EXPECT_DOUBLE_EQ(Action::sell(0.5).strength(), -0.5);
}

TEST(ActionSignal, StrengthIsClamped) {
    EXPECT_DOUBLE_EQ(Action::from_strength(3.0).strength(), 1.0);
    EXPECT_DOUBLE_EQ(Action::from_strength(-3.0).strength(), -1.0);
}

TEST(ActionSignal, NaNStrengthIsNone) {
    EXPECT_TRUE(Action::from_strength(kNaN).is_none());
}

// ─── IndicatorResult ──────────────────────────────────────────────────────────

TEST(IndicatorResultShape, DefaultIsEmpty) {
    const IndicatorResult r;
    EXPECT_EQ(r.size(), (Arity{0, 0}));
    EXPECT_TRUE(r.values().empty());
    EXPECT_TRUE(r.signals().empty());
}

TEST(IndicatorResultShape, ActiveCountsMatchInputs) {
    const double values[]  = {1.0, 2.0};
    const Action signals[] = {Action::buy()};
    const IndicatorResult r(values, signals);
    EXPECT_EQ(r.size(), (Arity{2, 1}));
    EXPECT_DOUBLE_EQ(r.value(1), 2.0);
    EXPECT_TRUE(r.signal(0).is_buy());
}

TEST(IndicatorResultShape, OutOfRangeAccessIsSentinel) {
    const double values[]  = {1.0};
    const Action signals[] = {Action::sell()};
    const IndicatorResult r(values, signals);
    EXPECT_TRUE(std::isnan(r.value(1)));
    EXPECT_TRUE(r.signal(3).is_none());
}

TEST(IndicatorResultShape, InputsBeyondCapacityAreTruncated) {
    const std::array<double, 6> values{1, 2, 3, 4, 5, 6};
    const IndicatorResult r(values, {});
    EXPECT_EQ(r.size().values, constants::MAX_RESULT_VALUES);
    EXPECT_DOUBLE_EQ(r.values().back(), 4.0);
}

TEST(IndicatorResultEquality, NaNEqualsNaN) {
    const double a[] = {kNaN, 1.0};
    const double b[] = {kNaN, 1.0};
    EXPECT_EQ(IndicatorResult(a, {}), IndicatorResult(b, {}));
}

TEST(IndicatorResultEquality, DifferentArityIsUnequal) {
    const double a[] = {1.0};
    const double b[] = {1.0, 2.0};
    EXPECT_NE(IndicatorResult(a, {}), IndicatorResult(b, {}));
}

TEST(IndicatorResultFormat, ToStringListsValuesAndSignals) {
    const double values[]  = {1.5, 2.0};
    const Action signals[] = {Action::buy(), Action::none()};
    const IndicatorResult r(values, signals);
    EXPECT_EQ(r.to_string(), "values=[1.500000, 2.000000] signals=[+1.00, -]");
    EXPECT_EQ(fmt::format("{}", r), r.to_string());
}
