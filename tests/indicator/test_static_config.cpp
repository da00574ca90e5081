/// @file tests/indicator/test_static_config.cpp
/// @brief Tests for the static Configuration/Instance capabilities.

#include "tacore/indicator.hpp"
#include "tacore/indicators.hpp"

#include "support/candle_fixtures.hpp"
#include "support/recorder_indicator.hpp"

#include <gtest/gtest.h>

#include <span>
#include <vector>

using namespace tacore;
using namespace tacore::indicator;
using fixtures::Recorder;
using fixtures::RecorderInstance;

// ─── Capability checks ────────────────────────────────────────────────────────

static_assert(IndicatorConfig<Recorder, Candle>);
static_assert(IndicatorInstance<RecorderInstance, Candle>);
static_assert(IndicatorConfig<indicators::SimpleMovingAverage, Candle>);
static_assert(IndicatorConfig<indicators::PriceChannel, Candle>);
static_assert(IndicatorConfig<indicators::LinearRegression, Candle>);
static_assert(!IndicatorConfig<Candle, Candle>);

// ─── Configuration lifecycle ──────────────────────────────────────────────────

TEST(StaticConfigLifecycle, PeriodScenario) {
    Recorder config;

    const Status rejected = config.set("period", "0");
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().kind, ErrorKind::InvalidParameter);

    ASSERT_TRUE(config.set("period", "3"));
    EXPECT_TRUE(config.validate());

    const auto candles = fixtures::bars({10.0, 11.0, 12.0, 13.0});
    auto results = std::move(config).over(candles);
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 4u);
    // The seed candle is also the first input.
    EXPECT_DOUBLE_EQ((*results)[0].value(0), 1.0);
    EXPECT_DOUBLE_EQ((*results)[0].value(1), 10.0);
    EXPECT_TRUE((*results)[0].signal(0).is_none());
    EXPECT_DOUBLE_EQ((*results)[3].value(0), 4.0);
    EXPECT_TRUE((*results)[3].signal(0).is_buy());
}

TEST(StaticConfigLifecycle, NameComesFromType) {
    EXPECT_EQ(Recorder{}.name(), "RECORDER");
    EXPECT_EQ(indicators::SimpleMovingAverage{}.name(), "SMA");
}

TEST(StaticConfigLifecycle, FailedSetLeavesConfigUnchanged) {
    Recorder config(7);
    const Recorder before = config;
    EXPECT_FALSE(config.set("period", "abc"));
    EXPECT_FALSE(config.set("nope", "1"));
    EXPECT_EQ(config, before);
}

TEST(StaticConfigInit, RejectsInvalidConfigWithoutInitializing) {
    Recorder::initializations = 0;
    Recorder config(0);
    ASSERT_FALSE(config.validate());
    auto instance = std::move(config).init(fixtures::bar(10.0));
    ASSERT_FALSE(instance.has_value());
    EXPECT_EQ(instance.error().kind, ErrorKind::InvalidParameter);
    EXPECT_EQ(Recorder::initializations, 0);
}

TEST(StaticConfigInit, InstanceKeepsConfigAndArity) {
    auto instance = Recorder(5).init(fixtures::bar(10.0));
    ASSERT_TRUE(instance.has_value());
    EXPECT_EQ(instance->config().period, 5u);
    EXPECT_EQ(instance->size(), (Arity{2, 1}));
    EXPECT_EQ(instance->name(), "RECORDER");
}

TEST(StaticConfigInit, DomainErrorIsReturnedUnchanged) {
    auto instance = Recorder(3, true).init(fixtures::bar(10.0));
    ASSERT_FALSE(instance.has_value());
    EXPECT_EQ(instance.error(), Error::domain("RECORDER", "asked to fail"));
}

// ─── Batch evaluation ─────────────────────────────────────────────────────────

TEST(StaticConfigOver, EmptyInputDoesNotInitialize) {
    Recorder::initializations = 0;
    const std::vector<Candle> empty;
    auto results = Recorder(3).over(empty);
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->empty());
    EXPECT_EQ(Recorder::initializations, 0);
}

TEST(StaticConfigOver, EmptyInputSucceedsEvenForFailingConfig) {
    auto results = Recorder(3, true).over(std::span<const Candle>{});
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE(results->empty());
}

TEST(StaticConfigOver, InitErrorYieldsNoPartialResults) {
    const auto candles = fixtures::bars({1.0, 2.0});
    auto results = Recorder(3, true).over(candles);
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error().kind, ErrorKind::Domain);
}

TEST(StaticConfigOver, InvalidConfigFailsOverNonEmptyInput) {
    const auto candles = fixtures::bars({1.0, 2.0});
    auto results = Recorder(0).over(candles);
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error().kind, ErrorKind::InvalidParameter);
}

TEST(StaticConfigOver, EqualsInitThenNext) {
    const auto candles = fixtures::trending(30, 100.0, 0.5);

    auto batch = indicators::SimpleMovingAverage(4).over(candles);
    ASSERT_TRUE(batch.has_value());

    auto instance = indicators::SimpleMovingAverage(4).init(candles.front());
    ASSERT_TRUE(instance.has_value());
    std::vector<IndicatorResult> streamed;
    for (const auto& c : candles) {
        streamed.push_back(instance->next(c));
    }
    EXPECT_EQ(*batch, streamed);
}

TEST(StaticInstanceOver, EqualsRepeatedNext) {
    const auto candles = fixtures::trending(12);
    auto a = Recorder(3).init(candles.front());
    auto b = Recorder(3).init(candles.front());
    ASSERT_TRUE(a && b);

    const auto batch = a->over(candles);
    ASSERT_EQ(batch.size(), candles.size());
    for (std::size_t i = 0; i < candles.size(); ++i) {
        EXPECT_EQ(batch[i], b->next(candles[i]));
    }
}

TEST(StaticInstanceOver, EmptyInputYieldsEmptyOutput) {
    auto instance = Recorder(3).init(fixtures::bar(1.0));
    ASSERT_TRUE(instance.has_value());
    EXPECT_TRUE(instance->over(std::span<const Candle>{}).empty());
    EXPECT_EQ(instance->seen(), 0u);
}

TEST(StaticInstanceNext, EveryResultHasDeclaredArity) {
    const auto candles = fixtures::trending(10);
    auto instance = Recorder(3).init(candles.front());
    ASSERT_TRUE(instance.has_value());
    for (const auto& c : candles) {
        EXPECT_EQ(instance->next(c).size(), instance->size());
    }
}
