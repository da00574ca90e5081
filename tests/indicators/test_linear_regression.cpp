/// @file tests/indicators/test_linear_regression.cpp
/// @brief Tests for LinearRegression and fit_line.

#include "tacore/indicators/linear_regression.hpp"

#include "support/candle_fixtures.hpp"

#include <gtest/gtest.h>

#include <Eigen/Dense>

#include <cmath>
#include <limits>

using namespace tacore;
using namespace tacore::indicators;

namespace {

constexpr double kTol = 1e-9;

} // anonymous namespace

// ─── fit_line ─────────────────────────────────────────────────────────────────

TEST(FitLine, ExactLine) {
    Eigen::VectorXd ys(4);
    ys << 1.0, 3.0, 5.0, 7.0;
    const LineFit fit = fit_line(ys);
    EXPECT_NEAR(fit.intercept, 1.0, kTol);
    EXPECT_NEAR(fit.slope, 2.0, kTol);
}

TEST(FitLine, ConstantSeriesHasZeroSlope) {
    const LineFit fit = fit_line(Eigen::VectorXd::Constant(6, 42.0));
    EXPECT_NEAR(fit.slope, 0.0, kTol);
    EXPECT_NEAR(fit.intercept, 42.0, kTol);
}

TEST(FitLine, NoisyDataLeastSquares) {
    // Sxy = 19, Sxx = 10 about the means (2, 4).
    Eigen::VectorXd ys(5);
    ys << 0.5, 1.5, 4.0, 6.5, 7.5;
    const LineFit fit = fit_line(ys);
    EXPECT_NEAR(fit.slope, 1.9, kTol);
    EXPECT_NEAR(fit.intercept, 0.2, kTol);
}

TEST(FitLine, TooFewPointsIsNaN) {
    const LineFit fit = fit_line(Eigen::VectorXd::Constant(1, 3.0));
    EXPECT_TRUE(std::isnan(fit.slope));
    EXPECT_TRUE(std::isnan(fit.intercept));
}

TEST(FitLine, NonFiniteInputIsNaN) {
    Eigen::VectorXd ys(3);
    ys << 1.0, std::numeric_limits<double>::quiet_NaN(), 3.0;
    EXPECT_TRUE(std::isnan(fit_line(ys).slope));
}

// ─── Configuration ────────────────────────────────────────────────────────────

TEST(LinearRegressionConfig, PeriodNeedsTwoPoints) {
    EXPECT_FALSE(LinearRegression(1).validate());
    EXPECT_TRUE(LinearRegression(2).validate());
    EXPECT_FALSE(LinearRegression(256).validate());

    LinearRegression lr;
    EXPECT_FALSE(lr.set("period", "1"));
    ASSERT_TRUE(lr.set("period", "2"));
    ASSERT_TRUE(lr.set("source", "ohlc4"));
    EXPECT_EQ(lr, LinearRegression(2, Source::OHLC4));
    EXPECT_EQ(lr.size(), (Arity{2, 1}));
}

TEST(LinearRegressionInit, NonFiniteSeedIsIncompatible) {
    Candle seed = fixtures::bar(1.0);
    seed.volume = std::numeric_limits<double>::infinity();
    auto instance = LinearRegression(4, Source::Volume).init(seed);
    ASSERT_FALSE(instance.has_value());
    EXPECT_EQ(instance.error().kind, ErrorKind::IncompatibleSeed);
}

// ─── Values ───────────────────────────────────────────────────────────────────

TEST(LinearRegressionValues, SlopeAndFittedValueOfFullWindow) {
    auto results = LinearRegression(4).over(fixtures::bars({0, 1, 2, 3, 4, 5}));
    ASSERT_TRUE(results.has_value());
    ASSERT_EQ(results->size(), 6u);
    // Last window is {2, 3, 4, 5}.
    EXPECT_NEAR(results->back().value(0), 1.0, kTol);
    EXPECT_NEAR(results->back().value(1), 5.0, kTol);
}

TEST(LinearRegressionValues, FirstResultIsFlat) {
    auto results = LinearRegression(3).over(fixtures::bars({7, 8}));
    ASSERT_TRUE(results.has_value());
    EXPECT_NEAR((*results)[0].value(0), 0.0, kTol);
    EXPECT_NEAR((*results)[0].value(1), 7.0, kTol);
}

TEST(LinearRegressionValues, NonFiniteInputYieldsNaNUntilFlushed) {
    auto instance = LinearRegression(2).init(fixtures::bar(1.0));
    ASSERT_TRUE(instance.has_value());

    Candle bad = fixtures::bar(1.0);
    bad.close = std::numeric_limits<double>::quiet_NaN();
    const IndicatorResult r = instance->next(bad);
    EXPECT_TRUE(std::isnan(r.value(0)));
    EXPECT_TRUE(r.signal(0).is_none());

    (void)instance->next(fixtures::bar(2.0));
    const IndicatorResult clean = instance->next(fixtures::bar(3.0));
    EXPECT_NEAR(clean.value(0), 1.0, kTol);
}

// ─── Signals ──────────────────────────────────────────────────────────────────

TEST(LinearRegressionSignals, SlopeReversals) {
    auto results = LinearRegression(3).over(fixtures::bars({5, 5, 6, 7, 6, 5, 4}));
    ASSERT_TRUE(results.has_value());
    EXPECT_TRUE((*results)[0].signal(0).is_none());  // flat
    EXPECT_TRUE((*results)[1].signal(0).is_none());
    EXPECT_TRUE((*results)[2].signal(0).is_buy());   // slope turns positive
    EXPECT_TRUE((*results)[3].signal(0).is_none());
    // Window {6, 7, 6} is flat; {7, 6, 5} turns negative.
    EXPECT_TRUE((*results)[4].signal(0).is_none());
    EXPECT_TRUE((*results)[5].signal(0).is_sell());
    EXPECT_TRUE((*results)[6].signal(0).is_none());
}
