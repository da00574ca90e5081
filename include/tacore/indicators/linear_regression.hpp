#pragma once

/// @file include/tacore/indicators/linear_regression.hpp
/// @brief Rolling least-squares line with a slope-reversal signal.
///
/// # Parameters
///   - `period` ∈ [MIN_REGRESSION_PERIOD, MAX_PERIOD]: window length (default 20)
///   - `source`: series read (default close)
///
/// # Output: arity (2, 1)
///   - value[0]  : slope of the least-squares line through the window, per bar
///   - value[1]  : fitted value of the line at the newest bar
///   - signal[0] : buy when the slope turns positive, sell when it turns
///                 negative
///
/// The fit is solved with Eigen (column-pivoting Householder QR on the n×2
/// design matrix [1, x]). A window holding a non-finite value produces NaN
/// for both values and no signal.

#include "tacore/constants.hpp"
#include "tacore/error.hpp"
#include "tacore/indicator.hpp"
#include "tacore/parameters.hpp"
#include "tacore/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string_view>

namespace tacore::indicators {

class LinearRegressionInstance;

class LinearRegression : public indicator::ConfigBase<LinearRegression> {
public:
    using Instance = LinearRegressionInstance;
    static constexpr std::string_view NAME = "LINREG";

    std::size_t period = constants::DEFAULT_PERIOD;
    Source      source = Source::Close;

    LinearRegression() = default;
    explicit LinearRegression(std::size_t period,
                              Source source = Source::Close) noexcept;

    [[nodiscard]] bool validate() const noexcept;
    [[nodiscard]] Status set(std::string_view name, std::string_view value);
    [[nodiscard]] Arity size() const noexcept;

    [[nodiscard]] static const ParameterSet<LinearRegression>& parameters();

    template <OHLCV T>
    [[nodiscard]] Result<LinearRegressionInstance> initialize(const T& seed) &&;

    bool operator==(const LinearRegression&) const = default;
};

/// Slope and intercept of a least-squares line.
struct LineFit {
    double intercept;
    double slope;
};

/// Fit y = intercept + slope·x with x = 0, 1, …, n−1.
///
/// # Returns
/// NaN coefficients if `ys` has fewer than two points or any value is not
/// finite.
[[nodiscard]] LineFit fit_line(const Eigen::Ref<const Eigen::VectorXd>& ys) noexcept;

class LinearRegressionInstance
    : public indicator::InstanceBase<LinearRegressionInstance> {
public:
    using Config = LinearRegression;

    /// Fails with `IncompatibleSeed` if the seed's source value is not finite.
    [[nodiscard]] static Result<LinearRegressionInstance>
    create(LinearRegression config, const Candle& seed);

    template <OHLCV T>
    [[nodiscard]] IndicatorResult next(const T& candle) {
        return step(to_candle(candle));
    }

    [[nodiscard]] IndicatorResult step(const Candle& candle) noexcept;

    [[nodiscard]] const LinearRegression& config() const noexcept { return config_; }

private:
    LinearRegressionInstance(LinearRegression config, double seed_value);

    LinearRegression config_;
    Eigen::VectorXd  window_;   ///< ring buffer of source values
    Eigen::VectorXd  ordered_;  ///< scratch: window_ oldest → newest
    Eigen::Index     head_ = 0;
    int              last_sign_ = 0;
};

template <OHLCV T>
Result<LinearRegressionInstance> LinearRegression::initialize(const T& seed) && {
    return LinearRegressionInstance::create(std::move(*this), to_candle(seed));
}

} // namespace tacore::indicators
