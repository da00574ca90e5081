/// @file src/indicators/linear_regression.cpp
/// @brief Rolling least-squares fit via Eigen.

#include "tacore/indicators/linear_regression.hpp"

#include <cmath>
#include <limits>

namespace tacore::indicators {

// ─── Configuration ────────────────────────────────────────────────────────────

LinearRegression::LinearRegression(std::size_t period, Source source) noexcept
    : period(period), source(source) {}

bool LinearRegression::validate() const noexcept {
    return period >= constants::MIN_REGRESSION_PERIOD &&
           period <= constants::MAX_PERIOD;
}

const ParameterSet<LinearRegression>& LinearRegression::parameters() {
    static const auto params = ParameterSet<LinearRegression>{}
        .field("period", &LinearRegression::period,
               in_range<std::size_t>(constants::MIN_REGRESSION_PERIOD,
                                     constants::MAX_PERIOD))
        .field("source", &LinearRegression::source);
    return params;
}

Status LinearRegression::set(std::string_view name, std::string_view value) {
    return parameters().apply(*this, name, value);
}

Arity LinearRegression::size() const noexcept {
    return Arity{.values = 2, .signals = 1};
}

// ─── fit_line ─────────────────────────────────────────────────────────────────

LineFit fit_line(const Eigen::Ref<const Eigen::VectorXd>& ys) noexcept {
    constexpr double nan = std::numeric_limits<double>::quiet_NaN();
    const Eigen::Index n = ys.size();
    if (n < 2 || !ys.allFinite()) {
        return LineFit{.intercept = nan, .slope = nan};
    }

    Eigen::MatrixXd design(n, 2);
    design.col(0).setOnes();
    design.col(1) = Eigen::VectorXd::LinSpaced(n, 0.0, static_cast<double>(n - 1));

    const Eigen::Vector2d coef = design.colPivHouseholderQr().solve(ys);
    if (!coef.allFinite()) {
        return LineFit{.intercept = nan, .slope = nan};
    }
    return LineFit{.intercept = coef(0), .slope = coef(1)};
}

// ─── Instance ─────────────────────────────────────────────────────────────────

Result<LinearRegressionInstance>
LinearRegressionInstance::create(LinearRegression config, const Candle& seed) {
    const double value = source_value(seed, config.source);
    if (!std::isfinite(value)) {
        return Error::incompatible_seed(LinearRegression::NAME,
                                        "source value is not finite");
    }
    return LinearRegressionInstance(std::move(config), value);
}

LinearRegressionInstance::LinearRegressionInstance(LinearRegression config,
                                                   double seed_value)
    : config_(std::move(config))
    , window_(Eigen::VectorXd::Constant(static_cast<Eigen::Index>(config_.period),
                                        seed_value))
    , ordered_(window_)
{}

IndicatorResult LinearRegressionInstance::step(const Candle& candle) noexcept {
    const Eigen::Index n = window_.size();
    window_(head_) = source_value(candle, config_.source);
    head_ = (head_ + 1) % n;

    // Unroll the ring buffer: oldest element sits at head_.
    const Eigen::Index tail = n - head_;
    ordered_.head(tail) = window_.segment(head_, tail);
    ordered_.tail(head_) = window_.head(head_);

    const LineFit fit = fit_line(ordered_);

    Action signal = Action::none();
    if (std::isfinite(fit.slope)) {
        int sign = 0;
        if (fit.slope > constants::FLOAT_EPSILON)       sign = 1;
        else if (fit.slope < -constants::FLOAT_EPSILON) sign = -1;

        if (sign > 0 && last_sign_ <= 0)      signal = Action::buy();
        else if (sign < 0 && last_sign_ >= 0) signal = Action::sell();
        last_sign_ = sign;
    } else {
        last_sign_ = 0;
    }

    const double fitted = fit.intercept + fit.slope * static_cast<double>(n - 1);
    const double values[]  = {fit.slope, fitted};
    const Action signals[] = {signal};
    return IndicatorResult(values, signals);
}

} // namespace tacore::indicators
