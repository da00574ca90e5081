#pragma once

/// @file include/tacore/indicators.hpp
/// @brief Reference indicators and the registry that knows all of them.

#include "tacore/indicators/linear_regression.hpp"
#include "tacore/indicators/price_channel.hpp"
#include "tacore/indicators/simple_moving_average.hpp"
#include "tacore/registry.hpp"

namespace tacore::indicators {

/// Registry holding every reference indicator under its `NAME`.
template <OHLCV T>
[[nodiscard]] IndicatorRegistry<T> make_default_registry() {
    IndicatorRegistry<T> registry;
    registry.template add<SimpleMovingAverage>()
            .template add<PriceChannel>()
            .template add<LinearRegression>();
    return registry;
}

} // namespace tacore::indicators
