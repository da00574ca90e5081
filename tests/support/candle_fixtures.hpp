#pragma once

/// @file tests/support/candle_fixtures.hpp
/// @brief Candle builders shared by the GoogleTest suites.

#include "tacore/types.hpp"

#include <cstddef>
#include <initializer_list>
#include <vector>

namespace tacore::fixtures {

/// A candle whose open/high/low sit at a fixed spread around `close`.
inline Candle bar(double close, double timestamp = 0.0, double spread = 1.0) {
    return Candle{
        .timestamp = timestamp,
        .open      = close,
        .high      = close + spread,
        .low       = close - spread,
        .close     = close,
        .volume    = 1000.0,
    };
}

/// One bar per close, timestamps 1, 2, ...
inline std::vector<Candle> bars(std::initializer_list<double> closes,
                                double spread = 1.0) {
    std::vector<Candle> out;
    out.reserve(closes.size());
    double t = 1.0;
    for (double c : closes) {
        out.push_back(bar(c, t, spread));
        t += 1.0;
    }
    return out;
}

/// `n` bars drifting by `drift` per bar from `start`.
inline std::vector<Candle> trending(std::size_t n, double start = 100.0,
                                   double drift = 1.0) {
    std::vector<Candle> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(bar(start + drift * static_cast<double>(i),
                          static_cast<double>(i + 1)));
    }
    return out;
}

} // namespace tacore::fixtures
