#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/tacore/constants.hpp
/// @brief Shared bounds and defaults for the tacore indicator framework.

namespace tacore::constants {

// ─── Result Shape ─────────────────────────────────────────────────────────────

/// Maximum number of raw values an IndicatorResult can carry.
static constexpr std::size_t MAX_RESULT_VALUES = 4;

/// Maximum number of signals an IndicatorResult can carry.
static constexpr std::size_t MAX_RESULT_SIGNALS = 4;

// ─── Parameter Bounds ─────────────────────────────────────────────────────────

/// Largest window any reference indicator accepts.
static constexpr std::size_t MAX_PERIOD = 255;

/// Default window for the reference indicators.
static constexpr std::size_t DEFAULT_PERIOD = 20;

/// Minimum window for a least-squares line (two points define a line).
static constexpr std::size_t MIN_REGRESSION_PERIOD = 2;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace tacore::constants
