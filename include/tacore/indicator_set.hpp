#pragma once

/// @file include/tacore/indicator_set.hpp
/// @brief A host-side collection of heterogeneous, type-erased indicators.
///
/// # Module: IndicatorSet
///
/// ## Responsibility
/// Drive several indicators of different kinds over the same candles, in
/// batch or one candle at a time:
///
/// ```cpp
/// IndicatorSet<Candle> set;
/// set.add(make_dynamic<Candle>(SimpleMovingAverage{3}));
/// set.add(make_dynamic<Candle>(PriceChannel{10}));
///
/// if (set.start(candles.front())) {
///     for (const auto& c : candles) {
///         auto row = set.push(c);   // one result per indicator
///     }
/// }
/// ```
///
/// ## Guarantees
/// - `over` and `start` are all-or-nothing: the first error aborts and no
///   partial output or partially started state is kept
/// - `push` returns one result per indicator, in insertion order
/// - Single-threaded; the set performs no synchronization

#include "tacore/dynamic.hpp"
#include "tacore/error.hpp"
#include "tacore/types.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace tacore {

/// Behaviour switches of an IndicatorSet.
struct IndicatorSetConfig {
    /// If true, trace initialization and evaluation to stderr.
    bool verbose = false;
};

template <OHLCV T>
class IndicatorSet {
public:
    explicit IndicatorSet(IndicatorSetConfig config = IndicatorSetConfig{})
        : config_(config) {}

    /// Append a configuration. Invalidates a started stream.
    void add(indicator::BoxedConfig<T> config) {
        configs_.push_back(std::move(config));
        instances_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return configs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return configs_.empty(); }

    [[nodiscard]] const indicator::DynIndicatorConfig<T>& at(std::size_t index) const {
        return *configs_.at(index);
    }

    [[nodiscard]] std::vector<std::string_view> names() const {
        std::vector<std::string_view> out;
        out.reserve(configs_.size());
        for (const auto& config : configs_) {
            out.push_back(config->name());
        }
        return out;
    }

    [[nodiscard]] std::vector<Arity> arities() const {
        std::vector<Arity> out;
        out.reserve(configs_.size());
        for (const auto& config : configs_) {
            out.push_back(config->size());
        }
        return out;
    }

    /// Evaluate every configuration over `inputs`.
    ///
    /// # Returns
    /// One result series per configuration (insertion order), or the first
    /// error.
    [[nodiscard]] Result<std::vector<std::vector<IndicatorResult>>>
    over(std::span<const T> inputs) const {
        std::vector<std::vector<IndicatorResult>> series;
        series.reserve(configs_.size());
        for (const auto& config : configs_) {
            auto results = config->over(inputs);
            if (!results) {
                trace("{} failed: {}", config->name(), results.error().to_string());
                return std::move(results).error();
            }
            trace("{} evaluated over {} candles", config->name(), inputs.size());
            series.push_back(std::move(results).value());
        }
        return series;
    }

    /// Initialize one Instance per configuration from `seed`.
    ///
    /// On failure the set stays (or becomes) not started.
    [[nodiscard]] Status start(const T& seed) {
        std::vector<indicator::BoxedInstance<T>> instances;
        instances.reserve(configs_.size());
        for (const auto& config : configs_) {
            auto instance = config->init(seed);
            if (!instance) {
                trace("{} failed to start: {}", config->name(),
                      instance.error().to_string());
                instances_.clear();
                return std::move(instance).error();
            }
            instances.push_back(std::move(instance).value());
        }
        trace("started {} indicators from {}", instances.size(), seed);
        instances_ = std::move(instances);
        return {};
    }

    [[nodiscard]] bool started() const noexcept {
        return !configs_.empty() && instances_.size() == configs_.size();
    }

    /// Feed one candle to every started Instance.
    ///
    /// Returns an empty vector if the set has not been started.
    [[nodiscard]] std::vector<IndicatorResult> push(const T& candle) {
        std::vector<IndicatorResult> row;
        if (!started()) {
            return row;
        }
        row.reserve(instances_.size());
        for (auto& instance : instances_) {
            row.push_back(instance->next(candle));
        }
        return row;
    }

    /// Drop the running Instances; configurations are kept.
    void reset() noexcept { instances_.clear(); }

private:
    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) const {
        if (config_.verbose) {
            fmt::print(stderr, "[indicator_set] {}\n",
                       fmt::format(format, std::forward<Args>(args)...));
        }
    }

    IndicatorSetConfig                       config_;
    std::vector<indicator::BoxedConfig<T>>   configs_;
    std::vector<indicator::BoxedInstance<T>> instances_;
};

} // namespace tacore
