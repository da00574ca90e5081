#pragma once

/// @file include/tacore/dynamic.hpp
/// @brief Type-erased indicator interfaces and the generic bridge to them.
///
/// # Module: Dynamic Dispatch
///
/// ## Responsibility
/// Let a host hold indicators of different concrete kinds in one collection,
/// knowing only the candle type:
///
/// ```cpp
/// std::vector<BoxedConfig<Candle>> configs;
/// configs.push_back(make_dynamic<Candle>(SimpleMovingAverage{3}));
/// configs.push_back(make_dynamic<Candle>(PriceChannel{}));
/// for (const auto& cfg : configs) {
///     auto results = cfg->over(candles);
/// }
/// ```
///
/// ## Bridge
/// `ConfigAdapter<T, C>` is the single generic implementation of
/// `DynIndicatorConfig<T>` for every `C` satisfying `Dispatchable<C, T>`;
/// `InstanceAdapter<T, I>` does the same for Instances. No per-indicator
/// adapter code exists.
///
/// ## Ownership
/// The static `init` and `over` consume their configuration while the dynamic
/// ones only borrow it, so the adapter copies the held configuration at
/// exactly those two entry points. `next` and Instance `over` delegate
/// without copying.
///
/// ## Guarantees
/// - Results are identical to the static path on an equal configuration
/// - The held configuration is never modified by `init` or `over`
/// - Errors pass through unchanged

#include "tacore/error.hpp"
#include "tacore/indicator.hpp"
#include "tacore/types.hpp"

#include <concepts>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace tacore::indicator {

// ─── Bounds ───────────────────────────────────────────────────────────────────

/// An owning object type: not a reference, pointer or const type, and movable
/// into a heap box. Only the outer type is checked; a member that points or
/// views into memory owned elsewhere is the author's responsibility.
template <typename X>
concept SelfContained =
    std::is_object_v<X> && !std::is_pointer_v<X> &&
    !std::is_const_v<X> && std::is_nothrow_destructible_v<X> &&
    std::move_constructible<X>;

/// Bound under which a Configuration is bridged to `DynIndicatorConfig<T>`:
/// duplicable, with a self-contained Configuration and Instance.
template <typename C, typename T>
concept Dispatchable =
    IndicatorConfig<C, T> && std::copyable<C> && SelfContained<C> &&
    SelfContained<typename C::Instance>;

// ─── DynIndicatorInstance ─────────────────────────────────────────────────────

/// Dynamically dispatched Instance over candles of type `T`.
template <OHLCV T>
class DynIndicatorInstance {
public:
    virtual ~DynIndicatorInstance() = default;

    /// Evaluate one candle.
    [[nodiscard]] virtual IndicatorResult next(const T& candle) = 0;

    /// Evaluate every candle of `inputs` in order. Never fails.
    [[nodiscard]] virtual std::vector<IndicatorResult>
    over(std::span<const T> inputs) = 0;

    [[nodiscard]] virtual Arity size() const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

template <OHLCV T>
using BoxedInstance = std::unique_ptr<DynIndicatorInstance<T>>;

// ─── DynIndicatorConfig ───────────────────────────────────────────────────────

/// Dynamically dispatched Configuration over candles of type `T`.
template <OHLCV T>
class DynIndicatorConfig {
public:
    virtual ~DynIndicatorConfig() = default;

    /// Build a boxed Instance from a copy of this configuration.
    [[nodiscard]] virtual Result<BoxedInstance<T>> init(const T& seed) const = 0;

    /// Evaluate a copy of this configuration over `inputs`.
    [[nodiscard]] virtual Result<std::vector<IndicatorResult>>
    over(std::span<const T> inputs) const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual bool validate() const = 0;

    /// Set one parameter from its text form; unchanged on failure.
    [[nodiscard]] virtual Status set(std::string_view name, std::string_view value) = 0;

    [[nodiscard]] virtual Arity size() const = 0;

    /// Independent copy of this configuration, still type-erased.
    [[nodiscard]] virtual std::unique_ptr<DynIndicatorConfig> clone() const = 0;
};

template <OHLCV T>
using BoxedConfig = std::unique_ptr<DynIndicatorConfig<T>>;

// ─── InstanceAdapter ──────────────────────────────────────────────────────────

/// Generic bridge from a static Instance to `DynIndicatorInstance<T>`.
template <OHLCV T, typename I>
    requires IndicatorInstance<I, T> && SelfContained<I>
class InstanceAdapter final : public DynIndicatorInstance<T> {
public:
    explicit InstanceAdapter(I instance) noexcept(std::is_nothrow_move_constructible_v<I>)
        : instance_(std::move(instance)) {}

    IndicatorResult next(const T& candle) override {
        return instance_.next(candle);
    }

    std::vector<IndicatorResult> over(std::span<const T> inputs) override {
        return instance_.over(inputs);
    }

    Arity size() const override { return instance_.size(); }

    std::string_view name() const override { return instance_.name(); }

    /// The wrapped static Instance.
    [[nodiscard]] const I& instance() const noexcept { return instance_; }

private:
    I instance_;
};

// ─── ConfigAdapter ────────────────────────────────────────────────────────────

/// Generic bridge from a static Configuration to `DynIndicatorConfig<T>`.
template <OHLCV T, typename C>
    requires Dispatchable<C, T>
class ConfigAdapter final : public DynIndicatorConfig<T> {
public:
    using Instance = typename C::Instance;

    explicit ConfigAdapter(C config) noexcept(std::is_nothrow_move_constructible_v<C>)
        : config_(std::move(config)) {}

    Result<BoxedInstance<T>> init(const T& seed) const override {
        C copy = config_;
        auto instance = std::move(copy).init(seed);
        if (!instance) {
            return std::move(instance).error();
        }
        return BoxedInstance<T>(
            std::make_unique<InstanceAdapter<T, Instance>>(std::move(instance).value()));
    }

    Result<std::vector<IndicatorResult>> over(std::span<const T> inputs) const override {
        C copy = config_;
        return std::move(copy).over(inputs);
    }

    std::string_view name() const override { return config_.name(); }

    bool validate() const override { return config_.validate(); }

    Status set(std::string_view name, std::string_view value) override {
        return config_.set(name, value);
    }

    Arity size() const override { return config_.size(); }

    std::unique_ptr<DynIndicatorConfig<T>> clone() const override {
        return std::make_unique<ConfigAdapter>(config_);
    }

    /// The wrapped static Configuration.
    [[nodiscard]] const C& config() const noexcept { return config_; }

private:
    C config_;
};

// ─── Boxing ───────────────────────────────────────────────────────────────────

/// Box any dispatchable Configuration behind `DynIndicatorConfig<T>`.
template <OHLCV T, typename C>
    requires Dispatchable<std::remove_cvref_t<C>, T>
[[nodiscard]] BoxedConfig<T> make_dynamic(C&& config) {
    return std::make_unique<ConfigAdapter<T, std::remove_cvref_t<C>>>(
        std::forward<C>(config));
}

/// Box an already-initialized static Instance behind `DynIndicatorInstance<T>`.
template <OHLCV T, typename I>
    requires IndicatorInstance<std::remove_cvref_t<I>, T> &&
             SelfContained<std::remove_cvref_t<I>>
[[nodiscard]] BoxedInstance<T> make_dynamic_instance(I&& instance) {
    return std::make_unique<InstanceAdapter<T, std::remove_cvref_t<I>>>(
        std::forward<I>(instance));
}

} // namespace tacore::indicator
