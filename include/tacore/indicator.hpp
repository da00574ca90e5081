#pragma once

/// @file include/tacore/indicator.hpp
/// @brief Static indicator capabilities: Configuration and Instance.
///
/// # Module: Static Capabilities
///
/// ## Responsibility
/// Describe, at compile time, what an indicator must provide so that it can be
/// evaluated with zero dispatch overhead:
///
///   Configuration ──validate()──► init(seed) ──► Instance ──next()/over()──► IndicatorResult
///
/// A **Configuration** is a value object holding one indicator kind's
/// parameters. It is consumed by `init` (rvalue-qualified), which produces an
/// **Instance**: the streaming state advanced one candle at a time.
///
/// ## Writing an indicator
/// ```cpp
/// struct MyConfig : ConfigBase<MyConfig> {
///     using Instance = MyInstance;
///     static constexpr std::string_view NAME = "MY";
///     bool   validate() const noexcept;
///     Status set(std::string_view name, std::string_view value);
///     Arity  size() const noexcept;
///     template <OHLCV T> Result<MyInstance> initialize(const T& seed) &&;
/// };
/// ```
/// `ConfigBase` supplies `name()`, the validating `init()` and the batch
/// `over()`. `InstanceBase` supplies the batch `over()`, `name()` and `size()`
/// of the Instance.
///
/// ## Guarantees
/// - `init` never runs `initialize` on a configuration `validate()` rejects
/// - `over` on an empty input returns an empty vector without calling `init`
/// - `next` and Instance `over` never fail; numeric edge cases yield NaN

#include "tacore/error.hpp"
#include "tacore/types.hpp"

#include <concepts>
#include <ranges>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace tacore::indicator {

// ─── Instance capability ──────────────────────────────────────────────────────

/// Streaming state of one indicator over candles of type `T`.
///
/// Contract:
///   - `next(candle)` advances the state by one candle and never fails
///   - `over(inputs)` equals calling `next` on every element in order
///   - `size()` is the arity of every result produced
///   - `config()` is the Configuration the Instance was built from
template <typename I, typename T>
concept IndicatorInstance =
    OHLCV<T> &&
    requires(I& instance, const I& cinstance, const T& candle,
             std::span<const T> inputs) {
        typename I::Config;
        { instance.next(candle) } -> std::same_as<IndicatorResult>;
        { instance.over(inputs) } -> std::same_as<std::vector<IndicatorResult>>;
        { cinstance.size() } -> std::same_as<Arity>;
        { cinstance.name() } -> std::convertible_to<std::string_view>;
        { cinstance.config() } -> std::same_as<const typename I::Config&>;
    };

// ─── Configuration capability ─────────────────────────────────────────────────

/// Parameters of one indicator kind, able to seed an Instance from candles of
/// type `T`.
template <typename C, typename T>
concept IndicatorConfig =
    OHLCV<T> &&
    requires(C& config, const C& cconfig, const T& seed,
             std::span<const T> inputs,
             std::string_view name, std::string_view value) {
        typename C::Instance;
        { C::NAME } -> std::convertible_to<std::string_view>;
        { cconfig.validate() } -> std::same_as<bool>;
        { config.set(name, value) } -> std::same_as<Status>;
        { cconfig.size() } -> std::same_as<Arity>;
        { cconfig.name() } -> std::convertible_to<std::string_view>;
        { std::move(config).init(seed) } -> std::same_as<Result<typename C::Instance>>;
        { std::move(config).over(inputs) }
            -> std::same_as<Result<std::vector<IndicatorResult>>>;
    } &&
    IndicatorInstance<typename C::Instance, T>;

// ─── ConfigBase ───────────────────────────────────────────────────────────────

/// CRTP mixin providing the shared behaviour of every Configuration.
template <typename Derived>
class ConfigBase {
public:
    /// Static name of the indicator (`Derived::NAME`).
    [[nodiscard]] std::string_view name() const noexcept { return Derived::NAME; }

    /// Consume the configuration and build the Instance from the first known
    /// candle.
    ///
    /// # Returns
    /// - `InvalidParameter` if `validate()` is false
    /// - otherwise whatever `Derived::initialize(seed)` returns
    template <OHLCV T, typename D = Derived>
    [[nodiscard]] Result<typename D::Instance> init(const T& seed) && {
        D& self = static_cast<D&>(*this);
        if (!self.validate()) {
            return Error::invalid_configuration(D::NAME);
        }
        return std::move(self).initialize(seed);
    }

    /// Consume the configuration and evaluate it over a sequence of candles.
    ///
    /// The Instance is seeded with `inputs[0]` and then fed the whole
    /// sequence, `inputs[0]` included, yielding exactly `inputs.size()`
    /// results. An empty sequence yields an empty vector and `init` is not
    /// called. Errors from `init` are returned unchanged.
    template <OHLCV T>
    [[nodiscard]] Result<std::vector<IndicatorResult>>
    over(std::span<const T> inputs) && {
        if (inputs.empty()) {
            return std::vector<IndicatorResult>{};
        }

        auto instance = std::move(*this).init(inputs.front());
        if (!instance) {
            return std::move(instance).error();
        }
        return instance->over(inputs);
    }

    /// Convenience overload for vectors, arrays and other contiguous ranges.
    template <std::ranges::contiguous_range R>
        requires OHLCV<std::ranges::range_value_t<R>>
    [[nodiscard]] Result<std::vector<IndicatorResult>> over(const R& inputs) && {
        using T = std::ranges::range_value_t<R>;
        return std::move(*this).over(
            std::span<const T>(std::ranges::data(inputs), std::ranges::size(inputs)));
    }

    /// Base-subobject comparison for a derived `operator==(...) = default`.
    /// Only `ConfigBase` itself binds here, so a Configuration that declares
    /// no `==` of its own stays non-comparable.
    template <std::same_as<ConfigBase> B>
    [[nodiscard]] bool operator==(const B&) const noexcept { return true; }

protected:
    ConfigBase() = default;
};

// ─── InstanceBase ─────────────────────────────────────────────────────────────

/// CRTP mixin providing batch evaluation and metadata for an Instance.
///
/// `Derived` must define `Config`, `config()` and a `next(const T&)` template.
template <typename Derived>
class InstanceBase {
public:
    /// Evaluate every candle of `inputs` in order.
    template <OHLCV T>
    [[nodiscard]] std::vector<IndicatorResult> over(std::span<const T> inputs) {
        Derived& self = static_cast<Derived&>(*this);
        std::vector<IndicatorResult> results;
        results.reserve(inputs.size());
        for (const T& candle : inputs) {
            results.push_back(self.next(candle));
        }
        return results;
    }

    template <std::ranges::contiguous_range R>
        requires OHLCV<std::ranges::range_value_t<R>>
    [[nodiscard]] std::vector<IndicatorResult> over(const R& inputs) {
        using T = std::ranges::range_value_t<R>;
        return over(std::span<const T>(std::ranges::data(inputs),
                                       std::ranges::size(inputs)));
    }

    template <typename D = Derived>
    [[nodiscard]] std::string_view name() const noexcept {
        return D::Config::NAME;
    }

    template <typename D = Derived>
    [[nodiscard]] Arity size() const noexcept {
        return static_cast<const D&>(*this).config().size();
    }

protected:
    InstanceBase() = default;
};

} // namespace tacore::indicator
