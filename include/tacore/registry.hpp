#pragma once

/// @file include/tacore/registry.hpp
/// @brief Name → factory registry and text-driven indicator configuration.
///
/// # Module: Registry
///
/// ## Responsibility
/// Build type-erased configurations from text so that the indicator kinds a
/// host runs need not be known at compile time:
///
/// ```
/// # strategy.txt
/// SMA    period=3 source=close
/// PC     period=20 zone=0.1
/// LINREG period=14
/// ```
///
/// Each line names a registered indicator (case-insensitive) followed by
/// `key=value` assignments applied through the indicator's `set`.
///
/// ## Guarantees
/// - Unknown indicator names fail with `InvalidParameter`
/// - The first failing assignment is returned unchanged; no partially
///   configured indicator is handed out
/// - A configuration rejected by `validate()` is an `InvalidParameter` error

#include "tacore/dynamic.hpp"
#include "tacore/error.hpp"
#include "tacore/parameters.hpp"
#include "tacore/types.hpp"

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tacore {

// ─── Description parsing ──────────────────────────────────────────────────────

/// One `key=value` pair of an indicator description.
struct Assignment {
    std::string_view key;
    std::string_view value;
};

/// Tokenized `"<NAME> key=value ..."` description.
struct Description {
    std::string_view        indicator;
    std::vector<Assignment> assignments;
};

/// Split a description into its indicator name and assignments.
///
/// # Returns
/// `InvalidParameter` if the description is empty or a token after the name
/// has no `=` or an empty key.
[[nodiscard]] Result<Description> parse_description(std::string_view text);

/// A non-blank, non-comment line of a strategy text with its 1-based number.
struct StrategyLine {
    std::size_t      number;
    std::string_view text;
};

/// Lines of `text` that carry a description. `#` starts a comment.
[[nodiscard]] std::vector<StrategyLine> strategy_lines(std::string_view text);

/// Prefix an error message with its line number, keeping the kind.
[[nodiscard]] Error at_line(std::size_t number, Error error);

// ─── IndicatorRegistry ────────────────────────────────────────────────────────

/// Registry of indicator kinds available to text-driven configuration.
template <OHLCV T>
class IndicatorRegistry {
public:
    using Factory = std::function<indicator::BoxedConfig<T>()>;

    /// Register a factory under `name`; a later registration with the same
    /// name replaces the earlier one.
    IndicatorRegistry& add(std::string name, Factory factory) {
        for (auto& entry : entries_) {
            if (iequals(entry.name, name)) {
                entry.factory = std::move(factory);
                return *this;
            }
        }
        entries_.push_back(Entry{.name = std::move(name), .factory = std::move(factory)});
        return *this;
    }

    /// Register the default configuration of `C` under `C::NAME`.
    template <typename C>
        requires indicator::Dispatchable<C, T> && std::default_initializable<C>
    IndicatorRegistry& add() {
        return add(std::string(C::NAME), [] { return indicator::make_dynamic<T>(C{}); });
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return find(name) != nullptr;
    }

    /// Registered names in registration order.
    [[nodiscard]] std::vector<std::string_view> names() const {
        std::vector<std::string_view> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) {
            out.emplace_back(entry.name);
        }
        return out;
    }

    /// Default configuration of the indicator called `name`.
    [[nodiscard]] Result<indicator::BoxedConfig<T>> create(std::string_view name) const {
        const Entry* entry = find(name);
        if (entry == nullptr) {
            return Error{
                .kind    = ErrorKind::InvalidParameter,
                .message = fmt::format("unknown indicator '{}'", name),
            };
        }
        return entry->factory();
    }

    /// Build a configuration from a `"<NAME> key=value ..."` description.
    [[nodiscard]] Result<indicator::BoxedConfig<T>>
    configure(std::string_view description) const {
        auto parsed = parse_description(description);
        if (!parsed) {
            return std::move(parsed).error();
        }

        auto config = create(parsed->indicator);
        if (!config) {
            return config;
        }

        for (const auto& assignment : parsed->assignments) {
            auto status = (*config)->set(assignment.key, assignment.value);
            if (!status) {
                return std::move(status).error();
            }
        }

        if (!(*config)->validate()) {
            return Error::invalid_configuration((*config)->name());
        }
        return config;
    }

    /// Build one configuration per description line of `text`.
    ///
    /// # Returns
    /// All configurations in line order, or the first error with its message
    /// prefixed by the line number.
    [[nodiscard]] Result<std::vector<indicator::BoxedConfig<T>>>
    parse_strategy(std::string_view text) const {
        std::vector<indicator::BoxedConfig<T>> configs;
        for (const auto& line : strategy_lines(text)) {
            auto config = configure(line.text);
            if (!config) {
                return at_line(line.number, std::move(config).error());
            }
            configs.push_back(std::move(config).value());
        }
        return configs;
    }

private:
    struct Entry {
        std::string name;
        Factory     factory;
    };

    [[nodiscard]] const Entry* find(std::string_view name) const noexcept {
        for (const auto& entry : entries_) {
            if (iequals(entry.name, name)) {
                return &entry;
            }
        }
        return nullptr;
    }

    std::vector<Entry> entries_;
};

} // namespace tacore
