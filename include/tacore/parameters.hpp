#pragma once

/// @file include/tacore/parameters.hpp
/// @brief Name-keyed, typed parameter setters for text-driven configuration.
///
/// # Module: Parameters
///
/// ## Responsibility
/// Implement `set(name, value)` without runtime reflection. Each indicator
/// kind registers its fields once:
///
/// ```cpp
/// const ParameterSet<SimpleMovingAverage>& SimpleMovingAverage::parameters() {
///     static const auto params = ParameterSet<SimpleMovingAverage>{}
///         .field("period", &SimpleMovingAverage::period, in_range<std::size_t>(1, 255))
///         .field("source", &SimpleMovingAverage::source);
///     return params;
/// }
/// ```
///
/// ## Guarantees
/// - The value is parsed and checked against the field's domain before the
///   field is written; a failed `apply` leaves the configuration unchanged
/// - Unknown names and bad values fail with `InvalidParameter`

#include "tacore/error.hpp"
#include "tacore/types.hpp"

#include <charconv>
#include <cmath>
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace tacore {

// ─── Text parsing ─────────────────────────────────────────────────────────────

/// Parse `true/false/1/0/yes/no/on/off` (case-insensitive).
[[nodiscard]] std::optional<bool> parse_bool(std::string_view text) noexcept;

/// Parse a finite floating-point number; the whole text must be consumed.
[[nodiscard]] std::optional<double> parse_real(std::string_view text) noexcept;

/// Strip leading and trailing ASCII whitespace.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

/// ASCII case-insensitive comparison.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

/// Parse a parameter value of type `V` from text.
///
/// Supported: integral types (decimal, range-checked), `double`, `bool`,
/// `Source`. Surrounding whitespace is ignored.
template <typename V>
[[nodiscard]] std::optional<V> parse_value(std::string_view text) noexcept {
    text = trim(text);
    if constexpr (std::same_as<V, bool>) {
        return parse_bool(text);
    } else if constexpr (std::same_as<V, Source>) {
        return parse_source(text);
    } else if constexpr (std::integral<V>) {
        if (text.empty()) return std::nullopt;
        if (text.front() == '+') {
            text.remove_prefix(1);
            if (text.empty() || text.front() == '-') return std::nullopt;
        }
        V value{};
        const char* first = text.data();
        const char* last  = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return value;
    } else if constexpr (std::floating_point<V>) {
        const auto value = parse_real(text);
        if (!value) return std::nullopt;
        return static_cast<V>(*value);
    } else {
        static_assert(!sizeof(V), "parse_value: unsupported parameter type");
    }
}

// ─── Domain predicates ────────────────────────────────────────────────────────

/// Accept values in the closed interval [lo, hi].
template <typename V>
[[nodiscard]] auto in_range(V lo, V hi) {
    return [lo, hi](const V& value) { return value >= lo && value <= hi; };
}

/// Accept values in the half-open interval [lo, hi).
template <typename V>
[[nodiscard]] auto in_half_open(V lo, V hi) {
    return [lo, hi](const V& value) { return value >= lo && value < hi; };
}

// ─── ParameterSet ─────────────────────────────────────────────────────────────

/// Registry of named, typed setters for configuration type `C`.
template <typename C>
class ParameterSet {
public:
    using Setter = std::function<Status(C&, std::string_view)>;

    /// Register `member` under `name`, accepting every parseable value.
    template <typename V>
    ParameterSet&& field(std::string name, V C::*member) && {
        return std::move(*this).field(std::move(name), member,
                                      [](const V&) { return true; });
    }

    /// Register `member` under `name`; values failing `accept` are rejected.
    template <typename V, typename Accept>
        requires std::predicate<Accept, const V&>
    ParameterSet&& field(std::string name, V C::*member, Accept accept) && {
        entries_.push_back(Entry{
            .name   = name,
            .setter = [name, member, accept = std::move(accept)](
                          C& config, std::string_view text) -> Status {
                const auto parsed = parse_value<V>(text);
                if (!parsed || !accept(*parsed)) {
                    return Error::invalid_parameter(name, text);
                }
                config.*member = *parsed;
                return {};
            },
        });
        return std::move(*this);
    }

    /// Set parameter `name` of `config` from `value`.
    [[nodiscard]] Status apply(C& config, std::string_view name,
                               std::string_view value) const {
        for (const auto& entry : entries_) {
            if (entry.name == name) {
                return entry.setter(config, value);
            }
        }
        return Error::unknown_parameter(name);
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        for (const auto& entry : entries_) {
            if (entry.name == name) return true;
        }
        return false;
    }

    /// Parameter names in registration order.
    [[nodiscard]] std::vector<std::string_view> names() const {
        std::vector<std::string_view> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) {
            out.emplace_back(entry.name);
        }
        return out;
    }

private:
    struct Entry {
        std::string name;
        Setter      setter;
    };

    std::vector<Entry> entries_;
};

} // namespace tacore
