#pragma once

/// @file include/tacore/error.hpp
/// @brief Error taxonomy and the Result/Status return channel.
///
/// # Module: Errors
///
/// ## Responsibility
/// Report why a configuration call failed without throwing. Every fallible
/// operation of the core returns either `Result<T>` (a value or an `Error`) or
/// `Status` (nothing or an `Error`).
///
/// ## Taxonomy
///   - `InvalidParameter`: unknown parameter name, unparsable or out-of-domain
///     value, or a configuration `validate()` rejects
///   - `IncompatibleSeed`: the parameters cannot be seeded from this candle
///   - `Domain`: indicator-specific failure, opaque to the core
///
/// ## Guarantees
/// - An `Error` never carries a partial result
/// - Errors pass through the dynamic adapter unchanged

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tacore {

// ─── ErrorKind ────────────────────────────────────────────────────────────────

enum class ErrorKind : std::uint8_t {
    InvalidParameter,
    IncompatibleSeed,
    Domain,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// ─── Error ────────────────────────────────────────────────────────────────────

/// A discriminated failure with a human-readable message.
struct Error {
    ErrorKind   kind;
    std::string message;

    /// `value` could not be parsed or is outside the domain of `name`.
    [[nodiscard]] static Error invalid_parameter(std::string_view name,
                                                 std::string_view value);

    /// No parameter called `name` exists.
    [[nodiscard]] static Error unknown_parameter(std::string_view name);

    /// The parameter set of `indicator` does not pass `validate()`.
    [[nodiscard]] static Error invalid_configuration(std::string_view indicator);

    [[nodiscard]] static Error incompatible_seed(std::string_view indicator,
                                                 std::string_view reason);

    [[nodiscard]] static Error domain(std::string_view indicator,
                                      std::string_view reason);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Error&) const = default;
};

// ─── Result ───────────────────────────────────────────────────────────────────

/// Either a `T` or an `Error`.
///
/// Accessing the value of a failed result is a contract violation
/// (`std::bad_variant_access`); check `has_value()` first.
template <typename T>
class [[nodiscard]] Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : state_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & { return std::get<0>(state_); }
    [[nodiscard]] const T& value() const& { return std::get<0>(state_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(state_)); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const Error& error() const& { return std::get<1>(state_); }
    [[nodiscard]] Error&& error() && { return std::get<1>(std::move(state_)); }

    template <typename U>
    [[nodiscard]] T value_or(U&& fallback) const& {
        return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, Error> state_;
};

/// Success with no payload, or an `Error`.
template <>
class [[nodiscard]] Result<void> {
public:
    Result() noexcept = default;
    Result(Error error) : error_(std::move(error)) {}

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const Error& error() const& { return *error_; }
    [[nodiscard]] Error&& error() && { return std::move(*error_); }

private:
    std::optional<Error> error_;
};

using Status = Result<void>;

} // namespace tacore

template <>
struct fmt::formatter<tacore::Error> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const tacore::Error& e, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", e.to_string());
    }
};
