/// @file src/core/error.cpp
/// @brief Error factories and formatting.

#include "tacore/error.hpp"

#include <fmt/format.h>

namespace tacore {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidParameter: return "InvalidParameter";
        case ErrorKind::IncompatibleSeed: return "IncompatibleSeed";
        case ErrorKind::Domain:           return "Domain";
    }
    return "Unknown";
}

Error Error::invalid_parameter(std::string_view name, std::string_view value) {
    return Error{
        .kind    = ErrorKind::InvalidParameter,
        .message = fmt::format("invalid value '{}' for parameter '{}'", value, name),
    };
}

Error Error::unknown_parameter(std::string_view name) {
    return Error{
        .kind    = ErrorKind::InvalidParameter,
        .message = fmt::format("unknown parameter '{}'", name),
    };
}

Error Error::invalid_configuration(std::string_view indicator) {
    return Error{
        .kind    = ErrorKind::InvalidParameter,
        .message = fmt::format("{}: configuration rejected by validate()", indicator),
    };
}

Error Error::incompatible_seed(std::string_view indicator, std::string_view reason) {
    return Error{
        .kind    = ErrorKind::IncompatibleSeed,
        .message = fmt::format("{}: cannot seed from candle: {}", indicator, reason),
    };
}

Error Error::domain(std::string_view indicator, std::string_view reason) {
    return Error{
        .kind    = ErrorKind::Domain,
        .message = fmt::format("{}: {}", indicator, reason),
    };
}

std::string Error::to_string() const {
    return fmt::format("{}: {}", tacore::to_string(kind), message);
}

} // namespace tacore
