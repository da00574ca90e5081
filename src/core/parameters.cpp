/// @file src/core/parameters.cpp
/// @brief Non-template text parsing used by ParameterSet.

#include "tacore/parameters.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace tacore {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<bool> parse_bool(std::string_view text) noexcept {
    for (std::string_view yes : {"true", "1", "yes", "on"}) {
        if (iequals(text, yes)) return true;
    }
    for (std::string_view no : {"false", "0", "no", "off"}) {
        if (iequals(text, no)) return false;
    }
    return std::nullopt;
}

std::optional<double> parse_real(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') {
            return std::nullopt;  // "+" alone or "+-x"
        }
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;  // trailing garbage or out of range
    }

    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace tacore
