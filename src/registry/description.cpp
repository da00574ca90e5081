/// @file src/registry/description.cpp
/// @brief Tokenizer for indicator descriptions and strategy texts.

#include "tacore/registry.hpp"

#include <fmt/format.h>

namespace tacore {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

/// Split on runs of whitespace.
std::vector<std::string_view> tokenize(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find_first_not_of(WHITESPACE, pos);
        if (start == std::string_view::npos) break;
        auto end = text.find_first_of(WHITESPACE, start);
        if (end == std::string_view::npos) end = text.size();
        tokens.push_back(text.substr(start, end - start));
        pos = end;
    }
    return tokens;
}

} // anonymous namespace

// ─── parse_description ────────────────────────────────────────────────────────

Result<Description> parse_description(std::string_view text) {
    const auto tokens = tokenize(text);
    if (tokens.empty()) {
        return Error{
            .kind    = ErrorKind::InvalidParameter,
            .message = "empty indicator description",
        };
    }

    Description description{.indicator = tokens.front(), .assignments = {}};
    description.assignments.reserve(tokens.size() - 1);

    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const std::string_view token = tokens[i];
        const auto eq = token.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return Error{
                .kind    = ErrorKind::InvalidParameter,
                .message = fmt::format("expected key=value, got '{}'", token),
            };
        }
        description.assignments.push_back(Assignment{
            .key   = token.substr(0, eq),
            .value = token.substr(eq + 1),
        });
    }

    return description;
}

// ─── strategy_lines ───────────────────────────────────────────────────────────

std::vector<StrategyLine> strategy_lines(std::string_view text) {
    std::vector<StrategyLine> lines;
    std::size_t number = 0;
    std::size_t pos    = 0;

    while (pos <= text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(pos, end - pos);
        ++number;

        if (const auto hash = line.find('#'); hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (!line.empty()) {
            lines.push_back(StrategyLine{.number = number, .text = line});
        }

        if (end == text.size()) break;
        pos = end + 1;
    }

    return lines;
}

Error at_line(std::size_t number, Error error) {
    error.message = fmt::format("line {}: {}", number, error.message);
    return error;
}

} // namespace tacore
