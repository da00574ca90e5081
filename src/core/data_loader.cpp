/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for OHLCV candles.

#include "tacore/data_loader.hpp"
#include "tacore/parameters.hpp"

#include <array>
#include <fstream>
#include <sstream>

namespace tacore {

namespace {

thread_local std::size_t skipped_rows = 0;

} // anonymous namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<Candle> DataLoader::parse_row(std::string_view line) noexcept {
    std::array<double, 6> fields{};
    std::size_t count = 0;
    std::size_t pos   = 0;

    while (pos <= line.size()) {
        auto comma = line.find(',', pos);
        if (comma == std::string_view::npos) comma = line.size();

        if (count == fields.size()) {
            return std::nullopt;  // too many columns
        }
        const auto value = parse_real(line.substr(pos, comma - pos));
        if (!value) {
            return std::nullopt;  // empty, non-numeric, or non-finite token
        }
        fields[count++] = *value;

        if (comma == line.size()) break;
        pos = comma + 1;
    }

    if (count != fields.size()) {
        return std::nullopt;
    }

    const Candle candle{
        .timestamp = fields[0],
        .open      = fields[1],
        .high      = fields[2],
        .low       = fields[3],
        .close     = fields[4],
        .volume    = fields[5],
    };

    if (!is_valid(candle)) {
        return std::nullopt;
    }
    return candle;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<Candle> DataLoader::parse_csv_string(std::string_view csv_content) noexcept {
    std::vector<Candle> candles;
    skipped_rows = 0;
    bool header_skipped = false;
    std::size_t pos = 0;

    while (pos < csv_content.size()) {
        auto end = csv_content.find('\n', pos);
        if (end == std::string_view::npos) end = csv_content.size();
        std::string_view line = csv_content.substr(pos, end - pos);
        pos = end + 1;

        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        // Skip blank lines and comment lines.
        if (trim(line).empty() || line.front() == '#') {
            continue;
        }

        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        if (auto candle = parse_row(line)) {
            candles.push_back(*candle);
        } else {
            ++skipped_rows;
        }
    }

    return candles;
}

std::size_t DataLoader::last_skipped() noexcept {
    return skipped_rows;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<Candle>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

} // namespace tacore
