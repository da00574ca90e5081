#pragma once

/// @file include/tacore/data_loader.hpp
/// @brief CSV loader for OHLCV candles.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files containing OHLCV market data into `std::vector<Candle>`.
/// Malformed or invalid rows are skipped; the loader never crashes on bad
/// input.
///
/// ## Expected CSV Format
/// ```
/// timestamp,open,high,low,close,volume
/// 1,100.0,105.0,99.0,103.0,1000000
/// 2,103.0,107.0,102.0,106.5,1200000
/// ```
/// The first non-comment line is treated as a header and skipped.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load

#include "tacore/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tacore {

class DataLoader {
public:
    /// Load candles from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid data rows
    /// - Parsed candles, skipping any malformed or invalid rows
    [[nodiscard]] static std::optional<std::vector<Candle>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse candles from CSV text. Same format as `load_csv`.
    [[nodiscard]] static std::vector<Candle>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// Number of rows skipped by the most recent parse on this thread.
    [[nodiscard]] static std::size_t last_skipped() noexcept;

private:
    /// Parse one data row. `nullopt` if malformed or the candle is invalid.
    [[nodiscard]] static std::optional<Candle> parse_row(std::string_view line) noexcept;
};

} // namespace tacore
