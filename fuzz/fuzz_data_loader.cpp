/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string.
 *
 * Build:
 *   cmake -DTACORE_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every returned candle passes is_valid().
 *   3. Parsed plus skipped rows never exceed the number of lines.
 *
 * The parser must handle binary garbage, "nan"/"inf" tokens, CRLF endings,
 * comment lines, empty fields, and exponential notation ("1e308").
 */

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tacore/data_loader.hpp"

using namespace tacore;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto candles = DataLoader::parse_csv_string(input);

    // Invariant 2
    for (const auto& c : candles) {
        assert(is_valid(c));
    }

    // Invariant 3
    const auto lines = static_cast<std::size_t>(std::count(input.begin(), input.end(), '\n')) + 1;
    assert(candles.size() + DataLoader::last_skipped() <= lines);

    return 0;
}
