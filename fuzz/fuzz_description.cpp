/**
 * @file  fuzz_description.cpp
 * @brief libFuzzer target for text-driven configuration (registry + set).
 *
 * Build:
 *   cmake -DTACORE_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_description
 *
 * Run for 60 seconds:
 *   ./fuzz_description -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. parse_strategy either fails with InvalidParameter whose message starts
 *      with "line N: ", or returns configurations that all pass validate().
 *   3. Every returned configuration evaluates a short candle series without
 *      error, and each result has the configuration's arity.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "tacore/indicators.hpp"
#include "tacore/random_candles.hpp"

using namespace tacore;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    static const auto registry = indicators::make_default_registry<Candle>();
    static const std::vector<Candle> candles = RandomCandles{}.take(32);

    auto configs = registry.parse_strategy(input);
    if (!configs) {
        // Invariant 2: failures are parameter errors tagged with a line.
        assert(configs.error().kind == ErrorKind::InvalidParameter);
        assert(configs.error().message.rfind("line ", 0) == 0);
        return 0;
    }

    for (const auto& config : *configs) {
        assert(config->validate());

        // Invariant 3: a validated reference configuration always evaluates.
        auto results = config->over(candles);
        assert(results.has_value());
        assert(results->size() == candles.size());
        for (const auto& r : *results) {
            assert(r.size() == config->size());
        }
    }

    return 0;
}
