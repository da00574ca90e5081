/// @file src/main.cpp
/// @brief tacore CLI entry point.
///
/// Usage:
///   tacore --list                                  List available indicators
///   tacore --run <csv_file> <description>...       Evaluate indicators over CSV candles
///   tacore --random <count> <description>...       Evaluate over synthetic candles
///   tacore --strategy <csv_file> <strategy_file>   One indicator description per line
///   tacore --help                                  Print usage
///
/// A description is an indicator name followed by key=value parameters,
/// e.g. "SMA period=3 source=close".

#include "tacore/data_loader.hpp"
#include "tacore/indicator_set.hpp"
#include "tacore/indicators.hpp"
#include "tacore/random_candles.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using tacore::Candle;
using tacore::IndicatorSet;
using tacore::IndicatorSetConfig;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  tacore --list                                 List available indicators\n"
        "  tacore --run <csv_file> <description>...      Evaluate over CSV candles\n"
        "  tacore --random <count> <description>...      Evaluate over synthetic candles\n"
        "  tacore --strategy <csv_file> <strategy_file>  Descriptions from a file\n"
        "  tacore --help                                 Show this help\n"
        "\n"
        "Description: <NAME> key=value ...   e.g. \"SMA period=3 source=close\"\n"
        "Set TACORE_VERBOSE=1 to trace evaluation on stderr.\n"
        "\n"
        "CSV format (header required):\n"
        "  timestamp,open,high,low,close,volume\n"
    );
}

IndicatorSetConfig set_config_from_env() {
    IndicatorSetConfig config;
    if (const char* verbose = std::getenv("TACORE_VERBOSE")) {
        config.verbose = tacore::parse_bool(verbose).value_or(false);
    }
    return config;
}

int list_indicators() {
    const auto registry = tacore::indicators::make_default_registry<Candle>();
    for (const auto name : registry.names()) {
        auto config = registry.create(name);
        if (!config) {
            continue;
        }
        const auto arity = (*config)->size();
        fmt::print("{:<8} values={} signals={}\n", name, arity.values, arity.signals);
    }
    return 0;
}

/// Evaluate every indicator of `set` over `candles` and print one line per
/// candle per indicator.
/// Returns 0 on success, 1 on error.
int evaluate(const IndicatorSet<Candle>& set, const std::vector<Candle>& candles) {
    auto series = set.over(candles);
    if (!series) {
        fmt::print(stderr, "Error: {}\n", series.error().to_string());
        return 1;
    }

    const auto names = set.names();
    for (std::size_t bar = 0; bar < candles.size(); ++bar) {
        for (std::size_t k = 0; k < names.size(); ++k) {
            fmt::print("Bar {:4d}  {:<8} {}\n", bar, names[k], (*series)[k][bar]);
        }
    }

    fmt::print("Processed {} candles with {} indicators.\n", candles.size(), set.size());
    return 0;
}

/// Build an IndicatorSet from command-line descriptions.
bool add_descriptions(IndicatorSet<Candle>& set, int first, int argc, char* argv[]) {
    const auto registry = tacore::indicators::make_default_registry<Candle>();
    for (int i = first; i < argc; ++i) {
        auto config = registry.configure(argv[i]);
        if (!config) {
            fmt::print(stderr, "Error: '{}': {}\n", argv[i], config.error().to_string());
            return false;
        }
        set.add(std::move(config).value());
    }
    return true;
}

std::optional<std::vector<Candle>> load_candles(const std::string& filepath) {
    auto candles = tacore::DataLoader::load_csv(filepath);
    if (!candles) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return std::nullopt;
    }
    if (tacore::DataLoader::last_skipped() > 0) {
        fmt::print(stderr, "Skipped {} malformed rows in '{}'\n",
                   tacore::DataLoader::last_skipped(), filepath);
    }
    if (candles->empty()) {
        fmt::print(stderr, "Error: no valid candles loaded from '{}'\n", filepath);
        return std::nullopt;
    }
    return candles;
}

int run_csv(int argc, char* argv[]) {
    if (argc < 4) {
        fmt::print(stderr, "Error: --run requires a CSV file and at least one description\n");
        print_usage();
        return 1;
    }

    IndicatorSet<Candle> set(set_config_from_env());
    if (!add_descriptions(set, 3, argc, argv)) {
        return 1;
    }

    const auto candles = load_candles(argv[2]);
    if (!candles) {
        return 1;
    }
    fmt::print("Loaded {} candles from '{}'\n", candles->size(), argv[2]);
    return evaluate(set, *candles);
}

int run_random(int argc, char* argv[]) {
    if (argc < 4) {
        fmt::print(stderr, "Error: --random requires a count and at least one description\n");
        print_usage();
        return 1;
    }

    const std::string_view count_text(argv[2]);
    std::size_t count = 0;
    const auto [ptr, ec] = std::from_chars(count_text.data(),
                                           count_text.data() + count_text.size(), count);
    if (ec != std::errc{} || ptr != count_text.data() + count_text.size() || count == 0) {
        fmt::print(stderr, "Error: invalid candle count '{}'\n", count_text);
        return 1;
    }

    IndicatorSet<Candle> set(set_config_from_env());
    if (!add_descriptions(set, 3, argc, argv)) {
        return 1;
    }

    tacore::RandomCandles generator;
    return evaluate(set, generator.take(count));
}

int run_strategy(int argc, char* argv[]) {
    if (argc < 4) {
        fmt::print(stderr, "Error: --strategy requires a CSV file and a strategy file\n");
        print_usage();
        return 1;
    }

    std::ifstream file(argv[3]);
    if (!file.is_open()) {
        fmt::print(stderr, "Error: cannot open strategy file '{}'\n", argv[3]);
        return 1;
    }
    std::ostringstream text;
    text << file.rdbuf();

    const auto registry = tacore::indicators::make_default_registry<Candle>();
    auto configs = registry.parse_strategy(text.str());
    if (!configs) {
        fmt::print(stderr, "Error: '{}': {}\n", argv[3], configs.error().to_string());
        return 1;
    }
    if (configs->empty()) {
        fmt::print(stderr, "Error: '{}' contains no indicator descriptions\n", argv[3]);
        return 1;
    }

    IndicatorSet<Candle> set(set_config_from_env());
    for (auto& config : *configs) {
        set.add(std::move(config));
    }

    const auto candles = load_candles(argv[2]);
    if (!candles) {
        return 1;
    }
    return evaluate(set, *candles);
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }
    if (mode == "--list") {
        return list_indicators();
    }
    if (mode == "--run") {
        return run_csv(argc, argv);
    }
    if (mode == "--random") {
        return run_random(argc, argv);
    }
    if (mode == "--strategy") {
        return run_strategy(argc, argv);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
