/// @file src/main.cpp
/// @brief pfv CLI entry point.
///
/// Usage:
///   pfv --ticker T --technical FILE [--chain FILE] [--profile P]
///       [--min-dte N] [--max-dte N] [--all-levels] [--max-levels N]
///       [--ai] [--verbose]
///   pfv --help

#include "pfv/data_loader.hpp"
#include "pfv/fair_value.hpp"
#include "pfv/report.hpp"

#include <fmt/core.h>

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  pfv --ticker T --technical FILE [options]\n"
        "  pfv --help\n"
        "\n"
        "Options:\n"
        "  --chain FILE       Option chain CSV\n"
        "  --profile P        BLUE_CHIP | MEME_RETAIL | ETF | LOW_FLOAT | DEFAULT\n"
        "  --min-dte N        Shortest expiration considered (default 0)\n"
        "  --max-dte N        Longest expiration considered (default 60)\n"
        "  --all-levels       Keep magnetic levels weaker than 0.3\n"
        "  --max-levels N     Magnetic levels reported (default 15)\n"
        "  --ai               Print the language-model context block\n"
        "  --verbose          Diagnostics on stderr\n"
        "\n"
        "Technical CSV (header required, one data row):\n"
        "  current_price,ma20,ma50,ma200,fifty_two_week_high,fifty_two_week_low,vwap\n"
        "Chain CSV (header required):\n"
        "  expiration,dte,type,strike,open_interest,volume[,implied_volatility,delta,gamma]\n"
    );
}

struct CliArgs {
    std::string ticker;
    std::string technical_path;
    std::optional<std::string> chain_path;
    std::optional<pfv::ProfileType> profile;
    pfv::PFVOptions options;
    bool ai = false;
};

[[nodiscard]] std::optional<int> parse_int(std::string_view text) noexcept {
    int value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return value;
}

/// Parse argv into `CliArgs`.  Prints the problem and returns nullopt on
/// any malformed or missing argument.
[[nodiscard]] std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        const std::string_view flag(argv[i]);

        if (flag == "--all-levels") { args.options.include_all_levels = true; continue; }
        if (flag == "--ai")         { args.ai = true; continue; }
        if (flag == "--verbose")    { args.options.verbose = true; continue; }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string_view value(argv[++i]);

        if (flag == "--ticker") {
            args.ticker = std::string(value);
        } else if (flag == "--technical") {
            args.technical_path = std::string(value);
        } else if (flag == "--chain") {
            args.chain_path = std::string(value);
        } else if (flag == "--profile") {
            args.profile = pfv::profile_type_from_string(value);
            if (!args.profile) {
                fmt::print(stderr, "Error: unknown profile '{}'\n", value);
                return std::nullopt;
            }
        } else if (flag == "--min-dte" || flag == "--max-dte" || flag == "--max-levels") {
            const auto n = parse_int(value);
            if (!n || *n < 0) {
                fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n",
                           flag, value);
                return std::nullopt;
            }
            if (flag == "--min-dte") {
                args.options.min_dte = *n;
            } else if (flag == "--max-dte") {
                args.options.max_dte = *n;
            } else {
                args.options.max_magnetic_levels = static_cast<std::size_t>(*n);
            }
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }

    if (args.ticker.empty() || args.technical_path.empty()) {
        fmt::print(stderr, "Error: --ticker and --technical are required\n");
        return std::nullopt;
    }
    return args;
}

/// Load inputs, run the engine and print the report.
/// Returns 0 on success, 1 on error.
int run(const CliArgs& args) {
    auto technical = pfv::core::DataLoader::load_technical(args.technical_path);
    if (!technical) {
        fmt::print(stderr, "Error: cannot read technical snapshot '{}'\n", args.technical_path);
        return 1;
    }

    pfv::PFVInput input{
        .ticker           = args.ticker,
        .technical        = *technical,
        .expirations      = {},
        .profile_override = args.profile,
    };

    if (args.chain_path) {
        auto chain = pfv::core::DataLoader::load_chain(*args.chain_path);
        if (!chain) {
            fmt::print(stderr, "Error: cannot open option chain '{}'\n", *args.chain_path);
            return 1;
        }
        input.expirations = std::move(*chain);
    }

    const pfv::FairValueEngine engine;
    const auto result = engine.calculate(input, args.options);
    if (!result) {
        fmt::print(stderr,
            "Error: '{}' needs a positive current price\n",
            args.technical_path);
        return 1;
    }

    fmt::print("{}\n", args.ai ? result->ai_context : pfv::report::format_pfv_result(*result));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }
    return run(*args);
}
