/**
 * @file  bench/bench_fair_value.cpp
 * @brief Google Benchmark suite for the PFV engine and its analyzers.
 *
 * Benchmarks
 * ----------
 *   BM_MaxPain_Calculate          strikes per chain swept 16 → 1024
 *   BM_GammaWalls_Detect          strikes per chain swept 16 → 1024
 *   BM_MultiExpiry_Analyze        expirations swept 1 → 16
 *   BM_RoundNumbers_Analyze
 *   BM_FairValue_Calculate        full pipeline, expirations swept 1 → 16
 *
 * Build (CMake):
 *   cmake -DPFV_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_fair_value
 *   ./build/bench_fair_value --benchmark_format=json
 *
 * Throughput units: items/second (strikes or expirations processed).
 */

#include "benchmark/benchmark.h"

#include "pfv/fair_value.hpp"
#include "pfv/gamma_walls.hpp"
#include "pfv/max_pain.hpp"
#include "pfv/multi_expiry.hpp"
#include "pfv/round_numbers.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// One expiration with `n` strikes centred on 100, OI peaking at the money.
static pfv::OptionsExpiration make_chain(std::size_t n, int dte) {
    pfv::OptionsExpiration e;
    e.expiration = pfv::Date{std::chrono::year{2024}, std::chrono::month{3}, std::chrono::day{15}}
                 + std::chrono::days{dte};
    e.dte = dte;
    const double step = 80.0 / static_cast<double>(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double strike = 60.0 + step * static_cast<double>(i);
        const double oi = 1000.0 + 20000.0 * std::exp(-std::abs(strike - 100.0) / 10.0);
        e.calls.push_back({.strike = strike, .open_interest = oi * (strike > 100.0 ? 1.5 : 1.0)});
        e.puts.push_back({.strike = strike, .open_interest = oi * (strike < 100.0 ? 1.5 : 1.0)});
        e.total_call_oi += e.calls.back().open_interest;
        e.total_put_oi  += e.puts.back().open_interest;
    }
    return e;
}

static std::vector<pfv::OptionsExpiration> make_expirations(std::size_t count) {
    std::vector<pfv::OptionsExpiration> out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(make_chain(128, static_cast<int>(i * 3)));
    }
    return out;
}

static pfv::TechnicalData make_technical() {
    return pfv::TechnicalData{
        .current_price       = 100.0,
        .ma20                = 101.0,
        .ma50                = 98.5,
        .ma200               = 92.0,
        .fifty_two_week_high = 118.0,
        .fifty_two_week_low  = 81.0,
        .vwap                = 99.7,
    };
}

// ── Analyzers ──────────────────────────────────────────────────────────────────

static void BM_MaxPain_Calculate(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto chain = make_chain(n, 7);
    for (auto _ : state) {
        auto r = pfv::options::MaxPainCalculator::calculate(chain, 100.0);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_MaxPain_Calculate)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_GammaWalls_Detect(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto chain = make_chain(n, 7);
    for (auto _ : state) {
        auto r = pfv::options::GammaWallDetector::detect(chain, 100.0);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_GammaWalls_Detect)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

static void BM_MultiExpiry_Analyze(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto exps = make_expirations(count);
    for (auto _ : state) {
        auto r = pfv::options::MultiExpiryAggregator::analyze(exps, 100.0);
        benchmark::DoNotOptimize(r.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(count));
}
BENCHMARK(BM_MultiExpiry_Analyze)->RangeMultiplier(2)->Range(1, 16)->Unit(benchmark::kMicrosecond);

static void BM_RoundNumbers_Analyze(benchmark::State& state) {
    for (auto _ : state) {
        auto r = pfv::levels::RoundNumberAnalyzer::analyze(188.61);
        benchmark::DoNotOptimize(r.levels.data());
    }
}
BENCHMARK(BM_RoundNumbers_Analyze)->Unit(benchmark::kNanosecond);

// ── Full pipeline ──────────────────────────────────────────────────────────────

static void BM_FairValue_Calculate(benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const pfv::PFVInput input{
        .ticker      = "BENCH",
        .technical   = make_technical(),
        .expirations = make_expirations(count),
    };
    const pfv::FairValueEngine engine;
    const auto now = std::chrono::system_clock::now();
    for (auto _ : state) {
        auto r = engine.calculate_at(input, {}, now);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(count));
}
BENCHMARK(BM_FairValue_Calculate)->RangeMultiplier(2)->Range(1, 16)->Unit(benchmark::kMicrosecond);
