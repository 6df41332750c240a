/**
 * @file  fuzz_fair_value.cpp
 * @brief libFuzzer target for the full FairValueEngine pipeline
 *
 * Build:
 *   cmake -DPFV_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_fair_value
 *
 * Run for 60 seconds:
 *   ./fuzz_fair_value -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a result is returned:
 *      a. fair_value and deviation_pct are finite
 *      b. confidence_score ∈ [0, 1]
 *      c. profile weights sum to 1 within 1e-9
 *      d. magnetic levels ≤ max_magnetic_levels, sorted by strength
 *      e. expiration weights sum to 1 when any expiration survives
 *   3. If validate_technical_data fails, no result is returned; otherwise
 *      a result always is.
 *
 * Fuzzer strategy:
 *   The input is consumed as raw doubles: the first eight fill the
 *   technical snapshot (NaN, ±inf, negatives and zero included), the rest
 *   become (strike, call OI, put OI) triples of one expiration.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "pfv/fair_value.hpp"

using namespace pfv;

namespace {

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool has_double() const noexcept { return pos_ + sizeof(double) <= size_; }

    double next_double() noexcept {
        double v = 0.0;
        if (!has_double()) return v;
        std::memcpy(&v, data_ + pos_, sizeof(double));
        pos_ += sizeof(double);
        return v;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    ByteReader in(data, size);

    PFVInput input;
    input.ticker = "FUZZ";
    input.technical.current_price       = in.next_double();
    input.technical.fifty_two_week_high = in.next_double();
    input.technical.fifty_two_week_low  = in.next_double();
    input.technical.ma20                = in.next_double();
    input.technical.ma50                = in.next_double();
    input.technical.ma200               = in.next_double();
    input.technical.vwap                = in.next_double();
    input.technical.recent_swing_low    = in.next_double();

    OptionsExpiration exp;
    exp.expiration = Date{std::chrono::year{2024}, std::chrono::month{3}, std::chrono::day{15}};
    exp.dte = 7;
    while (in.has_double()) {
        const double strike  = in.next_double();
        const double call_oi = in.next_double();
        const double put_oi  = in.next_double();
        exp.calls.push_back({.strike = strike, .open_interest = call_oi});
        exp.puts.push_back({.strike = strike, .open_interest = put_oi});
        exp.total_call_oi += call_oi;
        exp.total_put_oi  += put_oi;
    }
    if (!exp.calls.empty()) input.expirations.push_back(std::move(exp));

    const FairValueEngine engine;
    const PFVOptions opts;
    const auto result = engine.calculate(input, opts);

    // Invariant 3
    if (!validate_technical_data(input.technical)) {
        assert(!result.has_value());
        return 0;
    }
    assert(result.has_value());

    // Invariant 2a
    assert(std::isfinite(result->fair_value));
    assert(std::isfinite(result->deviation_pct));

    // Invariant 2b
    assert(result->confidence_score >= 0.0);
    assert(result->confidence_score <= 1.0);

    // Invariant 2c
    assert(std::abs(result->profile.weights.sum() - 1.0) < 1e-9);

    // Invariant 2d
    assert(result->magnetic_levels.size() <= opts.max_magnetic_levels);
    for (std::size_t i = 1; i < result->magnetic_levels.size(); ++i) {
        assert(result->magnetic_levels[i - 1].strength >= result->magnetic_levels[i].strength);
    }

    // Invariant 2e
    if (!result->expiration_analysis.empty()) {
        double total = 0.0;
        for (const auto& a : result->expiration_analysis) total += a.weight;
        assert(std::abs(total - 1.0) < 1e-9);
    }

    return 0;
}
