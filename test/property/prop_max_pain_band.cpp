/**
 * @file  prop_max_pain_band.cpp
 * @brief Property: ∀ chains, ∀ spot > 0: the max-pain price is a listed
 *        strike inside [0.6·spot, 1.4·spot] or spot itself
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_max_pain_band
 *
 * Mathematical basis:
 *   Candidates are the strikes with positive OI inside the band.  With no
 *   candidate the calculator falls back to spot.  In either case
 *
 *     0.6·spot ≤ max_pain ≤ 1.4·spot
 *
 *   and the reported pain at max pain is no greater than the pain at any
 *   other candidate strike.
 */

#include <rapidcheck.h>
#include <algorithm>
#include <cmath>
#include <vector>

#include "pfv/max_pain.hpp"

using namespace pfv;
using namespace pfv::options;

namespace {

OptionsExpiration random_chain() {
    OptionsExpiration e;
    e.dte = *rc::gen::inRange(0, 60);
    const int n = *rc::gen::inRange(0, 40);
    for (int i = 0; i < n; ++i) {
        const double strike = *rc::gen::inRange(1, 400) * 0.5;
        const double oi     = *rc::gen::inRange(0, 50000);
        if (*rc::gen::arbitrary<bool>()) {
            e.calls.push_back({.strike = strike, .open_interest = oi});
            e.total_call_oi += oi;
        } else {
            e.puts.push_back({.strike = strike, .open_interest = oi});
            e.total_put_oi += oi;
        }
    }
    return e;
}

bool is_listed(const OptionsExpiration& e, double strike) {
    const auto at = [strike](const OptionContract& c) {
        return c.strike == strike && c.open_interest > 0.0;
    };
    return std::any_of(e.calls.begin(), e.calls.end(), at) ||
           std::any_of(e.puts.begin(), e.puts.end(), at);
}

}  // namespace

int main() {
    // ── Property 1: result stays inside the strike band ──────────────────────
    rc::check(
        "max_pain_band: result is spot or a listed strike within the band",
        [] {
            const auto chain = random_chain();
            const double spot = *rc::gen::inRange(5, 200) * 1.0;
            const auto r = MaxPainCalculator::calculate(chain, spot);

            RC_ASSERT(std::isfinite(r.price));
            RC_ASSERT(r.price >= spot * 0.6);
            RC_ASSERT(r.price <= spot * 1.4);
            RC_ASSERT(r.price == spot || is_listed(chain, r.price));
            RC_ASSERT(r.confidence >= 0.0);
            RC_ASSERT(r.confidence <= 1.0);
            RC_ASSERT(r.total_pain >= 0.0);
            RC_ASSERT(std::abs(r.call_pain + r.put_pain - r.total_pain) <= 1e-6 * (1.0 + r.total_pain));
        }
    );

    // ── Property 2: unusable spot falls back without scanning ───────────────
    rc::check(
        "max_pain_band: non-positive spot returns spot with zero confidence",
        [] {
            const auto chain = random_chain();
            const double spot = -*rc::gen::inRange(0, 100) * 1.0;
            const auto r = MaxPainCalculator::calculate(chain, spot);
            RC_ASSERT(r.price == spot);
            RC_ASSERT(r.confidence == 0.0);
        }
    );

    return 0;
}
