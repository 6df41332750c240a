/**
 * @file  prop_magnetic_dedup.cpp
 * @brief Property: ∀ snapshots: collected magnetic levels carry distinct
 *        display prices, are ranked by strength, and respect the filter
 *        and the level cap
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_magnetic_dedup
 *
 * Mathematical basis:
 *   Levels from the technical and round-number analyzers are merged on
 *   round_price(price); of two entries at one price the stronger survives.
 *   Without include_all every survivor has strength ≥ 0.3.  The output is
 *   sorted by non-increasing strength and holds at most max_levels entries.
 */

#include <rapidcheck.h>
#include <set>

#include "pfv/fair_value.hpp"

using namespace pfv;
using namespace pfv::levels;

namespace {

std::optional<double> maybe_level(double price) {
    if (!*rc::gen::arbitrary<bool>()) return std::nullopt;
    return price * (*rc::gen::inRange(80, 121)) / 100.0;
}

}  // namespace

int main() {
    rc::check(
        "magnetic_dedup: unique prices, ranked, filtered, capped",
        [] {
            const double price = *rc::gen::inRange(100, 100000) / 100.0;
            const TechnicalData t{
                .current_price       = price,
                .ma20                = maybe_level(price),
                .ma50                = maybe_level(price),
                .ma200               = maybe_level(price),
                .fifty_two_week_high = price * (*rc::gen::inRange(100, 160)) / 100.0,
                .fifty_two_week_low  = price * (*rc::gen::inRange(40, 101)) / 100.0,
                .recent_swing_high   = maybe_level(price),
                .recent_swing_low    = maybe_level(price),
                .previous_close      = maybe_level(price),
                .vwap                = maybe_level(price),
            };
            const bool include_all = *rc::gen::arbitrary<bool>();
            const auto max_levels  = static_cast<std::size_t>(*rc::gen::inRange(1, 20));

            const auto technical = TechnicalLevelAnalyzer::analyze(t);
            const auto rounds    = RoundNumberAnalyzer::analyze(price);
            const auto levels = FairValueComposer::collect_magnetic_levels(
                {}, technical.levels, rounds.levels, price, include_all, max_levels);

            RC_ASSERT(levels.size() <= max_levels);
            std::set<double> seen;
            for (std::size_t i = 0; i < levels.size(); ++i) {
                RC_ASSERT(seen.insert(levels[i].price).second);
                if (!include_all) RC_ASSERT(levels[i].strength >= 0.3);
                if (i > 0) RC_ASSERT(levels[i - 1].strength >= levels[i].strength);
            }
        }
    );

    return 0;
}
