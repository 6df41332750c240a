/**
 * @file  prop_round_number_band.cpp
 * @brief Property: ∀ price ≥ 1: every round-number level lies within the
 *        ±20% band, is positive, unique, and ranked by pull
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_round_number_band
 *
 * Mathematical basis:
 *   Levels are multiples of the tier intervals in [0.8·P, 1.2·P].  Pull is
 *   (base + roundness bonus) · exp(−5·|L − P| / P), capped at 1, so every
 *   pull lies in (0, 1] and the magnetic center, a pull-weighted mean of
 *   levels inside the band, lies inside the band as well.
 */

#include <rapidcheck.h>
#include <cmath>
#include <set>

#include "pfv/round_numbers.hpp"

using namespace pfv;
using namespace pfv::levels;

int main() {
    rc::check(
        "round_number_band: levels inside band, unique, ranked; center inside band",
        [] {
            const double price = *rc::gen::inRange(100, 200000) / 100.0;
            const auto r = RoundNumberAnalyzer::analyze(price);

            RC_ASSERT(!r.levels.empty());
            std::set<double> seen;
            for (std::size_t i = 0; i < r.levels.size(); ++i) {
                const auto& l = r.levels[i];
                RC_ASSERT(l.price > 0.0);
                RC_ASSERT(l.price >= price * 0.8 - 1e-9);
                RC_ASSERT(l.price <= price * 1.2 + 1e-9);
                RC_ASSERT(l.magnetic_pull > 0.0);
                RC_ASSERT(l.magnetic_pull <= 1.0);
                RC_ASSERT(seen.insert(l.price).second);
                if (i > 0) RC_ASSERT(r.levels[i - 1].magnetic_pull >= l.magnetic_pull);
            }

            RC_ASSERT(r.magnetic_center >= price * 0.8 - 1e-9);
            RC_ASSERT(r.magnetic_center <= price * 1.2 + 1e-9);
        }
    );

    return 0;
}
