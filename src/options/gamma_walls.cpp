/// @file src/options/gamma_walls.cpp
/// @brief GammaWallDetector implementation.

#include "pfv/gamma_walls.hpp"

#include "pfv/weighted.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace pfv::options {

namespace {

struct StrikeAggregate {
    double strike  = 0.0;
    double call_oi = 0.0;
    double put_oi  = 0.0;
};

[[nodiscard]] bool in_band(const OptionContract& c, double lo, double hi) noexcept {
    return std::isfinite(c.strike) && std::isfinite(c.open_interest) &&
           c.strike >= lo && c.strike <= hi && c.open_interest > 0.0;
}

/// Upper median: element floor(n/2) of the sorted positive values; 0 if none.
[[nodiscard]] double upper_median(std::vector<double> values) {
    std::erase_if(values, [](double v) { return !(v > 0.0); });
    if (values.empty()) return 0.0;
    const auto mid = values.begin() + static_cast<std::ptrdiff_t>(values.size() / 2);
    std::nth_element(values.begin(), mid, values.end());
    return *mid;
}

[[nodiscard]] std::optional<GammaWall>
strongest(const std::vector<GammaWall>& walls, bool GammaWall::*side) {
    // `walls` is already ranked, so the first match is the strongest.
    for (const auto& w : walls) {
        if (w.*side) return w;
    }
    return std::nullopt;
}

}  // namespace

// ─── GammaWallDetector::detect ────────────────────────────────────────────────

GammaWallsResult GammaWallDetector::detect(const OptionsExpiration& expiration,
                                           double current_price,
                                           double threshold_multiplier) {
    GammaWallConfig config;
    config.threshold_multiplier = threshold_multiplier;
    return detect(expiration, current_price, config);
}

GammaWallsResult GammaWallDetector::detect(const OptionsExpiration& expiration,
                                           double current_price,
                                           const GammaWallConfig& config) {
    GammaWallsResult result;
    result.center = current_price;
    if (!std::isfinite(current_price) || current_price <= 0.0) return result;

    const double lo = current_price * config.band_low;
    const double hi = current_price * config.band_high;

    std::map<double, StrikeAggregate> by_strike;
    for (const auto& c : expiration.calls) {
        if (!in_band(c, lo, hi)) continue;
        auto& agg = by_strike[c.strike];
        agg.strike = c.strike;
        agg.call_oi += c.open_interest;
    }
    for (const auto& p : expiration.puts) {
        if (!in_band(p, lo, hi)) continue;
        auto& agg = by_strike[p.strike];
        agg.strike = p.strike;
        agg.put_oi += p.open_interest;
    }
    if (by_strike.empty()) return result;

    std::vector<double> call_ois;
    std::vector<double> put_ois;
    call_ois.reserve(by_strike.size());
    put_ois.reserve(by_strike.size());
    for (const auto& [strike, agg] : by_strike) {
        call_ois.push_back(agg.call_oi);
        put_ois.push_back(agg.put_oi);
    }
    const double median_call = upper_median(std::move(call_ois));
    const double median_put  = upper_median(std::move(put_ois));

    const double threshold = config.threshold_multiplier;
    for (const auto& [strike, agg] : by_strike) {
        const double call_strength = median_call > 0.0 ? agg.call_oi / median_call : 0.0;
        const double put_strength  = median_put  > 0.0 ? agg.put_oi  / median_put  : 0.0;
        const bool call_hit = call_strength >= threshold;
        const bool put_hit  = put_strength  >= threshold;

        if (call_hit && strike > current_price) {
            result.walls.push_back({
                .strike            = strike,
                .type              = WallType::CallWall,
                .open_interest     = agg.call_oi,
                .relative_strength = call_strength,
                .is_support        = false,
                .is_resistance     = true,
            });
        }

        if (put_hit && strike < current_price) {
            result.walls.push_back({
                .strike            = strike,
                .type              = WallType::PutWall,
                .open_interest     = agg.put_oi,
                .relative_strength = put_strength,
                .is_support        = true,
                .is_resistance     = false,
            });
        }

        // Recorded in addition to the one-sided walls above.
        if (call_hit && put_hit) {
            result.walls.push_back({
                .strike            = strike,
                .type              = WallType::Combined,
                .open_interest     = agg.call_oi + agg.put_oi,
                .relative_strength = (call_strength + put_strength) / 2.0,
                .is_support        = strike < current_price,
                .is_resistance     = strike > current_price,
            });
        }
    }

    std::stable_sort(result.walls.begin(), result.walls.end(),
                     [](const GammaWall& a, const GammaWall& b) {
                         return a.relative_strength > b.relative_strength;
                     });

    result.strongest_support    = strongest(result.walls, &GammaWall::is_support);
    result.strongest_resistance = strongest(result.walls, &GammaWall::is_resistance);
    result.center = center_of(result.walls, current_price);
    return result;
}

// ─── GammaWallDetector::center_of ─────────────────────────────────────────────

double GammaWallDetector::center_of(const std::vector<GammaWall>& walls,
                                    double fallback) {
    std::vector<double> strikes;
    std::vector<double> weights;
    strikes.reserve(walls.size());
    weights.reserve(walls.size());
    for (const auto& w : walls) {
        strikes.push_back(w.strike);
        weights.push_back(w.open_interest * w.relative_strength);
    }
    return core::weighted_average(strikes, weights, fallback);
}

}  // namespace pfv::options
