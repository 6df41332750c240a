/// @file src/options/max_pain.cpp
/// @brief MaxPainCalculator implementation.

#include "pfv/max_pain.hpp"

#include "pfv/calendar.hpp"
#include "pfv/weighted.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <set>

namespace pfv::options {

namespace {

/// OI per strike for one side of the chain, restricted to the band.
using StrikeBook = std::map<double, double>;

void accumulate_side(const std::vector<OptionContract>& contracts,
                     double min_strike, double max_strike,
                     StrikeBook& book, double& total) {
    for (const auto& c : contracts) {
        if (!std::isfinite(c.strike) || !std::isfinite(c.open_interest)) continue;
        if (c.strike < min_strike || c.strike > max_strike) continue;
        if (c.open_interest <= 0.0) continue;
        book[c.strike] += c.open_interest;
        total += c.open_interest;
    }
}

[[nodiscard]] double oi_near(const StrikeBook& book, double center, double window) noexcept {
    double sum = 0.0;
    for (const auto& [strike, oi] : book) {
        if (std::abs(strike - center) <= window) sum += oi;
    }
    return sum;
}

}  // namespace

// ─── MaxPainCalculator::calculate ─────────────────────────────────────────────

MaxPainResult MaxPainCalculator::calculate(const OptionsExpiration& expiration,
                                           double current_price,
                                           const MaxPainConfig& config) noexcept {
    MaxPainResult result{
        .price      = current_price,
        .expiration = expiration.expiration,
        .dte        = expiration.dte,
    };
    if (!std::isfinite(current_price) || current_price <= 0.0) return result;

    const double min_strike = current_price * config.band_low;
    const double max_strike = current_price * config.band_high;

    StrikeBook calls;
    StrikeBook puts;
    double total_oi = 0.0;
    accumulate_side(expiration.calls, min_strike, max_strike, calls, total_oi);
    accumulate_side(expiration.puts,  min_strike, max_strike, puts,  total_oi);

    // Distinct candidate strikes, ascending.
    std::set<double> candidates;
    for (const auto& [strike, oi] : calls) candidates.insert(strike);
    for (const auto& [strike, oi] : puts)  candidates.insert(strike);
    if (candidates.empty()) return result;

    double best_pain = std::numeric_limits<double>::infinity();
    for (const double settle : candidates) {
        double call_pain = 0.0;
        double put_pain  = 0.0;

        // Calls finish in the money below the settlement price.
        for (const auto& [strike, oi] : calls) {
            if (settle > strike) {
                call_pain += (settle - strike) * oi * constants::CONTRACT_MULTIPLIER;
            }
        }
        // Puts finish in the money above it.
        for (const auto& [strike, oi] : puts) {
            if (settle < strike) {
                put_pain += (strike - settle) * oi * constants::CONTRACT_MULTIPLIER;
            }
        }

        const double total = call_pain + put_pain;
        if (total < best_pain) {   // strict: ties keep the lower strike
            best_pain         = total;
            result.price      = settle;
            result.total_pain = total;
            result.call_pain  = call_pain;
            result.put_pain   = put_pain;
        }
    }

    if (total_oi <= 0.0) return result;

    const double window = result.price * config.concentration_window;
    const double nearby = oi_near(calls, result.price, window) +
                          oi_near(puts,  result.price, window);

    const double oi_term = std::min(config.oi_cap, total_oi / config.oi_scale);
    const double concentration_term =
        std::min(config.concentration_cap, nearby / total_oi * config.concentration_scale);
    const double density_term =
        std::min(config.density_cap,
                 static_cast<double>(candidates.size()) / config.density_divisor);

    result.confidence = std::clamp(oi_term + concentration_term + density_term, 0.0, 1.0);
    return result;
}

// ─── MaxPainCalculator::calculate_weighted ────────────────────────────────────

WeightedMaxPain MaxPainCalculator::calculate_weighted(
        std::span<const OptionsExpiration> expirations,
        double current_price,
        const MaxPainConfig& config) {
    WeightedMaxPain out;
    out.weighted_price = current_price;
    if (expirations.empty()) return out;

    std::vector<double> raw;
    raw.reserve(expirations.size());
    out.results.reserve(expirations.size());

    for (const auto& exp : expirations) {
        out.results.push_back(calculate(exp, current_price, config));

        const double time_weight = std::max(0.1, 1.0 - exp.dte / 60.0);
        const double oi_weight   = std::log10(std::max(1.0, exp.total_oi())) / 6.0;
        const double opex_boost  = is_monthly_opex(exp.expiration) ? 1.3 : 1.0;
        raw.push_back(time_weight * oi_weight * opex_boost);
    }

    out.weights = core::normalize(raw);

    std::vector<double> prices;
    prices.reserve(out.results.size());
    for (const auto& r : out.results) prices.push_back(r.price);

    out.weighted_price = core::weighted_sum(prices, out.weights, current_price);
    return out;
}

}  // namespace pfv::options
