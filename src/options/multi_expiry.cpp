/// @file src/options/multi_expiry.cpp
/// @brief MultiExpiryAggregator implementation.

#include "pfv/multi_expiry.hpp"

#include "pfv/calendar.hpp"
#include "pfv/weighted.hpp"

#include <algorithm>
#include <cmath>

namespace pfv::options {

namespace {

[[nodiscard]] std::vector<double>
column(std::span<const ExpirationAnalysis> analyses, double (*pick)(const ExpirationAnalysis&)) {
    std::vector<double> out;
    out.reserve(analyses.size());
    for (const auto& a : analyses) out.push_back(pick(a));
    return out;
}

}  // namespace

// ─── MultiExpiryAggregator::analyze ───────────────────────────────────────────

std::vector<ExpirationAnalysis>
MultiExpiryAggregator::analyze(std::span<const OptionsExpiration> expirations,
                               double current_price,
                               const MultiExpiryConfig& config) {
    std::vector<const OptionsExpiration*> kept;
    for (const auto& e : expirations) {
        if (e.dte >= config.min_dte && e.dte <= config.max_dte) kept.push_back(&e);
    }
    if (kept.empty()) return {};

    // Each expiration is analysed on its own; nothing below depends on order.
    std::vector<ExpirationAnalysis> analyses;
    analyses.reserve(kept.size());
    for (const auto* e : kept) {
        analyses.push_back({
            .expiration      = e->expiration,
            .dte             = e->dte,
            .max_pain        = MaxPainCalculator::calculate(*e, current_price, config.max_pain),
            .gamma_walls     = GammaWallDetector::detect(*e, current_price, config.gamma_walls),
            .weight          = 0.0,
            .is_monthly_opex = is_monthly_opex(e->expiration),
            .is_weekly_opex  = is_weekly_opex(e->expiration),
        });
    }

    double max_oi = 0.0;
    for (const auto* e : kept) max_oi = std::max(max_oi, e->total_oi());

    std::vector<double> raw;
    raw.reserve(analyses.size());
    for (std::size_t i = 0; i < analyses.size(); ++i) {
        const auto& a = analyses[i];

        const double time_weight = std::exp(-a.dte / config.decay_days);
        const double oi_weight   = max_oi > 0.0
                                       ? std::sqrt(std::max(0.0, kept[i]->total_oi()) / max_oi)
                                       : 0.5;
        const double opex = a.is_monthly_opex ? config.monthly_multiplier
                          : a.is_weekly_opex  ? config.weekly_multiplier
                                              : 1.0;
        const double confidence_weight = 0.5 + 0.5 * a.max_pain.confidence;

        raw.push_back(time_weight * oi_weight * opex * confidence_weight);
    }

    const auto weights = core::normalize(raw);
    for (std::size_t i = 0; i < analyses.size(); ++i) analyses[i].weight = weights[i];

    std::stable_sort(analyses.begin(), analyses.end(),
                     [](const ExpirationAnalysis& a, const ExpirationAnalysis& b) {
                         return a.weight > b.weight;
                     });
    return analyses;
}

// ─── Weighted composites ──────────────────────────────────────────────────────

double MultiExpiryAggregator::weighted_max_pain(std::span<const ExpirationAnalysis> analyses,
                                                double fallback) {
    const auto prices  = column(analyses, [](const ExpirationAnalysis& a) { return a.max_pain.price; });
    const auto weights = column(analyses, [](const ExpirationAnalysis& a) { return a.weight; });
    return core::weighted_sum(prices, weights, fallback);
}

double MultiExpiryAggregator::weighted_gamma_center(std::span<const ExpirationAnalysis> analyses,
                                                    double fallback) {
    const auto centers = column(analyses, [](const ExpirationAnalysis& a) { return a.gamma_walls.center; });
    const auto weights = column(analyses, [](const ExpirationAnalysis& a) { return a.weight; });
    return core::weighted_sum(centers, weights, fallback);
}

// ─── MultiExpiryAggregator::aggregate_gamma_walls ─────────────────────────────

GammaWallsResult
MultiExpiryAggregator::aggregate_gamma_walls(std::span<const ExpirationAnalysis> analyses) {
    struct Merged {
        double strike         = 0.0;
        double total_oi       = 0.0;
        double total_strength = 0.0;
        double total_weight   = 0.0;
        bool   is_support     = false;
        bool   is_resistance  = false;
        bool   saw_call       = false;
        bool   saw_put        = false;
        bool   saw_combined   = false;
    };

    // First-seen strike order.
    std::vector<Merged> merged;
    for (const auto& a : analyses) {
        for (const auto& w : a.gamma_walls.walls) {
            auto it = std::find_if(merged.begin(), merged.end(),
                                   [&](const Merged& m) { return m.strike == w.strike; });
            if (it == merged.end()) {
                merged.push_back({.strike = w.strike});
                it = merged.end() - 1;
            }
            it->total_oi       += w.open_interest * a.weight;
            it->total_strength += w.relative_strength * a.weight;
            it->total_weight   += a.weight;
            it->is_support      = it->is_support || w.is_support;
            it->is_resistance   = it->is_resistance || w.is_resistance;
            it->saw_call       |= (w.type == WallType::CallWall);
            it->saw_put        |= (w.type == WallType::PutWall);
            it->saw_combined   |= (w.type == WallType::Combined);
        }
    }

    GammaWallsResult result;
    result.walls.reserve(merged.size());
    for (const auto& m : merged) {
        WallType type = WallType::PutWall;
        if (m.saw_combined || (m.saw_call && m.saw_put)) {
            type = WallType::Combined;
        } else if (m.saw_call) {
            type = WallType::CallWall;
        }

        result.walls.push_back({
            .strike            = m.strike,
            .type              = type,
            .open_interest     = std::round(m.total_oi),
            .relative_strength = m.total_weight > 0.0 ? m.total_strength / m.total_weight : 0.0,
            .is_support        = m.is_support,
            .is_resistance     = m.is_resistance,
        });
    }

    std::stable_sort(result.walls.begin(), result.walls.end(),
                     [](const GammaWall& a, const GammaWall& b) {
                         return a.relative_strength > b.relative_strength;
                     });

    for (const auto& w : result.walls) {
        if (!result.strongest_support && w.is_support) result.strongest_support = w;
        if (!result.strongest_resistance && w.is_resistance) result.strongest_resistance = w;
    }
    result.center = GammaWallDetector::center_of(result.walls, 0.0);
    return result;
}

// ─── Selection helpers ────────────────────────────────────────────────────────

std::optional<ExpirationAnalysis>
MultiExpiryAggregator::primary_expiration(std::span<const ExpirationAnalysis> analyses) {
    if (analyses.empty()) return std::nullopt;
    return analyses.front();
}

ExpirationsByType
MultiExpiryAggregator::expirations_by_type(std::span<const ExpirationAnalysis> analyses) {
    ExpirationsByType out;
    for (const auto& a : analyses) {
        if (a.is_monthly_opex) {
            out.monthly.push_back(a);
        } else if (a.is_weekly_opex) {
            out.weekly.push_back(a);
        } else {
            out.other.push_back(a);
        }
    }
    return out;
}

double MultiExpiryAggregator::time_gravity(int dte) noexcept {
    return std::exp(-static_cast<double>(dte) / constants::EXPIRATION_DECAY_DAYS);
}

}  // namespace pfv::options
