/// @file src/fair_value/composer.cpp
/// @brief FairValueComposer stages and the consumer-side helpers.

#include "pfv/fair_value.hpp"

#include "pfv/weighted.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace pfv {

namespace {

[[nodiscard]] double distance_pct(double level, double current_price) noexcept {
    return (level - current_price) / current_price * 100.0;
}

[[nodiscard]] MagneticLevelType wall_tag(WallType type) noexcept {
    switch (type) {
        case WallType::CallWall: return MagneticLevelType::CallWall;
        case WallType::PutWall:  return MagneticLevelType::PutWall;
        case WallType::Combined: return MagneticLevelType::GammaWall;
    }
    return MagneticLevelType::GammaWall;
}

}  // namespace

// ─── Components ───────────────────────────────────────────────────────────────

std::vector<ComponentBreakdown>
FairValueComposer::build_components(double max_pain, double gamma_center,
                                    double technical_center, double volume_anchor,
                                    double round_center,
                                    const profiles::ProfileWeights& weights) {
    const auto component = [](const char* name, double value, double weight) {
        return ComponentBreakdown{
            .name         = name,
            .value        = value,
            .weight       = weight,
            .contribution = value * weight,
        };
    };

    return {
        component("Max Pain",         max_pain,         weights.max_pain),
        component("Gamma Walls",      gamma_center,     weights.gamma_walls),
        component("Technical Levels", technical_center, weights.technical),
        component("Volume Anchor",    volume_anchor,    weights.volume),
        component("Round Numbers",    round_center,     weights.round_number),
    };
}

// ─── Bias ─────────────────────────────────────────────────────────────────────

Bias FairValueComposer::determine_bias(double deviation_pct,
                                       const TechnicalData& technical,
                                       double threshold_pct) noexcept {
    if (deviation_pct > threshold_pct) return Bias::Bullish;
    if (deviation_pct < -threshold_pct) return Bias::Bearish;
    return levels::TechnicalLevelAnalyzer::determine_trend_bias(technical);
}

// ─── Confidence ───────────────────────────────────────────────────────────────

double FairValueComposer::convergence(std::span<const ComponentBreakdown> components,
                                      double penalty) {
    if (components.empty()) return 0.0;

    std::vector<double> values;
    values.reserve(components.size());
    for (const auto& c : components) values.push_back(c.value);

    const auto [mean, stddev] = core::mean_and_stddev(values);
    if (!std::isfinite(mean) || mean <= 0.0) return 0.0;

    const double cv = stddev / mean;
    if (!std::isfinite(cv)) return 0.0;
    return std::max(0.0, 1.0 - penalty * cv);
}

double FairValueComposer::confidence_score(std::span<const ComponentBreakdown> components,
                                           double fair_value, double current_price,
                                           std::span<const options::ExpirationAnalysis> analyses,
                                           const PFVConfig& config) {
    const double converged = convergence(components, config.convergence_penalty);

    double options_quality = config.no_options_quality;
    if (!analyses.empty()) {
        double total = 0.0;
        for (const auto& a : analyses) total += a.max_pain.confidence;
        options_quality = std::min(1.0, total / static_cast<double>(analyses.size()));
    }

    double distance_factor = config.distance_floor;
    if (current_price > 0.0) {
        const double distance = std::abs((fair_value - current_price) / current_price);
        if (std::isfinite(distance)) {
            distance_factor =
                std::max(config.distance_floor, 1.0 - config.distance_penalty * distance);
        }
    }

    const double score = converged * config.convergence_blend +
                         options_quality * config.options_blend +
                         distance_factor * config.distance_blend;
    if (!std::isfinite(score)) return 0.0;
    return std::clamp(score, 0.0, 1.0);
}

ConfidenceLevel FairValueComposer::grade(double score, const PFVConfig& config) noexcept {
    if (score >= config.high_confidence) return ConfidenceLevel::High;
    if (score >= config.medium_confidence) return ConfidenceLevel::Medium;
    return ConfidenceLevel::Low;
}

// ─── Magnetic Levels ──────────────────────────────────────────────────────────

double FairValueComposer::magnetic_strength(LevelStrength strength) noexcept {
    switch (strength) {
        case LevelStrength::Strong:   return 0.9;
        case LevelStrength::Moderate: return 0.6;
        case LevelStrength::Weak:     return 0.3;
    }
    return 0.5;
}

MagneticLevelType FairValueComposer::magnetic_type(TechnicalLevelType type) noexcept {
    switch (type) {
        case TechnicalLevelType::MA20:             return MagneticLevelType::MA20;
        case TechnicalLevelType::MA50:             return MagneticLevelType::MA50;
        case TechnicalLevelType::MA200:            return MagneticLevelType::MA200;
        case TechnicalLevelType::FiftyTwoWeekHigh: return MagneticLevelType::FiftyTwoWeekHigh;
        case TechnicalLevelType::FiftyTwoWeekLow:  return MagneticLevelType::FiftyTwoWeekLow;
        case TechnicalLevelType::SwingHigh:        return MagneticLevelType::SwingHigh;
        case TechnicalLevelType::SwingLow:         return MagneticLevelType::SwingLow;
        case TechnicalLevelType::Vwap:             return MagneticLevelType::Vwap;
        case TechnicalLevelType::PrevClose:        return MagneticLevelType::PrevClose;
    }
    return MagneticLevelType::PrevClose;
}

std::vector<MagneticLevel>
FairValueComposer::collect_magnetic_levels(std::span<const options::ExpirationAnalysis> analyses,
                                           std::span<const levels::TechnicalLevel> technical,
                                           std::span<const levels::RoundNumberLevel> round,
                                           double current_price,
                                           bool include_all,
                                           std::size_t max_levels,
                                           const PFVConfig& config) {
    std::vector<MagneticLevel> collected;

    // ── Options: max pain and the strongest walls of each expiration ─────────
    for (const auto& a : analyses) {
        collected.push_back({
            .price        = a.max_pain.price,
            .type         = MagneticLevelType::MaxPain,
            .strength     = a.max_pain.confidence,
            .distance_pct = distance_pct(a.max_pain.price, current_price),
            .expiration   = a.expiration,
        });

        const auto& walls = a.gamma_walls.walls;
        const std::size_t n = std::min(walls.size(), config.walls_per_expiration);
        for (std::size_t i = 0; i < n; ++i) {
            collected.push_back({
                .price        = walls[i].strike,
                .type         = wall_tag(walls[i].type),
                .strength     = std::min(1.0, walls[i].relative_strength / config.wall_strength_scale),
                .distance_pct = distance_pct(walls[i].strike, current_price),
                .expiration   = a.expiration,
            });
        }
    }

    // ── Technical levels ─────────────────────────────────────────────────────
    for (const auto& l : technical) {
        collected.push_back({
            .price        = l.price,
            .type         = magnetic_type(l.type),
            .strength     = magnetic_strength(l.strength),
            .distance_pct = l.distance_pct,
            .expiration   = std::nullopt,
        });
    }

    // ── Round numbers (already ranked by pull) ───────────────────────────────
    const std::size_t n_round = std::min(round.size(), config.round_levels_collected);
    for (std::size_t i = 0; i < n_round; ++i) {
        collected.push_back({
            .price        = round[i].price,
            .type         = round[i].significance == Significance::Major
                                ? MagneticLevelType::RoundMajor
                                : MagneticLevelType::RoundModerate,
            .strength     = round[i].magnetic_pull,
            .distance_pct = round[i].distance_pct,
            .expiration   = std::nullopt,
        });
    }

    // ── De-duplicate on the display-rounded price ────────────────────────────
    // A later entry replaces an earlier one only when strictly stronger; the
    // slot of the first occurrence is kept.
    std::vector<MagneticLevel> deduped;
    deduped.reserve(collected.size());
    for (auto& level : collected) {
        level.price = core::round_price(level.price);
        auto it = std::find_if(deduped.begin(), deduped.end(), [&](const MagneticLevel& u) {
            return u.price == level.price;
        });
        if (it == deduped.end()) {
            deduped.push_back(std::move(level));
        } else if (level.strength > it->strength) {
            *it = std::move(level);
        }
    }

    if (!include_all) {
        std::erase_if(deduped, [&](const MagneticLevel& l) {
            return !(l.strength >= config.min_magnetic_strength);
        });
    }

    std::stable_sort(deduped.begin(), deduped.end(),
                     [](const MagneticLevel& a, const MagneticLevel& b) {
                         return a.strength > b.strength;
                     });
    if (deduped.size() > max_levels) deduped.resize(max_levels);
    return deduped;
}

// ─── Consumer Helpers ─────────────────────────────────────────────────────────

QuickFairValue quick_fair_value(double current_price,
                                std::optional<double> ma200,
                                std::span<const QuickExpiration> expirations) noexcept {
    if (!std::isfinite(current_price) || current_price <= 0.0) {
        return {.fair_value = current_price, .bias = Bias::Neutral};
    }

    double sum    = current_price;
    double weight = 1.0;

    if (auto ma = usable(ma200)) {
        sum    += *ma * 0.3;
        weight += 0.3;
    }

    if (!expirations.empty()) {
        const auto nearest = std::min_element(
            expirations.begin(), expirations.end(),
            [](const QuickExpiration& a, const QuickExpiration& b) { return a.dte < b.dte; });
        if (std::isfinite(nearest->max_pain)) {
            sum    += nearest->max_pain * 0.4;
            weight += 0.4;
        }
    }

    const double fair_value = sum / weight;
    const double deviation  = (fair_value - current_price) / current_price;

    Bias bias = Bias::Neutral;
    if (deviation > 0.02) {
        bias = Bias::Bullish;
    } else if (deviation < -0.02) {
        bias = Bias::Bearish;
    }
    return {.fair_value = fair_value, .bias = bias};
}

WallPrices extract_walls(const PsychologicalFairValue& result) {
    WallPrices out;
    for (const auto& l : result.magnetic_levels) {
        switch (l.type) {
            case MagneticLevelType::PutWall:
                out.put_walls.push_back(l.price);
                break;
            case MagneticLevelType::CallWall:
            case MagneticLevelType::GammaWall:
                out.call_walls.push_back(l.price);
                break;
            default:
                break;
        }
    }
    return out;
}

std::vector<MagneticLevel>
key_magnetic_levels(const PsychologicalFairValue& result, std::size_t max_levels) {
    const std::size_t n = std::min(result.magnetic_levels.size(), max_levels);
    return {result.magnetic_levels.begin(),
            result.magnetic_levels.begin() + static_cast<std::ptrdiff_t>(n)};
}

}  // namespace pfv
