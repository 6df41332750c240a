/// @file src/profiles/profile_registry.cpp
/// @brief The five fixed profiles and weight normalization.

#include "pfv/constants.hpp"
#include "pfv/profiles.hpp"

#include <cmath>
#include <utility>

namespace pfv::profiles {

namespace {

[[nodiscard]] double clean(double w) noexcept {
    return (std::isfinite(w) && w > 0.0) ? w : 0.0;
}

}  // namespace

// ─── Profile table ────────────────────────────────────────────────────────────

TickerProfile ProfileRegistry::get_profile(ProfileType type) {
    switch (type) {
        case ProfileType::BlueChip:
            return {
                .type        = ProfileType::BlueChip,
                .name        = "Blue Chip",
                .description = "Large-cap institutional stocks (AAPL, MSFT, GOOGL)",
                .weights     = {.max_pain = 0.25, .gamma_walls = 0.10, .technical = 0.30,
                                .volume = 0.25, .round_number = 0.10},
                .characteristics = {
                    "Institutional-driven price action",
                    "VWAP and MA levels highly respected",
                    "Options mechanics moderate influence",
                    "Round numbers less impactful due to algo trading",
                },
            };
        case ProfileType::MemeRetail:
            return {
                .type        = ProfileType::MemeRetail,
                .name        = "Meme / High Retail",
                .description = "Retail-driven stocks (GME, AMC, PLTR, RIVN)",
                .weights     = {.max_pain = 0.20, .gamma_walls = 0.25, .technical = 0.15,
                                .volume = 0.15, .round_number = 0.25},
                .characteristics = {
                    "Retail sentiment drives price",
                    "Round numbers are very significant",
                    "Gamma squeezes common",
                    "Technical levels often ignored in frenzies",
                },
            };
        case ProfileType::Etf:
            return {
                .type        = ProfileType::Etf,
                .name        = "ETF",
                .description = "Index ETFs with massive options volume (SPY, QQQ, IWM)",
                .weights     = {.max_pain = 0.35, .gamma_walls = 0.10, .technical = 0.25,
                                .volume = 0.20, .round_number = 0.10},
                .characteristics = {
                    "Massive options volume makes max pain reliable",
                    "Institutional OPEX pinning is well-documented",
                    "Round numbers at major levels ($500, $450)",
                    "Highly efficient market",
                },
            };
        case ProfileType::LowFloat:
            return {
                .type        = ProfileType::LowFloat,
                .name        = "Low Float / Squeeze Candidate",
                .description = "Small float stocks prone to gamma squeezes",
                .weights     = {.max_pain = 0.20, .gamma_walls = 0.30, .technical = 0.20,
                                .volume = 0.15, .round_number = 0.15},
                .characteristics = {
                    "Gamma effects are exaggerated",
                    "Can overshoot all levels during squeeze",
                    "Use PFV as gravitational center post-squeeze",
                    "High volatility expected",
                },
            };
        case ProfileType::Default:
            break;
    }
    return {
        .type        = ProfileType::Default,
        .name        = "Standard",
        .description = "Balanced approach for unknown ticker types",
        .weights     = {.max_pain = 0.30, .gamma_walls = 0.10, .technical = 0.25,
                        .volume = 0.20, .round_number = 0.15},
        .characteristics = {
            "Balanced weighting across all factors",
            "Good starting point for analysis",
            "May need adjustment based on behavior",
        },
    };
}

// ─── Weights ──────────────────────────────────────────────────────────────────

ProfileWeights ProfileRegistry::normalize_weights(const ProfileWeights& weights) noexcept {
    const ProfileWeights w{
        .max_pain     = clean(weights.max_pain),
        .gamma_walls  = clean(weights.gamma_walls),
        .technical    = clean(weights.technical),
        .volume       = clean(weights.volume),
        .round_number = clean(weights.round_number),
    };

    const double sum = w.sum();
    if (!std::isfinite(sum) || sum <= 0.0) {
        return {0.2, 0.2, 0.2, 0.2, 0.2};
    }

    return {
        .max_pain     = w.max_pain / sum,
        .gamma_walls  = w.gamma_walls / sum,
        .technical    = w.technical / sum,
        .volume       = w.volume / sum,
        .round_number = w.round_number / sum,
    };
}

bool ProfileRegistry::validate_weights(const ProfileWeights& weights) noexcept {
    return std::abs(weights.sum() - 1.0) < constants::WEIGHT_SUM_TOLERANCE;
}

ProfileWeights ProfileRegistry::merge_weights(const ProfileWeights& base,
                                              const WeightOverrides& overrides) noexcept {
    return {
        .max_pain     = overrides.max_pain.value_or(base.max_pain),
        .gamma_walls  = overrides.gamma_walls.value_or(base.gamma_walls),
        .technical    = overrides.technical.value_or(base.technical),
        .volume       = overrides.volume.value_or(base.volume),
        .round_number = overrides.round_number.value_or(base.round_number),
    };
}

TickerProfile ProfileRegistry::create_custom_profile(ProfileType base,
                                                     const WeightOverrides& overrides,
                                                     std::optional<std::string> name) {
    TickerProfile profile = get_profile(base);
    profile.weights = merge_weights(profile.weights, overrides);
    profile.name = name ? std::move(*name) : "Custom (" + profile.name + ")";
    return profile;
}

}  // namespace pfv::profiles
