#pragma once

/// @file include/pfv/multi_expiry.hpp
/// @brief Multi-expiration aggregator for max pain and gamma walls.
///
/// # Module: Multi-Expiration Aggregator
///
/// ## Responsibility
/// Run the per-expiration calculators over every expiration inside a DTE
/// window and weight each one by how much hedging gravity it is expected to
/// exert on the underlying.
///
/// ## Weighting
///     w_i = exp(−dte_i / 30)
///         × sqrt(OI_i / max_j OI_j)          (0.5 when max OI is 0)
///         × {1.5 monthly OPEX, 1.2 weekly OPEX, 1.0 otherwise}
///         × (0.5 + 0.5 × max-pain confidence_i)
///
/// Weights are normalized to sum to 1 (equal weights when all vanish) and
/// the analyses are returned heaviest first; index 0 is the primary.
///
/// ## Guarantees
/// - Expirations are analysed independently of one another
/// - An empty or fully filtered input yields an empty list, never an error
///
/// ## NOT Responsible For
/// - Fetching option chains

#include "pfv/constants.hpp"
#include "pfv/gamma_walls.hpp"
#include "pfv/max_pain.hpp"
#include "pfv/types.hpp"

#include <optional>
#include <span>
#include <vector>

namespace pfv::options {

// ─── Types ────────────────────────────────────────────────────────────────────

struct ExpirationAnalysis {
    Date expiration{};
    int  dte = 0;
    MaxPainResult    max_pain;
    GammaWallsResult gamma_walls;
    double weight = 0.0;           ///< Normalized, [0, 1]
    bool   is_monthly_opex = false;
    bool   is_weekly_opex  = false;
};

struct MultiExpiryConfig {
    int    min_dte = constants::DEFAULT_MIN_DTE;
    int    max_dte = constants::DEFAULT_MAX_DTE;
    double decay_days         = constants::EXPIRATION_DECAY_DAYS;
    double monthly_multiplier = constants::MONTHLY_OPEX_MULTIPLIER;
    double weekly_multiplier  = constants::WEEKLY_OPEX_MULTIPLIER;
    MaxPainConfig   max_pain;
    GammaWallConfig gamma_walls;
};

/// Expirations split by OPEX kind, each keeping the input order.
struct ExpirationsByType {
    std::vector<ExpirationAnalysis> monthly;
    std::vector<ExpirationAnalysis> weekly;
    std::vector<ExpirationAnalysis> other;
};

// ─── Aggregator ───────────────────────────────────────────────────────────────

class MultiExpiryAggregator {
public:
    MultiExpiryAggregator() = delete;

    /// Analyse and weight every expiration with DTE in [min_dte, max_dte].
    [[nodiscard]] static std::vector<ExpirationAnalysis>
    analyze(std::span<const OptionsExpiration> expirations,
            double current_price,
            const MultiExpiryConfig& config = {});

    /// Σ weight_i × max_pain_i.  `fallback` when `analyses` is empty.
    [[nodiscard]] static double
    weighted_max_pain(std::span<const ExpirationAnalysis> analyses,
                      double fallback = 0.0);

    /// Σ weight_i × gamma_center_i.  `fallback` when `analyses` is empty.
    [[nodiscard]] static double
    weighted_gamma_center(std::span<const ExpirationAnalysis> analyses,
                          double fallback = 0.0);

    /// Merge walls of all expirations by strike.
    ///
    /// OI and strength are accumulated weighted by expiration weight; the
    /// strength reported is the weight-averaged one and OI is rounded to a
    /// whole contract.  A strike seen as both sides, or as COMBINED, is
    /// reported COMBINED.  The merged center falls back to 0 without walls.
    [[nodiscard]] static GammaWallsResult
    aggregate_gamma_walls(std::span<const ExpirationAnalysis> analyses);

    /// Heaviest analysis, or nothing when empty.
    [[nodiscard]] static std::optional<ExpirationAnalysis>
    primary_expiration(std::span<const ExpirationAnalysis> analyses);

    [[nodiscard]] static ExpirationsByType
    expirations_by_type(std::span<const ExpirationAnalysis> analyses);

    /// exp(−dte / 30).
    [[nodiscard]] static double time_gravity(int dte) noexcept;
};

}  // namespace pfv::options
