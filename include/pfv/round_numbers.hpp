#pragma once

/// @file include/pfv/round_numbers.hpp
/// @brief Round-number magnetism around the current price.
///
/// # Module: Round Number Analyzer
///
/// ## Responsibility
/// Generate synthetic levels at round prices, scaled to the magnitude of
/// the current price, and score how strongly each one attracts trading.
///
/// ## Interval Tiers (major / moderate / minor)
///   price ≥ 500: 100 / 50 / 25      price ≥ 20: 10 / 5 / 2.5
///   price ≥ 100:  50 / 25 / 10      price ≥ 10:  5 / 2.5 / 1
///   price ≥ 50:   25 / 10 / 5       otherwise:   1 / 0.5 / 0.25
///
/// ## Magnetic Pull
///     min(1, (base + bonus) × exp(−5 × |level − price| / price))
/// base MAJOR 1.0, MODERATE 0.6, MINOR 0.3; bonus +0.2 for multiples of
/// 100, +0.1 of 50, +0.05 of 25.
///
/// ## Guarantees
/// - Every level lies within [price × (1 − band), price × (1 + band)]
/// - One level per price; the most significant tier wins
/// - Levels ordered by pull, descending (stable)
/// - At most `ROUND_NUMBER_MAX_LEVELS_PER_TIER` multiples per tier; a band
///   holding more yields no levels and the price as magnetic center

#include "pfv/constants.hpp"
#include "pfv/types.hpp"

#include <optional>
#include <vector>

namespace pfv::levels {

// ─── Types ────────────────────────────────────────────────────────────────────

struct RoundNumberLevel {
    double price = 0.0;
    Significance significance = Significance::Minor;
    double distance_pct  = 0.0;
    double magnetic_pull = 0.0;   ///< [0, 1]
};

struct RoundNumbersResult {
    std::vector<RoundNumberLevel>   levels;
    std::optional<RoundNumberLevel> nearest_major;
    double magnetic_center = 0.0;
};

struct RoundIntervals {
    double major    = 1.0;
    double moderate = 0.5;
    double minor    = 0.25;
};

// ─── Analyzer ─────────────────────────────────────────────────────────────────

class RoundNumberAnalyzer {
public:
    RoundNumberAnalyzer() = delete;

    [[nodiscard]] static RoundNumbersResult
    analyze(double current_price, double band = constants::ROUND_NUMBER_BAND);

    [[nodiscard]] static RoundIntervals intervals_for(double price) noexcept;

    [[nodiscard]] static double
    magnetic_pull(double level_price, double current_price,
                  Significance significance) noexcept;

    /// Highest-pull level within `max_distance_pct` of price.
    [[nodiscard]] static std::optional<RoundNumberLevel>
    find_strongest_magnet(double current_price, double max_distance_pct = 5.0);

    /// Highest-pull level (within a ±5% scan) lying within `tolerance_pct`.
    [[nodiscard]] static std::optional<RoundNumberLevel>
    is_at_round_number(double current_price, double tolerance_pct = 0.5);

    /// Halfway points of the five major intervals around price (> 0 only).
    [[nodiscard]] static std::vector<double> midpoint_levels(double current_price);

    /// Position against the nearest major levels within ±5%: at less than
    /// half the distance to the level below is BULLISH, to the level above
    /// BEARISH, otherwise NEUTRAL.
    [[nodiscard]] static Bias round_number_bias(double current_price);
};

}  // namespace pfv::levels
