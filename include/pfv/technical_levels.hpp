#pragma once

/// @file include/pfv/technical_levels.hpp
/// @brief Support/resistance levels derived from a technical snapshot.
///
/// # Module: Technical Level Analyzer
///
/// ## Responsibility
/// Turn moving averages, 52-week extremes, swing points, VWAP and the
/// previous close into ranked support/resistance levels, cluster them into
/// confluence zones, and vote a trend bias from the moving averages.
///
/// ## Fixed Strengths
///   MA20 WEAK, MA50 MODERATE, MA200 STRONG, 52W high/low STRONG,
///   swing high/low MODERATE, VWAP MODERATE, previous close WEAK.
///
/// ## Weighted Center
///     Σ price · s · d / Σ s · d,   s ∈ {3, 2, 1},  d = 1 / (1 + |dist%| / 10)
///
/// ## Guarantees
/// - Absent (or non-positive) optional fields produce no level
/// - Levels are ordered by absolute distance from price, ascending (stable)

#include "pfv/constants.hpp"
#include "pfv/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pfv::levels {

// ─── Types ────────────────────────────────────────────────────────────────────

struct TechnicalLevel {
    double price = 0.0;
    TechnicalLevelType type = TechnicalLevelType::MA20;
    LevelStrength strength  = LevelStrength::Weak;
    double distance_pct = 0.0;   ///< (price − current) / current × 100
    bool   is_support    = false;
    bool   is_resistance = false;
};

struct TechnicalLevelsResult {
    std::vector<TechnicalLevel>   levels;
    std::optional<TechnicalLevel> nearest_support;
    std::optional<TechnicalLevel> nearest_resistance;
    double weighted_center = 0.0;
};

/// Price band where two or more levels cluster.
struct ConfluenceZone {
    double low  = 0.0;
    double high = 0.0;
    std::vector<TechnicalLevel> levels;   ///< Ascending by price
    bool   is_support = false;            ///< Midpoint below current price
    double strength   = 0.0;              ///< Mean of 3/2/1 strength scores
};

/// Distance from price to a named milestone.
struct Milestone {
    std::string name;
    double price = 0.0;
    double distance_pct = 0.0;
    bool   upward = false;
};

// ─── Analyzer ─────────────────────────────────────────────────────────────────

class TechnicalLevelAnalyzer {
public:
    TechnicalLevelAnalyzer() = delete;

    /// Levels for every usable field of `data`.  `data.current_price` must
    /// be positive; the composer validates this before calling.
    [[nodiscard]] static TechnicalLevelsResult
    analyze(const TechnicalData& data);

    /// 3 / 2 / 1 for STRONG / MODERATE / WEAK.
    [[nodiscard]] static double strength_weight(LevelStrength strength) noexcept;

    /// First level (in the given order) within `tolerance_pct` of price.
    [[nodiscard]] static std::optional<TechnicalLevel>
    is_near_key_level(const std::vector<TechnicalLevel>& levels,
                      double tolerance_pct = 1.0);

    /// Cluster levels sorted by price; a level joins the open cluster when
    /// its gap to the previous level is ≤ `gap_pct` percent.  Clusters of
    /// two or more levels become zones, ranked by strength descending.
    [[nodiscard]] static std::vector<ConfluenceZone>
    find_confluence_zones(const std::vector<TechnicalLevel>& levels,
                          double current_price,
                          double gap_pct = constants::CONFLUENCE_GAP_PCT);

    /// Moving-average vote.
    ///
    /// price > MA200 scores 2 of 2, price > MA50 and price > MA20 one each,
    /// and MA20 > MA50 > MA200 one more when all three exist.  A bullish
    /// ratio ≥ 0.7 is BULLISH, ≤ 0.3 BEARISH, else NEUTRAL; no MAs at all
    /// gives NEUTRAL.
    [[nodiscard]] static Bias determine_trend_bias(const TechnicalData& data) noexcept;

    /// 52-week high, 52-week low and MA200 (each when present), nearest first.
    [[nodiscard]] static std::vector<Milestone>
    calculate_milestones(const TechnicalData& data);
};

}  // namespace pfv::levels
