#pragma once

/// @file include/pfv/max_pain.hpp
/// @brief Max pain calculator for a single option expiration.
///
/// # Module: Max Pain Calculator
///
/// ## Responsibility
/// Find the strike at which option holders collectively receive the least
/// intrinsic value at expiry, and grade how much that strike can be trusted.
///
/// ## Algorithm
/// Only strikes within [0.6 × price, 1.4 × price] with positive OI are
/// considered.  For every distinct surviving strike K used as a hypothetical
/// settlement S:
///
///     pain(S) = Σ_{calls, K < S} (S − K) · OI · 100
///             + Σ_{puts,  K > S} (K − S) · OI · 100
///
/// The minimizing strike wins; ties resolve to the lowest strike.
///
/// ## Confidence
///     min(0.4, OI / 250 000)
///   + min(0.3, OI within ±5% of the winner / OI × 0.5)
///   + min(0.3, distinct strikes / 50)
/// clamped to [0, 1].
///
/// ## Guarantees
/// - Never fails: an empty band yields {price = current, pain 0, conf 0}
/// - Deterministic for identical input
///
/// ## NOT Responsible For
/// - Combining expirations (see multi_expiry.hpp)

#include "pfv/constants.hpp"
#include "pfv/types.hpp"

#include <span>
#include <vector>

namespace pfv::options {

// ─── Types ────────────────────────────────────────────────────────────────────

struct MaxPainResult {
    double price = 0.0;          ///< Winning strike (or current price)
    Date   expiration{};
    int    dte = 0;
    double total_pain = 0.0;     ///< Dollar pain at the winning strike
    double call_pain  = 0.0;
    double put_pain   = 0.0;
    double confidence = 0.0;     ///< [0, 1]
};

/// Tunables; defaults are the documented constants.
struct MaxPainConfig {
    double band_low              = constants::MAX_PAIN_BAND_LOW;
    double band_high             = constants::MAX_PAIN_BAND_HIGH;
    double oi_scale              = constants::MAX_PAIN_OI_SCALE;
    double oi_cap                = constants::MAX_PAIN_OI_CAP;
    double concentration_window  = constants::MAX_PAIN_CONCENTRATION_WINDOW;
    double concentration_scale   = constants::MAX_PAIN_CONCENTRATION_SCALE;
    double concentration_cap     = constants::MAX_PAIN_CONCENTRATION_CAP;
    double density_divisor       = constants::MAX_PAIN_DENSITY_DIVISOR;
    double density_cap           = constants::MAX_PAIN_DENSITY_CAP;
};

/// Legacy multi-expiration blend (see `calculate_weighted`).
struct WeightedMaxPain {
    double weighted_price = 0.0;
    std::vector<MaxPainResult> results;
    std::vector<double> weights;   ///< Normalized, parallel to `results`
};

// ─── Calculator ───────────────────────────────────────────────────────────────

class MaxPainCalculator {
public:
    MaxPainCalculator() = delete;

    /// Max pain for one expiration.
    [[nodiscard]] static MaxPainResult
    calculate(const OptionsExpiration& expiration,
              double current_price,
              const MaxPainConfig& config = {}) noexcept;

    /// Simple blend of several expirations.
    ///
    /// Weight per expiration = max(0.1, 1 − dte/60)
    ///                       × log10(max(1, OI)) / 6
    ///                       × (1.3 on monthly OPEX).
    /// Weights are normalized (equal when they all vanish).  An empty input
    /// returns `weighted_price = current_price`.
    [[nodiscard]] static WeightedMaxPain
    calculate_weighted(std::span<const OptionsExpiration> expirations,
                       double current_price,
                       const MaxPainConfig& config = {});
};

}  // namespace pfv::options
