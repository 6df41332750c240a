#pragma once

/// @file include/pfv/gamma_walls.hpp
/// @brief Gamma wall detection and gamma exposure estimates.
///
/// # Module: Gamma Wall Detector
///
/// ## Responsibility
/// Flag strikes whose open interest is abnormally concentrated relative to
/// the median of the chain.  Market-maker hedging around such strikes is
/// assumed to create support (put walls below price) and resistance (call
/// walls above price).
///
/// ## Algorithm
///   1. Keep strikes in [0.7 × price, 1.3 × price] with positive OI.
///   2. Aggregate call and put OI per strike; medians are taken over the
///      positive per-strike values of each side (upper median).
///   3. strength = OI / median.  CALL_WALL when call strength ≥ threshold
///      and strike > price; PUT_WALL when put strength ≥ threshold and
///      strike < price; COMBINED appended as well when both sides meet it.
///   4. Walls ranked by strength, descending (stable).
///   5. center = Σ strike·OI·strength / Σ OI·strength, or price if empty.
///
/// A COMBINED wall repeats OI already carried by the CALL_WALL/PUT_WALL at
/// the same strike, so that strike weighs twice in the center.
///
/// ## NOT Responsible For
/// - Pricing options; gamma is passed through or coarsely estimated

#include "pfv/constants.hpp"
#include "pfv/types.hpp"

#include <optional>
#include <vector>

namespace pfv::options {

// ─── Types ────────────────────────────────────────────────────────────────────

struct GammaWall {
    double   strike = 0.0;
    WallType type   = WallType::CallWall;
    double   open_interest     = 0.0;
    double   relative_strength = 0.0;  ///< OI / median OI of its side
    bool     is_support    = false;
    bool     is_resistance = false;
};

struct GammaWallsResult {
    std::vector<GammaWall>   walls;   ///< Ranked by relative strength
    std::optional<GammaWall> strongest_support;
    std::optional<GammaWall> strongest_resistance;
    double center = 0.0;
};

struct GammaWallConfig {
    double band_low  = constants::GAMMA_BAND_LOW;
    double band_high = constants::GAMMA_BAND_HIGH;
    double threshold_multiplier = constants::GAMMA_WALL_THRESHOLD;
};

/// Per-strike dollar gamma exposure.
struct StrikeExposure {
    double strike   = 0.0;
    double call_gex = 0.0;
    double put_gex  = 0.0;
    double net_gex  = 0.0;   ///< call − put
};

// ─── Detector ─────────────────────────────────────────────────────────────────

class GammaWallDetector {
public:
    GammaWallDetector() = delete;

    [[nodiscard]] static GammaWallsResult
    detect(const OptionsExpiration& expiration,
           double current_price,
           const GammaWallConfig& config = {});

    /// Convenience overload matching the common call shape.
    [[nodiscard]] static GammaWallsResult
    detect(const OptionsExpiration& expiration,
           double current_price,
           double threshold_multiplier);

    /// OI × strength weighted mean strike, `fallback` when empty.
    [[nodiscard]] static double
    center_of(const std::vector<GammaWall>& walls, double fallback);
};

// ─── Gamma Exposure ───────────────────────────────────────────────────────────

/// Approximate gamma: 0.05 × exp(−10 × |spot − K| / spot) × sqrt(dte / 365).
[[nodiscard]] double estimate_gamma(double strike, double spot, int dte) noexcept;

/// GEX per strike over the whole chain (no band filter), ascending strike.
///
/// GEX = gamma × OI × 100 × spot, where gamma is the contract's own value
/// when present and non-zero, else `estimate_gamma`.
[[nodiscard]] std::vector<StrikeExposure>
estimate_gamma_exposure(const OptionsExpiration& expiration, double current_price);

/// First strike-to-strike sign change of net GEX, linearly interpolated.
/// `exposures` must be sorted by strike.
[[nodiscard]] std::optional<double>
find_gamma_flip(const std::vector<StrikeExposure>& exposures) noexcept;

}  // namespace pfv::options
