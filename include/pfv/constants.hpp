#pragma once

#include <cstddef>

/// @file include/pfv/constants.hpp
/// @brief Tunable constants for the Psychological Fair Value (PFV) engine.
///
/// Every value here is a default for one of the per-module config structs.
/// Callers tune behaviour through those structs; the constants are only the
/// starting point. Several are load-bearing for documented thresholds
/// (confidence grades, bias cut-offs), so change them only with evidence.

namespace pfv::constants {

// ─── Option Contracts ─────────────────────────────────────────────────────────

/// Shares controlled by one listed equity option contract.
static constexpr double CONTRACT_MULTIPLIER = 100.0;

// ─── Max Pain ─────────────────────────────────────────────────────────────────

/// Strikes outside [LOW × price, HIGH × price] are ignored (stale LEAPS,
/// pre-split strikes).
static constexpr double MAX_PAIN_BAND_LOW  = 0.6;
static constexpr double MAX_PAIN_BAND_HIGH = 1.4;

/// Open interest at which the OI confidence term saturates.
static constexpr double MAX_PAIN_OI_SCALE = 250'000.0;
static constexpr double MAX_PAIN_OI_CAP   = 0.4;

/// Concentration term: share of OI within ±5% of the winning strike × 0.5.
static constexpr double MAX_PAIN_CONCENTRATION_WINDOW = 0.05;
static constexpr double MAX_PAIN_CONCENTRATION_SCALE  = 0.5;
static constexpr double MAX_PAIN_CONCENTRATION_CAP    = 0.3;

/// Density term: distinct strikes / 50.
static constexpr double MAX_PAIN_DENSITY_DIVISOR = 50.0;
static constexpr double MAX_PAIN_DENSITY_CAP     = 0.3;

// ─── Gamma Walls ──────────────────────────────────────────────────────────────

static constexpr double GAMMA_BAND_LOW  = 0.7;
static constexpr double GAMMA_BAND_HIGH = 1.3;

/// A strike is a wall when its OI is at least this multiple of the median.
static constexpr double GAMMA_WALL_THRESHOLD = 2.0;

/// Peak ATM gamma used when a contract carries no gamma of its own.
static constexpr double GAMMA_ESTIMATE_PEAK = 0.05;
static constexpr double GAMMA_ESTIMATE_MONEYNESS_DECAY = 10.0;

// ─── Multi-Expiration ─────────────────────────────────────────────────────────

static constexpr int    DEFAULT_MIN_DTE = 0;
static constexpr int    DEFAULT_MAX_DTE = 60;

/// Time weight exp(−dte / 30).
static constexpr double EXPIRATION_DECAY_DAYS = 30.0;

static constexpr double MONTHLY_OPEX_MULTIPLIER = 1.5;
static constexpr double WEEKLY_OPEX_MULTIPLIER  = 1.2;

// ─── Technical Levels ─────────────────────────────────────────────────────────

/// Distance decay 1 / (1 + |distance%| / 10).
static constexpr double TECHNICAL_DISTANCE_SCALE_PCT = 10.0;

/// Consecutive levels closer than this (percent) form one confluence zone.
static constexpr double CONFLUENCE_GAP_PCT = 2.0;

static constexpr double TREND_BULLISH_RATIO = 0.7;
static constexpr double TREND_BEARISH_RATIO = 0.3;

// ─── Round Numbers ────────────────────────────────────────────────────────────

/// Round levels are generated within ±20% of price.
static constexpr double ROUND_NUMBER_BAND = 0.20;

/// Pull decay exp(−5 × |distance fraction|).
static constexpr double ROUND_NUMBER_DECAY = 5.0;

/// Above this many multiples of one interval inside the band no round
/// levels are generated and the price itself is the magnetic center.
static constexpr std::size_t ROUND_NUMBER_MAX_LEVELS_PER_TIER = 10'000;

// ─── Fair Value Composer ──────────────────────────────────────────────────────

static constexpr double CONVERGENCE_BLEND = 0.4;
static constexpr double OPTIONS_BLEND     = 0.4;
static constexpr double DISTANCE_BLEND    = 0.2;

static constexpr double CONVERGENCE_PENALTY     = 10.0;
static constexpr double DISTANCE_PENALTY        = 3.0;
static constexpr double DISTANCE_FACTOR_FLOOR   = 0.3;
static constexpr double NO_OPTIONS_QUALITY      = 0.3;

static constexpr double HIGH_CONFIDENCE_THRESHOLD   = 0.7;
static constexpr double MEDIUM_CONFIDENCE_THRESHOLD = 0.4;

/// |deviation%| above this decides bias without the trend vote.
static constexpr double BIAS_THRESHOLD_PCT = 2.0;

static constexpr double MIN_MAGNETIC_STRENGTH = 0.3;
static constexpr std::size_t DEFAULT_MAX_MAGNETIC_LEVELS = 15;

/// Gamma walls contribute min(1, relative strength / 5).
static constexpr double WALL_STRENGTH_SCALE = 5.0;

static constexpr std::size_t WALLS_PER_EXPIRATION = 3;
static constexpr std::size_t ROUND_LEVELS_COLLECTED = 5;

// ─── Data Freshness ───────────────────────────────────────────────────────────

/// Local trading-hours window [OPEN, CLOSE) in whole hours.
static constexpr int TRADING_OPEN_HOUR  = 9;
static constexpr int TRADING_CLOSE_HOUR = 16;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

static constexpr double WEIGHT_SUM_TOLERANCE = 1e-3;

}  // namespace pfv::constants
