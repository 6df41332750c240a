#pragma once

/// @file include/pfv/fair_value.hpp
/// @brief Psychological Fair Value composer: public API.
///
/// # Module: Fair Value Composer
///
/// ## Responsibility
/// Fuse the five signal categories into one fair-value price for a single
/// ticker snapshot:
///   OptionsExpiration[] → MultiExpiryAggregator → weighted max pain,
///                                                 weighted gamma center
///   TechnicalData       → TechnicalLevelAnalyzer → technical center,
///                                                  volume anchor
///   current price       → RoundNumberAnalyzer    → magnetic center
///
///     fair value = Σ component_value × profile_weight
///
/// and derive the deviation, bias, confidence grade, ranked magnetic levels,
/// support/resistance zones, freshness tag and the text summaries.
///
/// ## Usage
/// ```cpp
/// pfv::FairValueEngine engine;
/// pfv::PFVInput input{.ticker = "AAPL", .technical = snapshot};
/// if (auto result = engine.calculate(input)) {
///     fmt::print("{}\n", pfv::report::format_pfv_result(*result));
/// }
/// ```
///
/// ## Guarantees
/// - Hard failure (`nullopt`) only when the current price is unusable
/// - Identical inputs give identical numbers; only `calculated_at` and
///   `data_freshness` read the clock
/// - `calculate` is const and reentrant
///
/// ## NOT Responsible For
/// - Fetching or caching market data
/// - Rendering beyond the stored text summaries (see report.hpp)

#include "pfv/constants.hpp"
#include "pfv/calendar.hpp"
#include "pfv/multi_expiry.hpp"
#include "pfv/profiles.hpp"
#include "pfv/technical_levels.hpp"
#include "pfv/round_numbers.hpp"
#include "pfv/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pfv {

// ─── Output Records ───────────────────────────────────────────────────────────

/// A level from any source, ranked alongside all others.
struct MagneticLevel {
    double price = 0.0;
    MagneticLevelType type = MagneticLevelType::MaxPain;
    double strength     = 0.0;   ///< [0, 1]
    double distance_pct = 0.0;
    std::optional<Date> expiration;   ///< Options-derived levels only
};

struct ComponentBreakdown {
    std::string name;
    double value        = 0.0;
    double weight       = 0.0;
    double contribution = 0.0;   ///< value × weight
};

struct PriceZone {
    double low  = 0.0;
    double high = 0.0;
};

struct PsychologicalFairValue {
    std::string ticker;
    double fair_value    = 0.0;   ///< Rounded for display
    double current_price = 0.0;
    /// Graded from `confidence_score`; LOW regardless of the score when
    /// there is neither an expiration nor a technical level.
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    double confidence_score = 0.0;   ///< Unrounded blend behind the grade

    double deviation_pct     = 0.0;   ///< One decimal
    double deviation_dollars = 0.0;
    Bias   bias = Bias::Neutral;

    profiles::TickerProfile profile;  ///< With the final, normalized weights
    std::vector<ComponentBreakdown> components;

    std::vector<options::ExpirationAnalysis> expiration_analysis;
    std::optional<options::ExpirationAnalysis> primary_expiration;

    std::vector<MagneticLevel> magnetic_levels;   ///< Strongest first
    std::optional<PriceZone> support_zone;
    std::optional<PriceZone> resistance_zone;

    std::chrono::system_clock::time_point calculated_at;
    DataFreshness data_freshness = DataFreshness::Fresh;

    std::string ai_context;
    std::string interpretation;
};

// ─── Inputs ───────────────────────────────────────────────────────────────────

struct PFVInput {
    std::string ticker;
    TechnicalData technical;
    std::vector<OptionsExpiration> expirations;
    std::optional<ProfileType> profile_override;
};

/// Per-call overrides.
struct PFVOptions {
    int min_dte = constants::DEFAULT_MIN_DTE;
    int max_dte = constants::DEFAULT_MAX_DTE;
    std::optional<profiles::WeightOverrides> custom_weights;
    bool include_all_levels = false;
    std::size_t max_magnetic_levels = constants::DEFAULT_MAX_MAGNETIC_LEVELS;

    /// If true, emit one-line diagnostics to stderr.
    bool verbose = false;
};

/// Engine-wide tunables.  Defaults are the documented constants.
struct PFVConfig {
    options::MaxPainConfig   max_pain{};
    options::GammaWallConfig gamma_walls{};
    double expiration_decay_days   = constants::EXPIRATION_DECAY_DAYS;
    double monthly_opex_multiplier = constants::MONTHLY_OPEX_MULTIPLIER;
    double weekly_opex_multiplier  = constants::WEEKLY_OPEX_MULTIPLIER;

    double round_number_band = constants::ROUND_NUMBER_BAND;
    double zone_gap_pct      = constants::CONFLUENCE_GAP_PCT;

    double convergence_blend   = constants::CONVERGENCE_BLEND;
    double options_blend       = constants::OPTIONS_BLEND;
    double distance_blend      = constants::DISTANCE_BLEND;
    double convergence_penalty = constants::CONVERGENCE_PENALTY;
    double distance_penalty    = constants::DISTANCE_PENALTY;
    double distance_floor      = constants::DISTANCE_FACTOR_FLOOR;
    double no_options_quality  = constants::NO_OPTIONS_QUALITY;
    double high_confidence     = constants::HIGH_CONFIDENCE_THRESHOLD;
    double medium_confidence   = constants::MEDIUM_CONFIDENCE_THRESHOLD;

    double bias_threshold_pct    = constants::BIAS_THRESHOLD_PCT;
    double min_magnetic_strength = constants::MIN_MAGNETIC_STRENGTH;
    double wall_strength_scale   = constants::WALL_STRENGTH_SCALE;
    std::size_t walls_per_expiration   = constants::WALLS_PER_EXPIRATION;
    std::size_t round_levels_collected = constants::ROUND_LEVELS_COLLECTED;

    TradingHours trading_hours{};
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class FairValueEngine {
public:
    /// Default configuration with the shipped classifier and heuristics.
    explicit FairValueEngine(PFVConfig config = PFVConfig{});

    FairValueEngine(PFVConfig config, profiles::ProfileResolver resolver);

    /// Full fair-value computation.
    ///
    /// # Returns
    /// `nullopt` when `validate_technical_data(input.technical)` fails, i.e.
    /// the current price is unusable. Every other field may be missing.
    [[nodiscard]] std::optional<PsychologicalFairValue>
    calculate(const PFVInput& input, const PFVOptions& options = {}) const;

    /// Same as `calculate` with an explicit clock reading, for callers that
    /// need reproducible `calculated_at` / `data_freshness`.
    [[nodiscard]] std::optional<PsychologicalFairValue>
    calculate_at(const PFVInput& input,
                 const PFVOptions& options,
                 std::chrono::system_clock::time_point now) const;

    [[nodiscard]] const PFVConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] options::MultiExpiryConfig
    expiry_config(const PFVOptions& options) const noexcept;

    PFVConfig                  config_;
    profiles::ProfileResolver  resolver_;
};

/// One-shot helper over a default-constructed engine.
[[nodiscard]] std::optional<PsychologicalFairValue>
calculate_psychological_fair_value(const PFVInput& input,
                                   const PFVOptions& options = {});

// ─── Composer Stages ──────────────────────────────────────────────────────────

/// Stateless building blocks of `FairValueEngine::calculate`, exposed so
/// each stage can be exercised on its own.
class FairValueComposer {
public:
    FairValueComposer() = delete;

    /// The five components in fixed order: Max Pain, Gamma Walls,
    /// Technical Levels, Volume Anchor, Round Numbers.
    [[nodiscard]] static std::vector<ComponentBreakdown>
    build_components(double max_pain, double gamma_center,
                     double technical_center, double volume_anchor,
                     double round_center,
                     const profiles::ProfileWeights& weights);

    /// Deviation beyond ±threshold decides; otherwise the trend vote does.
    [[nodiscard]] static Bias
    determine_bias(double deviation_pct, const TechnicalData& technical,
                   double threshold_pct = constants::BIAS_THRESHOLD_PCT) noexcept;

    /// max(0, 1 − penalty × std/mean) over the component values, using the
    /// population standard deviation; 0 when the mean is not positive.
    ///
    /// The penalty applies to the coefficient of variation itself, not to
    /// its square (the mean squared relative deviation). Small spreads are
    /// therefore penalised harder: components 2% apart cost 0.2 here rather
    /// than 0.004, which moves some results from HIGH to MEDIUM.
    [[nodiscard]] static double
    convergence(std::span<const ComponentBreakdown> components,
                double penalty = constants::CONVERGENCE_PENALTY);

    /// Blend of convergence, options quality and distance, clamped [0, 1].
    [[nodiscard]] static double
    confidence_score(std::span<const ComponentBreakdown> components,
                     double fair_value, double current_price,
                     std::span<const options::ExpirationAnalysis> analyses,
                     const PFVConfig& config = {});

    [[nodiscard]] static ConfidenceLevel
    grade(double score, const PFVConfig& config = {}) noexcept;

    /// Collect, de-duplicate, filter, rank and truncate magnetic levels.
    [[nodiscard]] static std::vector<MagneticLevel>
    collect_magnetic_levels(std::span<const options::ExpirationAnalysis> analyses,
                            std::span<const levels::TechnicalLevel> technical,
                            std::span<const levels::RoundNumberLevel> round,
                            double current_price,
                            bool include_all,
                            std::size_t max_levels,
                            const PFVConfig& config = {});

    /// Strength a technical level carries into the magnetic ranking.
    [[nodiscard]] static double magnetic_strength(LevelStrength strength) noexcept;

    [[nodiscard]] static MagneticLevelType
    magnetic_type(TechnicalLevelType type) noexcept;
};

// ─── Consumer Helpers ─────────────────────────────────────────────────────────

/// Per-expiration summary accepted by `quick_fair_value`.
struct QuickExpiration {
    int    dte = 0;
    double max_pain = 0.0;
    double total_oi = 0.0;
};

struct QuickFairValue {
    double fair_value = 0.0;
    Bias   bias = Bias::Neutral;
};

/// Cheap estimate without the full analysis.
///
///     (price + 0.3·MA200 + 0.4·max pain of nearest DTE) / (1 + 0.3 + 0.4)
/// with absent terms dropped; bias at ±2% deviation.
[[nodiscard]] QuickFairValue
quick_fair_value(double current_price,
                 std::optional<double> ma200,
                 std::span<const QuickExpiration> expirations) noexcept;

/// Wall prices for spread construction.
struct WallPrices {
    std::vector<double> put_walls;
    std::vector<double> call_walls;   ///< CALL_WALL and GAMMA_WALL levels
};

[[nodiscard]] WallPrices extract_walls(const PsychologicalFairValue& result);

/// The `max_levels` strongest magnetic levels.
[[nodiscard]] std::vector<MagneticLevel>
key_magnetic_levels(const PsychologicalFairValue& result, std::size_t max_levels = 5);

}  // namespace pfv
