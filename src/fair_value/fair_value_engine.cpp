/// @file src/fair_value/fair_value_engine.cpp
/// @brief FairValueEngine: the full Psychological Fair Value pipeline.

#include "pfv/fair_value.hpp"

#include "pfv/report.hpp"
#include "pfv/weighted.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstdio>
#include <utility>

namespace pfv {

// ─── Construction ─────────────────────────────────────────────────────────────

FairValueEngine::FairValueEngine(PFVConfig config)
    : config_(std::move(config))
{}

FairValueEngine::FairValueEngine(PFVConfig config, profiles::ProfileResolver resolver)
    : config_(std::move(config))
    , resolver_(std::move(resolver))
{}

options::MultiExpiryConfig
FairValueEngine::expiry_config(const PFVOptions& opts) const noexcept {
    return options::MultiExpiryConfig{
        .min_dte            = opts.min_dte,
        .max_dte            = opts.max_dte,
        .decay_days         = config_.expiration_decay_days,
        .monthly_multiplier = config_.monthly_opex_multiplier,
        .weekly_multiplier  = config_.weekly_opex_multiplier,
        .max_pain           = config_.max_pain,
        .gamma_walls        = config_.gamma_walls,
    };
}

// ─── FairValueEngine::calculate ───────────────────────────────────────────────

std::optional<PsychologicalFairValue>
FairValueEngine::calculate(const PFVInput& input, const PFVOptions& opts) const {
    return calculate_at(input, opts, std::chrono::system_clock::now());
}

std::optional<PsychologicalFairValue>
FairValueEngine::calculate_at(const PFVInput& input,
                              const PFVOptions& opts,
                              std::chrono::system_clock::time_point now) const {
    const TechnicalData& technical = input.technical;
    if (!validate_technical_data(technical)) {
        if (opts.verbose) {
            fmt::print(stderr, "[pfv] {}: unusable current price, no result\n", input.ticker);
        }
        return std::nullopt;
    }
    const double price = technical.current_price;

    // ── Step 1: Resolve the profile and its final weights ────────────────────
    profiles::TickerProfile profile =
        input.profile_override
            ? profiles::ProfileRegistry::get_profile(*input.profile_override)
            : resolver_.resolve(input.ticker, &technical, input.expirations);

    profiles::ProfileWeights weights = profile.weights;
    if (opts.custom_weights) {
        weights = profiles::ProfileRegistry::merge_weights(weights, *opts.custom_weights);
    }
    profile.weights = profiles::ProfileRegistry::normalize_weights(weights);

    // ── Step 2: Per-expiration analysis ──────────────────────────────────────
    auto analyses =
        options::MultiExpiryAggregator::analyze(input.expirations, price, expiry_config(opts));

    // ── Step 3: Component values ─────────────────────────────────────────────
    const double max_pain =
        options::MultiExpiryAggregator::weighted_max_pain(analyses, price);
    const double gamma_center =
        options::MultiExpiryAggregator::weighted_gamma_center(analyses, price);

    const auto tech   = levels::TechnicalLevelAnalyzer::analyze(technical);
    const auto rounds = levels::RoundNumberAnalyzer::analyze(price, config_.round_number_band);
    const double volume_anchor = usable(technical.vwap).value_or(tech.weighted_center);

    auto components = FairValueComposer::build_components(
        max_pain, gamma_center, tech.weighted_center, volume_anchor,
        rounds.magnetic_center, profile.weights);

    // ── Step 4: Fair value, deviation and bias ───────────────────────────────
    double fair_value = 0.0;
    for (const auto& c : components) fair_value += c.contribution;

    const double deviation_dollars = fair_value - price;
    const double deviation_pct     = deviation_dollars / price * 100.0;
    const Bias bias =
        FairValueComposer::determine_bias(deviation_pct, technical, config_.bias_threshold_pct);

    // ── Step 5: Confidence ───────────────────────────────────────────────────
    const double score =
        FairValueComposer::confidence_score(components, fair_value, price, analyses, config_);
    // Nothing but price and round numbers behind the estimate.
    const bool uncorroborated = analyses.empty() && tech.levels.empty();
    const ConfidenceLevel confidence =
        uncorroborated ? ConfidenceLevel::Low : FairValueComposer::grade(score, config_);

    // ── Step 6: Magnetic levels and zones ────────────────────────────────────
    auto magnetic = FairValueComposer::collect_magnetic_levels(
        analyses, tech.levels, rounds.levels, price,
        opts.include_all_levels, opts.max_magnetic_levels, config_);

    std::optional<PriceZone> support_zone;
    std::optional<PriceZone> resistance_zone;
    // Zones arrive strongest first.
    for (const auto& zone : levels::TechnicalLevelAnalyzer::find_confluence_zones(
             tech.levels, price, config_.zone_gap_pct)) {
        const PriceZone rounded{core::round_price(zone.low), core::round_price(zone.high)};
        if (zone.is_support && !support_zone) support_zone = rounded;
        if (!zone.is_support && !resistance_zone) resistance_zone = rounded;
    }

    if (opts.verbose) {
        fmt::print(stderr, "[pfv] {}: profile {} ({} expirations kept of {})\n",
                   input.ticker, to_string(profile.type), analyses.size(),
                   input.expirations.size());
        for (const auto& c : components) {
            fmt::print(stderr, "[pfv] {}: {} = {:.4f} x {:.3f}\n",
                       input.ticker, c.name, c.value, c.weight);
        }
        fmt::print(stderr, "[pfv] {}: fair value {:.4f}, confidence score {:.3f} ({})\n",
                   input.ticker, fair_value, score, to_string(confidence));
    }

    // ── Step 7: Text summaries ───────────────────────────────────────────────
    PsychologicalFairValue result;
    result.ai_context = report::build_ai_context(
        input.ticker, fair_value, price, deviation_pct, bias, confidence,
        components, magnetic, analyses);
    result.interpretation = report::build_interpretation(
        fair_value, price, deviation_pct, bias, confidence, profile, analyses);

    result.ticker            = input.ticker;
    result.fair_value        = core::round_price(fair_value);
    result.current_price     = price;
    result.confidence        = confidence;
    result.confidence_score  = score;
    result.deviation_pct     = core::round_percent(deviation_pct);
    result.deviation_dollars = core::round_price(deviation_dollars);
    result.bias              = bias;
    result.profile           = std::move(profile);
    result.components        = std::move(components);
    result.primary_expiration  = options::MultiExpiryAggregator::primary_expiration(analyses);
    result.expiration_analysis = std::move(analyses);
    result.magnetic_levels   = std::move(magnetic);
    result.support_zone      = support_zone;
    result.resistance_zone   = resistance_zone;
    result.calculated_at     = now;
    result.data_freshness    = data_freshness(now, config_.trading_hours);
    return result;
}

// ─── Free function ────────────────────────────────────────────────────────────

std::optional<PsychologicalFairValue>
calculate_psychological_fair_value(const PFVInput& input, const PFVOptions& opts) {
    const FairValueEngine engine;
    return engine.calculate(input, opts);
}

}  // namespace pfv
