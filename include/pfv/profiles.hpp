#pragma once

/// @file include/pfv/profiles.hpp
/// @brief Ticker profile registry: behavioural weighting schemes.
///
/// # Module: Profile Registry
///
/// ## Responsibility
/// Hold the five fixed behavioural profiles (BLUE_CHIP, MEME_RETAIL, ETF,
/// LOW_FLOAT, DEFAULT), each a weighting over the five fair-value signal
/// categories, and resolve which one applies to a ticker.
///
/// ## Resolution Order
///   1. A `ClassificationProvider` (by default the shipped ETF, meme and
///      blue-chip lists, checked in that order).
///   2. An ordered list of `HeuristicRule`s over the technical snapshot and
///      option open interest, first match wins.  Only consulted when a
///      technical snapshot and at least one expiration are available.
///   3. DEFAULT.
///
/// ## Guarantees
/// - `normalize_weights` output sums to 1.0 (0.2 each for an all-zero input)
/// - Profiles returned by value; the registry holds no mutable state
///
/// ## NOT Responsible For
/// - Computing any of the five component values (see fair_value.hpp)

#include "pfv/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace pfv::profiles {

// ─── Weights ──────────────────────────────────────────────────────────────────

/// Weights over the five signal categories.
struct ProfileWeights {
    double max_pain     = 0.0;
    double gamma_walls  = 0.0;
    double technical    = 0.0;
    double volume       = 0.0;
    double round_number = 0.0;

    [[nodiscard]] double sum() const noexcept {
        return max_pain + gamma_walls + technical + volume + round_number;
    }
};

/// Partial weight overrides; unset fields keep the base profile's value.
struct WeightOverrides {
    std::optional<double> max_pain;
    std::optional<double> gamma_walls;
    std::optional<double> technical;
    std::optional<double> volume;
    std::optional<double> round_number;
};

/// A named, described weighting scheme.
struct TickerProfile {
    ProfileType type = ProfileType::Default;
    std::string name;
    std::string description;
    ProfileWeights weights;
    std::vector<std::string> characteristics;
};

// ─── Registry ─────────────────────────────────────────────────────────────────

/// Stateless access to the fixed profile table.
class ProfileRegistry {
public:
    ProfileRegistry() = delete;

    /// The fixed profile for `type`.
    [[nodiscard]] static TickerProfile get_profile(ProfileType type);

    /// Rescale so the five weights sum to exactly 1.0.
    ///
    /// Negative or non-finite inputs are treated as 0.  An input summing to
    /// 0 yields 0.2 for every category.
    [[nodiscard]] static ProfileWeights
    normalize_weights(const ProfileWeights& weights) noexcept;

    /// True when the weights sum to 1.0 within 0.001.
    [[nodiscard]] static bool validate_weights(const ProfileWeights& weights) noexcept;

    /// Overlay `overrides` on `base`.  The result is NOT normalized.
    [[nodiscard]] static ProfileWeights
    merge_weights(const ProfileWeights& base,
                  const WeightOverrides& overrides) noexcept;

    /// Copy of the `base` profile with overridden weights.
    ///
    /// `name` defaults to "Custom (<base name>)".  Weights are merged but
    /// not normalized; callers that feed the composer get normalization
    /// there.
    [[nodiscard]] static TickerProfile
    create_custom_profile(ProfileType base,
                          const WeightOverrides& overrides,
                          std::optional<std::string> name = std::nullopt);
};

// ─── Classification ───────────────────────────────────────────────────────────

/// Maps a ticker symbol to a known profile, or nothing when unknown.
class ClassificationProvider {
public:
    virtual ~ClassificationProvider() = default;

    [[nodiscard]] virtual std::optional<ProfileType>
    classify(std::string_view ticker) const = 0;
};

/// Classifier backed by three fixed symbol sets, checked ETF, meme, then
/// blue-chip.  Symbols are matched case-insensitively.
class StaticTickerClassifier final : public ClassificationProvider {
public:
    StaticTickerClassifier(std::span<const std::string_view> etf,
                           std::span<const std::string_view> meme_retail,
                           std::span<const std::string_view> blue_chip);

    /// Classifier over the lists shipped with the library.
    [[nodiscard]] static std::shared_ptr<const StaticTickerClassifier>
    with_default_lists();

    [[nodiscard]] std::optional<ProfileType>
    classify(std::string_view ticker) const override;

private:
    std::unordered_set<std::string> etf_;
    std::unordered_set<std::string> meme_retail_;
    std::unordered_set<std::string> blue_chip_;
};

/// Symbols shipped as the default classification data.
[[nodiscard]] std::span<const std::string_view> default_etf_tickers() noexcept;
[[nodiscard]] std::span<const std::string_view> default_meme_tickers() noexcept;
[[nodiscard]] std::span<const std::string_view> default_blue_chip_tickers() noexcept;

// ─── Heuristics ───────────────────────────────────────────────────────────────

/// Market-data facts a heuristic may inspect.
struct HeuristicContext {
    double price    = 0.0;  ///< Current price
    double range    = 0.0;  ///< 52-week high − 52-week low; 0 if either is absent
    double total_oi = 0.0;  ///< Σ call + put OI over all expirations

    /// 52-week range / price (0 when price is not positive).
    [[nodiscard]] double volatility_proxy() const noexcept {
        return price > 0.0 ? range / price : 0.0;
    }
};

/// One (predicate, profile) pair.
struct HeuristicRule {
    std::string name;
    std::function<bool(const HeuristicContext&)> predicate;
    ProfileType profile = ProfileType::Default;
};

/// The default rules, in priority order:
///   - `high_volatility`:  range/price > 1.5            → MEME_RETAIL
///   - `low_price_volatile`: price < 20, range/price > 1 → LOW_FLOAT
///   - `institutional`:   price > 100, range/price < 0.5, OI > 100,000
///                                                       → BLUE_CHIP
[[nodiscard]] std::vector<HeuristicRule> default_heuristic_rules();

/// Build the context a heuristic sees.
[[nodiscard]] HeuristicContext
make_heuristic_context(const TechnicalData& technical,
                       std::span<const OptionsExpiration> expirations) noexcept;

// ─── Resolution ───────────────────────────────────────────────────────────────

/// Resolves a ticker to a profile using a classifier then heuristics.
class ProfileResolver {
public:
    /// Default classifier and default heuristic rules.
    ProfileResolver();

    ProfileResolver(std::shared_ptr<const ClassificationProvider> classifier,
                    std::vector<HeuristicRule> rules);

    [[nodiscard]] TickerProfile
    resolve(std::string_view ticker,
            const TechnicalData* technical,
            std::span<const OptionsExpiration> expirations) const;

    /// Profile type only; heuristics follow the same gating as `resolve`.
    [[nodiscard]] ProfileType
    resolve_type(std::string_view ticker,
                 const TechnicalData* technical,
                 std::span<const OptionsExpiration> expirations) const;

private:
    std::shared_ptr<const ClassificationProvider> classifier_;
    std::vector<HeuristicRule> rules_;
};

/// Resolve with the default classifier and rules.
[[nodiscard]] TickerProfile
resolve_profile(std::string_view ticker,
                const TechnicalData* technical = nullptr,
                std::span<const OptionsExpiration> expirations = {});

}  // namespace pfv::profiles
