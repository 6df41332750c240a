/// @file src/levels/round_numbers.cpp
/// @brief RoundNumberAnalyzer implementation.

#include "pfv/round_numbers.hpp"

#include "pfv/weighted.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <utility>

namespace pfv::levels {

namespace {

/// 2^53: past this, consecutive multiples are no longer distinct doubles.
constexpr double MAX_EXACT_MULTIPLE = 9007199254740992.0;

[[nodiscard]] int significance_rank(Significance s) noexcept {
    switch (s) {
        case Significance::Major:    return 3;
        case Significance::Moderate: return 2;
        case Significance::Minor:    return 1;
    }
    return 1;
}

[[nodiscard]] double significance_base(Significance s) noexcept {
    switch (s) {
        case Significance::Major:    return 1.0;
        case Significance::Moderate: return 0.6;
        case Significance::Minor:    return 0.3;
    }
    return 0.3;
}

[[nodiscard]] double roundness_bonus(double price) noexcept {
    if (std::fmod(price, 100.0) == 0.0) return 0.2;
    if (std::fmod(price, 50.0) == 0.0)  return 0.1;
    if (std::fmod(price, 25.0) == 0.0)  return 0.05;
    return 0.0;
}

/// Keep one level per exact price, preferring the higher tier; the slot of
/// the first occurrence is kept.
[[nodiscard]] std::vector<RoundNumberLevel> deduplicate(std::vector<RoundNumberLevel> levels) {
    std::vector<RoundNumberLevel> out;
    out.reserve(levels.size());
    std::map<double, std::size_t> slot_by_price;
    for (auto& level : levels) {
        const auto [it, inserted] = slot_by_price.try_emplace(level.price, out.size());
        if (inserted) {
            out.push_back(std::move(level));
        } else if (significance_rank(level.significance) >
                   significance_rank(out[it->second].significance)) {
            out[it->second] = std::move(level);
        }
    }
    return out;
}

}  // namespace

// ─── RoundNumberAnalyzer::analyze ─────────────────────────────────────────────

RoundNumbersResult RoundNumberAnalyzer::analyze(double current_price, double band) {
    RoundNumbersResult result;
    result.magnetic_center = current_price;
    if (!std::isfinite(current_price) || current_price <= 0.0) return result;

    const double min_price = current_price * (1.0 - band);
    const double max_price = current_price * (1.0 + band);

    const RoundIntervals iv = intervals_for(current_price);
    const std::array<std::pair<double, Significance>, 3> tiers{{
        {iv.major,    Significance::Major},
        {iv.moderate, Significance::Moderate},
        {iv.minor,    Significance::Minor},
    }};

    // Multiples of each interval inside the band, as [first, last].
    std::array<std::pair<std::int64_t, std::int64_t>, 3> spans{};
    for (std::size_t t = 0; t < tiers.size(); ++t) {
        const double interval = tiers[t].first;
        const double first = std::ceil(min_price / interval);
        const double last  = std::floor(max_price / interval);
        if (!(std::abs(first) < MAX_EXACT_MULTIPLE) || !(std::abs(last) < MAX_EXACT_MULTIPLE) ||
            last - first >= static_cast<double>(constants::ROUND_NUMBER_MAX_LEVELS_PER_TIER)) {
            return result;
        }
        spans[t] = {static_cast<std::int64_t>(first), static_cast<std::int64_t>(last)};
    }

    std::vector<RoundNumberLevel> raw;
    for (std::size_t t = 0; t < tiers.size(); ++t) {
        const auto& [interval, significance] = tiers[t];
        for (std::int64_t k = spans[t].first; k <= spans[t].second; ++k) {
            const double price = static_cast<double>(k) * interval;
            if (price <= 0.0 || price < min_price || price > max_price) continue;
            raw.push_back({
                .price         = price,
                .significance  = significance,
                .distance_pct  = (price - current_price) / current_price * 100.0,
                .magnetic_pull = magnetic_pull(price, current_price, significance),
            });
        }
    }

    result.levels = deduplicate(std::move(raw));
    std::stable_sort(result.levels.begin(), result.levels.end(),
                     [](const RoundNumberLevel& a, const RoundNumberLevel& b) {
                         return a.magnetic_pull > b.magnetic_pull;
                     });

    for (const auto& l : result.levels) {
        if (l.significance != Significance::Major) continue;
        if (!result.nearest_major ||
            std::abs(l.distance_pct) < std::abs(result.nearest_major->distance_pct)) {
            result.nearest_major = l;
        }
    }

    std::vector<double> prices;
    std::vector<double> pulls;
    prices.reserve(result.levels.size());
    pulls.reserve(result.levels.size());
    for (const auto& l : result.levels) {
        prices.push_back(l.price);
        pulls.push_back(l.magnetic_pull);
    }
    result.magnetic_center = core::weighted_average(prices, pulls, current_price);
    return result;
}

RoundIntervals RoundNumberAnalyzer::intervals_for(double price) noexcept {
    if (price >= 500.0) return {100.0, 50.0, 25.0};
    if (price >= 100.0) return {50.0, 25.0, 10.0};
    if (price >= 50.0)  return {25.0, 10.0, 5.0};
    if (price >= 20.0)  return {10.0, 5.0, 2.5};
    if (price >= 10.0)  return {5.0, 2.5, 1.0};
    return {1.0, 0.5, 0.25};
}

double RoundNumberAnalyzer::magnetic_pull(double level_price, double current_price,
                                          Significance significance) noexcept {
    if (!(current_price > 0.0)) return 0.0;
    const double distance = std::abs((level_price - current_price) / current_price);
    const double decay    = std::exp(-distance * constants::ROUND_NUMBER_DECAY);
    const double pull     = (significance_base(significance) + roundness_bonus(level_price)) * decay;
    return std::min(1.0, pull);
}

// ─── Helpers ──────────────────────────────────────────────────────────────────

std::optional<RoundNumberLevel>
RoundNumberAnalyzer::find_strongest_magnet(double current_price, double max_distance_pct) {
    const auto result = analyze(current_price, max_distance_pct / 100.0);

    std::optional<RoundNumberLevel> best;
    for (const auto& l : result.levels) {
        if (std::abs(l.distance_pct) > max_distance_pct) continue;
        if (!best || l.magnetic_pull > best->magnetic_pull) best = l;
    }
    return best;
}

std::optional<RoundNumberLevel>
RoundNumberAnalyzer::is_at_round_number(double current_price, double tolerance_pct) {
    const auto result = analyze(current_price, 0.05);
    for (const auto& l : result.levels) {
        if (std::abs(l.distance_pct) <= tolerance_pct) return l;
    }
    return std::nullopt;
}

std::vector<double> RoundNumberAnalyzer::midpoint_levels(double current_price) {
    const double major = intervals_for(current_price).major;
    const double base  = std::floor(current_price / major) * major;

    std::vector<double> out;
    for (int i = -2; i <= 2; ++i) {
        const double midpoint = base + i * major + major / 2.0;
        if (midpoint > 0.0) out.push_back(midpoint);
    }
    return out;
}

Bias RoundNumberAnalyzer::round_number_bias(double current_price) {
    const auto result = analyze(current_price, 0.05);

    std::optional<double> below;
    std::optional<double> above;
    for (const auto& l : result.levels) {
        if (l.significance != Significance::Major) continue;
        if (l.price < current_price && (!below || l.price > *below)) below = l.price;
        if (l.price > current_price && (!above || l.price < *above)) above = l.price;
    }
    if (!below && !above) return Bias::Neutral;

    constexpr double inf = std::numeric_limits<double>::infinity();
    const double dist_below = below ? std::abs((current_price - *below) / current_price) : inf;
    const double dist_above = above ? std::abs((*above - current_price) / current_price) : inf;

    if (dist_below < dist_above * 0.5) return Bias::Bullish;
    if (dist_above < dist_below * 0.5) return Bias::Bearish;
    return Bias::Neutral;
}

}  // namespace pfv::levels
