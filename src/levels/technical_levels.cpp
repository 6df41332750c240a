/// @file src/levels/technical_levels.cpp
/// @brief TechnicalLevelAnalyzer implementation.

#include "pfv/technical_levels.hpp"

#include "pfv/weighted.hpp"

#include <algorithm>
#include <cmath>

namespace pfv::levels {

namespace {

[[nodiscard]] TechnicalLevel make_level(double price, TechnicalLevelType type,
                                        LevelStrength strength, double current) noexcept {
    return {
        .price         = price,
        .type          = type,
        .strength      = strength,
        .distance_pct  = (price - current) / current * 100.0,
        .is_support    = price < current,
        .is_resistance = price > current,
    };
}

[[nodiscard]] bool closer(const TechnicalLevel& a, const TechnicalLevel& b) noexcept {
    return std::abs(a.distance_pct) < std::abs(b.distance_pct);
}

[[nodiscard]] ConfluenceZone close_zone(std::vector<TechnicalLevel> cluster, double current) {
    ConfluenceZone zone;
    zone.low  = cluster.front().price;
    zone.high = cluster.back().price;
    zone.is_support = (zone.low + zone.high) / 2.0 < current;

    double score = 0.0;
    for (const auto& l : cluster) score += TechnicalLevelAnalyzer::strength_weight(l.strength);
    zone.strength = score / static_cast<double>(cluster.size());
    zone.levels = std::move(cluster);
    return zone;
}

}  // namespace

// ─── TechnicalLevelAnalyzer::analyze ──────────────────────────────────────────

TechnicalLevelsResult TechnicalLevelAnalyzer::analyze(const TechnicalData& data) {
    TechnicalLevelsResult result;
    const double current = data.current_price;
    result.weighted_center = current;
    if (!std::isfinite(current) || current <= 0.0) return result;

    auto& levels = result.levels;
    const auto add = [&](const std::optional<double>& field, TechnicalLevelType type,
                         LevelStrength strength) {
        if (auto price = usable(field)) levels.push_back(make_level(*price, type, strength, current));
    };

    add(data.ma20,  TechnicalLevelType::MA20,  LevelStrength::Weak);
    add(data.ma50,  TechnicalLevelType::MA50,  LevelStrength::Moderate);
    add(data.ma200, TechnicalLevelType::MA200, LevelStrength::Strong);
    add(data.fifty_two_week_high, TechnicalLevelType::FiftyTwoWeekHigh, LevelStrength::Strong);
    add(data.fifty_two_week_low,  TechnicalLevelType::FiftyTwoWeekLow,  LevelStrength::Strong);
    add(data.recent_swing_high, TechnicalLevelType::SwingHigh, LevelStrength::Moderate);
    add(data.recent_swing_low,  TechnicalLevelType::SwingLow,  LevelStrength::Moderate);
    add(data.vwap,           TechnicalLevelType::Vwap,      LevelStrength::Moderate);
    add(data.previous_close, TechnicalLevelType::PrevClose, LevelStrength::Weak);

    std::stable_sort(levels.begin(), levels.end(), closer);

    // Already ordered by distance, so the first hit on each side is nearest.
    for (const auto& l : levels) {
        if (!result.nearest_support && l.is_support) result.nearest_support = l;
        if (!result.nearest_resistance && l.is_resistance) result.nearest_resistance = l;
    }

    std::vector<double> prices;
    std::vector<double> weights;
    prices.reserve(levels.size());
    weights.reserve(levels.size());
    for (const auto& l : levels) {
        const double decay =
            1.0 / (1.0 + std::abs(l.distance_pct) / constants::TECHNICAL_DISTANCE_SCALE_PCT);
        prices.push_back(l.price);
        weights.push_back(strength_weight(l.strength) * decay);
    }
    result.weighted_center = core::weighted_average(prices, weights, current);
    return result;
}

double TechnicalLevelAnalyzer::strength_weight(LevelStrength strength) noexcept {
    switch (strength) {
        case LevelStrength::Strong:   return 3.0;
        case LevelStrength::Moderate: return 2.0;
        case LevelStrength::Weak:     return 1.0;
    }
    return 1.0;
}

// ─── Proximity and confluence ─────────────────────────────────────────────────

std::optional<TechnicalLevel>
TechnicalLevelAnalyzer::is_near_key_level(const std::vector<TechnicalLevel>& levels,
                                          double tolerance_pct) {
    for (const auto& l : levels) {
        if (std::abs(l.distance_pct) <= tolerance_pct) return l;
    }
    return std::nullopt;
}

std::vector<ConfluenceZone>
TechnicalLevelAnalyzer::find_confluence_zones(const std::vector<TechnicalLevel>& levels,
                                              double current_price,
                                              double gap_pct) {
    std::vector<ConfluenceZone> zones;
    if (levels.size() < 2) return zones;

    std::vector<TechnicalLevel> sorted = levels;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TechnicalLevel& a, const TechnicalLevel& b) {
                         return a.price < b.price;
                     });

    std::vector<TechnicalLevel> cluster{sorted.front()};
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        const double last = cluster.back().price;
        const double gap  = (sorted[i].price - last) / last * 100.0;
        if (gap <= gap_pct) {
            cluster.push_back(sorted[i]);
            continue;
        }
        if (cluster.size() >= 2) zones.push_back(close_zone(std::move(cluster), current_price));
        cluster = {sorted[i]};
    }
    if (cluster.size() >= 2) zones.push_back(close_zone(std::move(cluster), current_price));

    std::stable_sort(zones.begin(), zones.end(),
                     [](const ConfluenceZone& a, const ConfluenceZone& b) {
                         return a.strength > b.strength;
                     });
    return zones;
}

// ─── Trend and milestones ─────────────────────────────────────────────────────

Bias TechnicalLevelAnalyzer::determine_trend_bias(const TechnicalData& data) noexcept {
    const double price = data.current_price;
    const auto ma20  = usable(data.ma20);
    const auto ma50  = usable(data.ma50);
    const auto ma200 = usable(data.ma200);

    int bullish = 0;
    int total   = 0;

    if (ma200) {
        total += 2;
        if (price > *ma200) bullish += 2;
    }
    if (ma50) {
        total += 1;
        if (price > *ma50) bullish += 1;
    }
    if (ma20) {
        total += 1;
        if (price > *ma20) bullish += 1;
    }
    if (ma20 && ma50 && ma200) {
        total += 1;
        if (*ma20 > *ma50 && *ma50 > *ma200) bullish += 1;
    }

    if (total == 0) return Bias::Neutral;

    const double ratio = static_cast<double>(bullish) / static_cast<double>(total);
    if (ratio >= constants::TREND_BULLISH_RATIO) return Bias::Bullish;
    if (ratio <= constants::TREND_BEARISH_RATIO) return Bias::Bearish;
    return Bias::Neutral;
}

std::vector<Milestone> TechnicalLevelAnalyzer::calculate_milestones(const TechnicalData& data) {
    const double price = data.current_price;
    std::vector<Milestone> out;
    if (!std::isfinite(price) || price <= 0.0) return out;

    const auto pct = [price](double level) { return (level - price) / price * 100.0; };

    if (auto high = usable(data.fifty_two_week_high)) {
        out.push_back({"52-Week High", *high, pct(*high), true});
    }
    if (auto low = usable(data.fifty_two_week_low)) {
        out.push_back({"52-Week Low", *low, pct(*low), false});
    }
    if (auto ma200 = usable(data.ma200)) {
        const double d = pct(*ma200);
        out.push_back({"200 MA", *ma200, d, d > 0.0});
    }

    std::stable_sort(out.begin(), out.end(), [](const Milestone& a, const Milestone& b) {
        return std::abs(a.distance_pct) < std::abs(b.distance_pct);
    });
    return out;
}

}  // namespace pfv::levels
