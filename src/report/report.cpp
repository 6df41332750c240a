/// @file src/report/report.cpp
/// @brief Plain-text renderings of PFV results.

#include "pfv/report.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace pfv::report {

namespace {

/// Accumulates lines and joins them with '\n' (no trailing newline).
class Lines {
public:
    template <typename... Args>
    void add(fmt::format_string<Args...> format, Args&&... args) {
        lines_.push_back(fmt::format(format, std::forward<Args>(args)...));
    }

    void blank() { lines_.emplace_back(); }

    [[nodiscard]] std::string join() const {
        std::string out;
        for (std::size_t i = 0; i < lines_.size(); ++i) {
            if (i > 0) out += '\n';
            out += lines_[i];
        }
        return out;
    }

private:
    std::vector<std::string> lines_;
};

/// Whole number with thousands separators: 12345.4 -> "12,345".
[[nodiscard]] std::string with_commas(double value) {
    const auto whole = static_cast<long long>(std::llround(std::abs(value)));
    std::string digits = fmt::format("{}", whole);
    std::string out;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) out += ',';
        out += digits[i];
    }
    return value < 0.0 && whole != 0 ? "-" + out : out;
}

[[nodiscard]] std::string wall_label(WallType type) {
    std::string label{to_string(type)};
    std::replace(label.begin(), label.end(), '_', ' ');
    return label;
}

[[nodiscard]] std::string_view side_marker(bool above) noexcept {
    return above ? "[R]" : "[S]";
}

}  // namespace

// ─── Small helpers ────────────────────────────────────────────────────────────

std::string_view max_pain_confidence_label(double confidence) noexcept {
    if (confidence > 0.7) return "HIGH";
    if (confidence > 0.4) return "MEDIUM";
    return "LOW";
}

std::string signed_pct(double pct) {
    return pct > 0.0 ? fmt::format("+{:.1f}%", pct) : fmt::format("{:.1f}%", pct);
}

// ─── Per-module reports ───────────────────────────────────────────────────────

std::string format_max_pain(const options::MaxPainResult& result) {
    Lines out;
    out.add("Max Pain: ${:.2f}", result.price);
    out.add("Expiration: {}", format_date(result.expiration));
    out.add("DTE: {}", result.dte);
    out.add("Confidence: {} ({:.0f}%)",
            max_pain_confidence_label(result.confidence), result.confidence * 100.0);
    out.add("Call Pain at MP: ${:.2f}M", result.call_pain / 1'000'000.0);
    out.add("Put Pain at MP: ${:.2f}M", result.put_pain / 1'000'000.0);
    return out.join();
}

std::string format_gamma_walls(const options::GammaWallsResult& result, double current_price) {
    Lines out;
    out.add("Gamma Wall Analysis (Current: ${:.2f})", current_price);
    out.add("Center of Gravity: ${:.2f}", result.center);
    out.blank();

    if (result.strongest_resistance) {
        const auto& r = *result.strongest_resistance;
        out.add("Strongest Resistance: ${} ({:.1f}x median OI)", r.strike, r.relative_strength);
    }
    if (result.strongest_support) {
        const auto& s = *result.strongest_support;
        out.add("Strongest Support: ${} ({:.1f}x median OI)", s.strike, s.relative_strength);
    }

    if (!result.walls.empty()) {
        out.blank();
        out.add("All Gamma Walls:");
        const std::size_t n = std::min<std::size_t>(result.walls.size(), 10);
        for (std::size_t i = 0; i < n; ++i) {
            const auto& w = result.walls[i];
            out.add("  {} ${} - {} ({:.1f}x, OI: {})",
                    side_marker(w.is_resistance), w.strike, wall_label(w.type),
                    w.relative_strength, with_commas(w.open_interest));
        }
    }
    return out.join();
}

std::string format_technical_levels(const levels::TechnicalLevelsResult& result) {
    Lines out;
    out.add("Technical Level Analysis");
    out.add("Weighted Center: ${:.2f}", result.weighted_center);
    out.blank();

    if (result.nearest_resistance) {
        const auto& r = *result.nearest_resistance;
        out.add("Nearest Resistance: ${:.2f} ({}, {:.1f}% away)",
                r.price, to_string(r.type), r.distance_pct);
    }
    if (result.nearest_support) {
        const auto& s = *result.nearest_support;
        out.add("Nearest Support: ${:.2f} ({}, {:.1f}% away)",
                s.price, to_string(s.type), std::abs(s.distance_pct));
    }

    out.blank();
    out.add("All Levels:");
    for (const auto& l : result.levels) {
        out.add("  {} ${:.2f} - {} ({}, {})",
                side_marker(l.is_resistance), l.price, to_string(l.type),
                to_string(l.strength), signed_pct(l.distance_pct));
    }
    return out.join();
}

std::string format_round_numbers(const levels::RoundNumbersResult& result, double current_price) {
    Lines out;
    out.add("Round Number Analysis (Current: ${:.2f})", current_price);
    out.add("Magnetic Center: ${:.2f}", result.magnetic_center);
    out.blank();

    if (result.nearest_major) {
        const auto& m = *result.nearest_major;
        out.add("Nearest Major: ${:.2f} ({} {:.1f}%)",
                m.price, m.price > current_price ? "up" : "down", std::abs(m.distance_pct));
    }

    out.blank();
    out.add("Significant Levels:");
    const std::size_t n = std::min<std::size_t>(result.levels.size(), 10);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& l = result.levels[i];
        out.add("  ${:.2f} - {} ({}, pull: {:.0f}%)",
                l.price, to_string(l.significance), signed_pct(l.distance_pct),
                l.magnetic_pull * 100.0);
    }
    return out.join();
}

std::string format_multi_expiration(std::span<const options::ExpirationAnalysis> analyses) {
    if (analyses.empty()) return "No expiration data available.";

    Lines out;
    out.add("Multi-Expiration Analysis");
    out.blank();

    const std::size_t n = std::min<std::size_t>(analyses.size(), 5);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = analyses[i];
        const std::string_view opex = a.is_monthly_opex ? " [MONTHLY OPEX]"
                                    : a.is_weekly_opex  ? " [WEEKLY]"
                                                        : "";
        out.add("{} ({} DTE){}", format_date(a.expiration), a.dte, opex);
        out.add("   Weight: {:.1f}%", a.weight * 100.0);
        out.add("   Max Pain: ${:.2f} (conf: {:.0f}%)",
                a.max_pain.price, a.max_pain.confidence * 100.0);
        out.add("   Gamma Center: ${:.2f}", a.gamma_walls.center);
        out.blank();
    }

    out.add("{}", std::string(40, '-'));
    out.add("Weighted Max Pain: ${:.2f}",
            options::MultiExpiryAggregator::weighted_max_pain(analyses));
    out.add("Weighted Gamma Center: ${:.2f}",
            options::MultiExpiryAggregator::weighted_gamma_center(analyses));
    return out.join();
}

// ─── Full result ──────────────────────────────────────────────────────────────

std::string format_pfv_result(const PsychologicalFairValue& result) {
    const std::string rule(50, '=');
    const std::string box_edge = "+" + std::string(50, '-') + "+";

    Lines out;
    out.add("{}", rule);
    out.add("PSYCHOLOGICAL FAIR VALUE: {}", result.ticker);
    out.add("{}", rule);
    out.blank();
    out.add("Current Price:  ${:.2f}", result.current_price);
    out.add("Fair Value:     ${:.2f}", result.fair_value);
    out.add("Deviation:      {} ({})", signed_pct(result.deviation_pct), to_string(result.bias));
    out.add("Confidence:     {}", to_string(result.confidence));
    out.add("Profile:        {}", result.profile.name);
    out.add("Data:           {}", to_string(result.data_freshness));
    out.blank();

    out.add("{}", box_edge);
    out.add("| {:<48} |", "COMPONENT BREAKDOWN");
    out.add("{}", box_edge);
    for (const auto& c : result.components) {
        out.add("| {:<20} ${:>8.2f} {:>6} {:>11}|",
                c.name, c.value, fmt::format("({:.0f}%)", c.weight * 100.0), "");
    }
    out.add("{}", box_edge);
    out.blank();

    out.add("MAGNETIC LEVELS:");
    const std::size_t n = std::min<std::size_t>(result.magnetic_levels.size(), 8);
    for (std::size_t i = 0; i < n; ++i) {
        const auto& l = result.magnetic_levels[i];
        out.add("  {} ${:>8.2f} - {:<12} ({})",
                side_marker(l.distance_pct >= 0.0), l.price, to_string(l.type),
                signed_pct(l.distance_pct));
    }

    if (result.support_zone) {
        out.blank();
        out.add("Support Zone: ${:.2f} - ${:.2f}", result.support_zone->low, result.support_zone->high);
    }
    if (result.resistance_zone) {
        out.add("Resistance Zone: ${:.2f} - ${:.2f}",
                result.resistance_zone->low, result.resistance_zone->high);
    }

    out.blank();
    out.add("INTERPRETATION:");
    out.add("{}", result.interpretation);
    out.blank();
    out.add("{}", rule);
    return out.join();
}

// ─── Stored summaries ─────────────────────────────────────────────────────────

std::string build_ai_context(const std::string& ticker,
                             double fair_value, double current_price, double deviation_pct,
                             Bias bias, ConfidenceLevel confidence,
                             std::span<const ComponentBreakdown> components,
                             std::span<const MagneticLevel> magnetic_levels,
                             std::span<const options::ExpirationAnalysis> analyses) {
    Lines out;
    out.add("=== PSYCHOLOGICAL FAIR VALUE: {} ===", ticker);
    out.blank();
    out.add("Current Price: ${:.2f}", current_price);
    out.add("Fair Value: ${:.2f}", fair_value);
    out.add("Deviation: {}", signed_pct(deviation_pct));
    out.add("Bias: {}", to_string(bias));
    out.add("Confidence: {}", to_string(confidence));
    out.blank();

    out.add("COMPONENT BREAKDOWN:");
    for (const auto& c : components) {
        out.add("  {}: ${:.2f} ({:.0f}% weight)", c.name, c.value, c.weight * 100.0);
    }

    out.blank();
    out.add("KEY MAGNETIC LEVELS:");
    const std::size_t n_levels = std::min<std::size_t>(magnetic_levels.size(), 8);
    for (std::size_t i = 0; i < n_levels; ++i) {
        const auto& l = magnetic_levels[i];
        out.add("  ${:.2f} - {} ({})", l.price, to_string(l.type), signed_pct(l.distance_pct));
    }

    if (!analyses.empty()) {
        out.blank();
        out.add("OPTIONS EXPIRATIONS ANALYZED:");
        const std::size_t n_exp = std::min<std::size_t>(analyses.size(), 3);
        for (std::size_t i = 0; i < n_exp; ++i) {
            const auto& a = analyses[i];
            out.add("  {} ({} DTE){}: Max Pain ${:.2f}",
                    format_date(a.expiration), a.dte,
                    a.is_monthly_opex ? " [MONTHLY OPEX]" : "", a.max_pain.price);
        }
    }

    out.blank();
    out.add("=== END PFV ===");
    return out.join();
}

std::string build_interpretation(double fair_value, double current_price, double deviation_pct,
                                 Bias bias, ConfidenceLevel confidence,
                                 const profiles::TickerProfile& profile,
                                 std::span<const options::ExpirationAnalysis> analyses) {
    // Where price sits relative to fair value.
    const std::string_view direction = current_price > fair_value ? "above" : "below";
    const double magnitude = std::abs(deviation_pct);

    std::string text;
    auto out = std::back_inserter(text);

    if (magnitude < 1.0) {
        text = "Price is trading very close to psychological fair value. "
               "The market appears efficiently priced at current levels.";
    } else if (magnitude < 3.0) {
        fmt::format_to(out, "Price is trading {:.1f}% {} fair value (${:.2f}). ",
                       magnitude, direction, fair_value);
        switch (bias) {
            case Bias::Bullish:
                text += "Options mechanics and technical levels suggest gravitational pull upward.";
                break;
            case Bias::Bearish:
                text += "Options mechanics and technical levels suggest gravitational pull downward.";
                break;
            case Bias::Neutral:
                text += "The bias is neutral with no strong directional pull.";
                break;
        }
    } else {
        fmt::format_to(out, "Price is trading significantly {} fair value ({:.1f}% deviation). ",
                       direction, magnitude);
        if (direction == "below") {
            fmt::format_to(out, "Mean reversion suggests potential upside toward ${:.2f}.",
                           fair_value);
        } else {
            fmt::format_to(out, "Price may be extended; watch for pullback toward ${:.2f}.",
                           fair_value);
        }
    }

    if (confidence == ConfidenceLevel::Low) {
        text += " Note: Confidence is LOW due to limited data or divergent signals.";
    }

    fmt::format_to(out, " (Profile: {})", profile.name);

    if (!analyses.empty()) {
        const auto& primary = analyses.front();
        if (primary.is_monthly_opex && primary.dte <= 7) {
            fmt::format_to(out, " Monthly OPEX in {} days - max pain magnetism strongest.",
                           primary.dte);
        }
    }
    return text;
}

}  // namespace pfv::report
