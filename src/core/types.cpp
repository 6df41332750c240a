/// @file src/core/types.cpp
/// @brief Enumeration tags and snapshot validation.

#include "pfv/types.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cmath>
#include <string>

namespace pfv {

namespace {

[[nodiscard]] bool positive_finite(double x) noexcept {
    return std::isfinite(x) && x > 0.0;
}

}  // namespace

// ─── Validation ───────────────────────────────────────────────────────────────

bool validate_technical_data(const TechnicalData& data) noexcept {
    return positive_finite(data.current_price);
}

std::optional<double> usable(const std::optional<double>& value) noexcept {
    if (value && positive_finite(*value)) return value;
    return std::nullopt;
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string_view to_string(ProfileType type) noexcept {
    switch (type) {
        case ProfileType::BlueChip:   return "BLUE_CHIP";
        case ProfileType::MemeRetail: return "MEME_RETAIL";
        case ProfileType::Etf:        return "ETF";
        case ProfileType::LowFloat:   return "LOW_FLOAT";
        case ProfileType::Default:    return "DEFAULT";
    }
    return "DEFAULT";
}

std::string_view to_string(WallType type) noexcept {
    switch (type) {
        case WallType::CallWall: return "CALL_WALL";
        case WallType::PutWall:  return "PUT_WALL";
        case WallType::Combined: return "COMBINED";
    }
    return "COMBINED";
}

std::string_view to_string(TechnicalLevelType type) noexcept {
    switch (type) {
        case TechnicalLevelType::MA20:             return "MA20";
        case TechnicalLevelType::MA50:             return "MA50";
        case TechnicalLevelType::MA200:            return "MA200";
        case TechnicalLevelType::FiftyTwoWeekHigh: return "52W_HIGH";
        case TechnicalLevelType::FiftyTwoWeekLow:  return "52W_LOW";
        case TechnicalLevelType::SwingHigh:        return "SWING_HIGH";
        case TechnicalLevelType::SwingLow:         return "SWING_LOW";
        case TechnicalLevelType::Vwap:             return "VWAP";
        case TechnicalLevelType::PrevClose:        return "PREV_CLOSE";
    }
    return "MA20";
}

std::string_view to_string(LevelStrength strength) noexcept {
    switch (strength) {
        case LevelStrength::Weak:     return "WEAK";
        case LevelStrength::Moderate: return "MODERATE";
        case LevelStrength::Strong:   return "STRONG";
    }
    return "WEAK";
}

std::string_view to_string(Significance significance) noexcept {
    switch (significance) {
        case Significance::Major:    return "MAJOR";
        case Significance::Moderate: return "MODERATE";
        case Significance::Minor:    return "MINOR";
    }
    return "MINOR";
}

std::string_view to_string(MagneticLevelType type) noexcept {
    switch (type) {
        case MagneticLevelType::MaxPain:          return "MAX_PAIN";
        case MagneticLevelType::GammaWall:        return "GAMMA_WALL";
        case MagneticLevelType::PutWall:          return "PUT_WALL";
        case MagneticLevelType::CallWall:         return "CALL_WALL";
        case MagneticLevelType::MA200:            return "MA200";
        case MagneticLevelType::MA50:             return "MA50";
        case MagneticLevelType::MA20:             return "MA20";
        case MagneticLevelType::Vwap:             return "VWAP";
        case MagneticLevelType::RoundMajor:       return "ROUND_MAJOR";
        case MagneticLevelType::RoundModerate:    return "ROUND_MODERATE";
        case MagneticLevelType::FiftyTwoWeekHigh: return "52W_HIGH";
        case MagneticLevelType::FiftyTwoWeekLow:  return "52W_LOW";
        case MagneticLevelType::SwingHigh:        return "SWING_HIGH";
        case MagneticLevelType::SwingLow:         return "SWING_LOW";
        case MagneticLevelType::PrevClose:        return "PREV_CLOSE";
    }
    return "MAX_PAIN";
}

std::string_view to_string(ConfidenceLevel level) noexcept {
    switch (level) {
        case ConfidenceLevel::High:   return "HIGH";
        case ConfidenceLevel::Medium: return "MEDIUM";
        case ConfidenceLevel::Low:    return "LOW";
    }
    return "LOW";
}

std::string_view to_string(Bias bias) noexcept {
    switch (bias) {
        case Bias::Bullish: return "BULLISH";
        case Bias::Neutral: return "NEUTRAL";
        case Bias::Bearish: return "BEARISH";
    }
    return "NEUTRAL";
}

std::string_view to_string(DataFreshness freshness) noexcept {
    switch (freshness) {
        case DataFreshness::Fresh:   return "FRESH";
        case DataFreshness::Stale:   return "STALE";
        case DataFreshness::Weekend: return "WEEKEND";
    }
    return "STALE";
}

// ─── Parsing ──────────────────────────────────────────────────────────────────

std::optional<ProfileType> profile_type_from_string(std::string_view text) noexcept {
    std::string key;
    key.reserve(text.size());
    for (char c : text) {
        if (c == '-' || c == ' ') {
            key.push_back('_');
        } else {
            key.push_back(static_cast<char>(
                std::toupper(static_cast<unsigned char>(c))));
        }
    }

    for (ProfileType type : {ProfileType::BlueChip, ProfileType::MemeRetail,
                             ProfileType::Etf, ProfileType::LowFloat,
                             ProfileType::Default}) {
        if (key == to_string(type)) return type;
    }
    return std::nullopt;
}

std::string format_date(Date date) {
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

}  // namespace pfv
