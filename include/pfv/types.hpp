#pragma once

/// @file include/pfv/types.hpp
/// @brief Shared input records and enumerations for the Psychological Fair
///        Value (PFV) engine.
///
/// Every PFV module includes this file. It defines the immutable snapshot
/// records the engine is fed (option contracts, expirations, technical data)
/// and the small closed enumerations that tag levels and results.
///
/// Snapshots are produced by external collaborators (market-data providers,
/// caches) and are never mutated by the engine.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfv {

/// Calendar date of an option expiration.
using Date = std::chrono::year_month_day;

// ─── Option Chain Snapshot ────────────────────────────────────────────────────

/// One listed option at one strike.
struct OptionContract {
    double strike        = 0.0;  ///< Strike price
    double open_interest = 0.0;  ///< Contracts outstanding (≥ 0)
    double volume        = 0.0;  ///< Contracts traded today (≥ 0)
    std::optional<double> implied_volatility;
    std::optional<double> delta;
    std::optional<double> gamma;  ///< Pass-through gamma, used by GEX estimates
};

/// All calls and puts sharing one expiration date.
struct OptionsExpiration {
    Date expiration{};
    int  dte = 0;                       ///< Days to expiration (≥ 0)
    std::vector<OptionContract> calls;
    std::vector<OptionContract> puts;
    double total_call_oi = 0.0;
    double total_put_oi  = 0.0;

    [[nodiscard]] double total_oi() const noexcept {
        return total_call_oi + total_put_oi;
    }
};

// ─── Technical Snapshot ───────────────────────────────────────────────────────

/// Single technical-data snapshot for one ticker.
///
/// `current_price` is the one required field. The 52-week anchors and the
/// optional fields count as absent when they hold a non-finite or
/// non-positive value (0 for the anchors means "not supplied").
struct TechnicalData {
    double current_price = 0.0;
    std::optional<double> ma20;
    std::optional<double> ma50;
    std::optional<double> ma200;
    double fifty_two_week_high = 0.0;
    double fifty_two_week_low  = 0.0;
    std::optional<double> recent_swing_high;
    std::optional<double> recent_swing_low;
    std::optional<double> previous_close;
    std::optional<double> vwap;
    std::optional<double> avg_volume;
};

/// True when `current_price` is finite and positive.
[[nodiscard]] bool validate_technical_data(const TechnicalData& data) noexcept;

/// Returns the optional value when it is present, finite and positive.
[[nodiscard]] std::optional<double>
usable(const std::optional<double>& value) noexcept;

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// Behavioural profile of a ticker.
enum class ProfileType { BlueChip, MemeRetail, Etf, LowFloat, Default };

/// Which side of the chain a gamma wall comes from.
enum class WallType { CallWall, PutWall, Combined };

/// Source of a technical support/resistance level.
enum class TechnicalLevelType {
    MA20,
    MA50,
    MA200,
    FiftyTwoWeekHigh,
    FiftyTwoWeekLow,
    SwingHigh,
    SwingLow,
    Vwap,
    PrevClose,
};

enum class LevelStrength { Weak, Moderate, Strong };

/// Round-number tier.
enum class Significance { Major, Moderate, Minor };

/// Unified tag for a ranked magnetic level.
enum class MagneticLevelType {
    MaxPain,
    GammaWall,
    PutWall,
    CallWall,
    MA200,
    MA50,
    MA20,
    Vwap,
    RoundMajor,
    RoundModerate,
    FiftyTwoWeekHigh,
    FiftyTwoWeekLow,
    SwingHigh,
    SwingLow,
    PrevClose,
};

enum class ConfidenceLevel { High, Medium, Low };
enum class Bias { Bullish, Neutral, Bearish };
enum class DataFreshness { Fresh, Stale, Weekend };

// ─── String Conversions ───────────────────────────────────────────────────────

/// Upper-snake tags, e.g. "BLUE_CHIP", "CALL_WALL", "52W_HIGH".
[[nodiscard]] std::string_view to_string(ProfileType type) noexcept;
[[nodiscard]] std::string_view to_string(WallType type) noexcept;
[[nodiscard]] std::string_view to_string(TechnicalLevelType type) noexcept;
[[nodiscard]] std::string_view to_string(LevelStrength strength) noexcept;
[[nodiscard]] std::string_view to_string(Significance significance) noexcept;
[[nodiscard]] std::string_view to_string(MagneticLevelType type) noexcept;
[[nodiscard]] std::string_view to_string(ConfidenceLevel level) noexcept;
[[nodiscard]] std::string_view to_string(Bias bias) noexcept;
[[nodiscard]] std::string_view to_string(DataFreshness freshness) noexcept;

/// Parse a profile tag (case-insensitive, "-" accepted for "_").
[[nodiscard]] std::optional<ProfileType>
profile_type_from_string(std::string_view text) noexcept;

/// ISO-8601 "YYYY-MM-DD".
[[nodiscard]] std::string format_date(Date date);

}  // namespace pfv
