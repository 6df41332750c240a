#pragma once

/// @file include/pfv/data_loader.hpp
/// @brief CSV loader for technical snapshots and option chains.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse the two snapshot files the CLI feeds the engine.  The engine itself
/// owns no file format; this is a thin consumer-side convenience.
///
/// ## Technical Snapshot CSV
/// ```
/// current_price,ma20,ma50,ma200,fifty_two_week_high,fifty_two_week_low,vwap
/// 188.61,,186.00,175.00,199.62,164.08,
/// ```
/// A header row naming fields (any order, unknown columns ignored) and one
/// data row.  Blank cells are absent.  Recognised fields: `current_price`,
/// `ma20`, `ma50`, `ma200`, `fifty_two_week_high`, `fifty_two_week_low`,
/// `recent_swing_high`, `recent_swing_low`, `previous_close`, `vwap`,
/// `avg_volume`.
///
/// ## Option Chain CSV
/// ```
/// expiration,dte,type,strike,open_interest,volume,implied_volatility,delta,gamma
/// 2024-03-15,30,call,190,12000,800,0.24,0.45,0.031
/// ```
/// The last three columns are optional.  `type` is `call`/`put` (or `C`/`P`).
/// Rows are grouped by expiration date, in first-seen order, and the
/// per-expiration OI totals are computed from the rows.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load

#include "pfv/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pfv::core {

class DataLoader {
public:
    /// Load a technical snapshot from disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened or holds no data row
    [[nodiscard]] static std::optional<TechnicalData>
    load_technical(const std::string& filepath) noexcept;

    /// Parse a technical snapshot from CSV text.  `nullopt` when there is
    /// no header or no data row.
    [[nodiscard]] static std::optional<TechnicalData>
    parse_technical(const std::string& csv_content) noexcept;

    /// Load an option chain from disk; `nullopt` if it cannot be opened.
    [[nodiscard]] static std::optional<std::vector<OptionsExpiration>>
    load_chain(const std::string& filepath) noexcept;

    /// Parse an option chain from CSV text.  The first line is a header.
    [[nodiscard]] static std::vector<OptionsExpiration>
    parse_chain(const std::string& csv_content) noexcept;

    /// Parse "YYYY-MM-DD".
    [[nodiscard]] static std::optional<Date> parse_date(std::string_view text) noexcept;

private:
    [[nodiscard]] static std::optional<double> parse_number(std::string_view token) noexcept;
};

}  // namespace pfv::core
