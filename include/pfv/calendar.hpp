#pragma once

/// @file include/pfv/calendar.hpp
/// @brief Expiration calendar helpers and snapshot freshness tagging.

#include "pfv/constants.hpp"
#include "pfv/types.hpp"

#include <chrono>

namespace pfv {

/// Monthly OPEX: a Friday falling on day-of-month 15..21 (third Friday).
[[nodiscard]] bool is_monthly_opex(Date date) noexcept;

/// Weekly OPEX: any Friday that is not a monthly OPEX.
[[nodiscard]] bool is_weekly_opex(Date date) noexcept;

/// Trading-hours window, in local whole hours [open_hour, close_hour).
struct TradingHours {
    int open_hour  = constants::TRADING_OPEN_HOUR;
    int close_hour = constants::TRADING_CLOSE_HOUR;
};

/// Freshness of a snapshot taken at local wall-clock time `local_time`.
///
/// Saturday or Sunday gives WEEKEND; an hour outside `hours` gives STALE;
/// otherwise FRESH.
[[nodiscard]] DataFreshness
classify_freshness(std::chrono::local_seconds local_time,
                   const TradingHours& hours = {}) noexcept;

/// Freshness of `now` interpreted in the process's local time zone.
///
/// Falls back to UTC when the local zone cannot be determined.
[[nodiscard]] DataFreshness
data_freshness(std::chrono::system_clock::time_point now,
               const TradingHours& hours = {}) noexcept;

}  // namespace pfv
