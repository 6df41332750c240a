/// @file src/core/calendar.cpp
/// @brief OPEX calendar checks and freshness tagging.

#include "pfv/calendar.hpp"

#include <ctime>

namespace pfv {

namespace {

[[nodiscard]] bool is_friday(Date date) noexcept {
    if (!date.ok()) return false;
    return std::chrono::weekday{std::chrono::sys_days{date}} == std::chrono::Friday;
}

}  // namespace

// ─── OPEX ─────────────────────────────────────────────────────────────────────

bool is_monthly_opex(Date date) noexcept {
    if (!is_friday(date)) return false;
    const unsigned day = static_cast<unsigned>(date.day());
    return day >= 15 && day <= 21;
}

bool is_weekly_opex(Date date) noexcept {
    return is_friday(date) && !is_monthly_opex(date);
}

// ─── Freshness ────────────────────────────────────────────────────────────────

DataFreshness classify_freshness(std::chrono::local_seconds local_time,
                                 const TradingHours& hours) noexcept {
    const auto day = std::chrono::floor<std::chrono::days>(local_time);
    const std::chrono::weekday wd{day};
    if (wd == std::chrono::Saturday || wd == std::chrono::Sunday) {
        return DataFreshness::Weekend;
    }

    const std::chrono::hh_mm_ss time_of_day{local_time - day};
    const auto hour = static_cast<int>(time_of_day.hours().count());
    if (hour < hours.open_hour || hour >= hours.close_hour) {
        return DataFreshness::Stale;
    }
    return DataFreshness::Fresh;
}

DataFreshness data_freshness(std::chrono::system_clock::time_point now,
                             const TradingHours& hours) noexcept {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm parts{};
    if (localtime_r(&t, &parts) == nullptr && gmtime_r(&t, &parts) == nullptr) {
        return DataFreshness::Stale;
    }

    const Date date{std::chrono::year{parts.tm_year + 1900},
                    std::chrono::month{static_cast<unsigned>(parts.tm_mon + 1)},
                    std::chrono::day{static_cast<unsigned>(parts.tm_mday)}};
    const std::chrono::local_seconds local =
        std::chrono::local_days{date} +
        std::chrono::hours{parts.tm_hour} +
        std::chrono::minutes{parts.tm_min} +
        std::chrono::seconds{parts.tm_sec};
    return classify_freshness(local, hours);
}

}  // namespace pfv
