#include <gtest/gtest.h>
#include "pfv/calendar.hpp"

#include <chrono>

using namespace pfv;
using namespace std::chrono;

static Date ymd(int y, unsigned m, unsigned d) {
    return Date{year{y}, month{m}, day{d}};
}

static local_seconds at(Date date, int hour, int minute = 0) {
    return local_days{date} + hours{hour} + minutes{minute};
}

// ─── OPEX ─────────────────────────────────────────────────────────────────────

TEST(Calendar_Opex, ThirdFridayIsMonthly) {
    // March 2024: Fridays fall on 1, 8, 15, 22, 29.
    EXPECT_TRUE(is_monthly_opex(ymd(2024, 3, 15)));
    EXPECT_FALSE(is_weekly_opex(ymd(2024, 3, 15)));
}

TEST(Calendar_Opex, OtherFridaysAreWeekly) {
    EXPECT_TRUE(is_weekly_opex(ymd(2024, 3, 8)));
    EXPECT_TRUE(is_weekly_opex(ymd(2024, 3, 22)));
    EXPECT_FALSE(is_monthly_opex(ymd(2024, 3, 22)));
}

TEST(Calendar_Opex, DayWindowEdges) {
    // 2024-06-21 is a Friday on day 21 (inside), 2024-11-15 on day 15.
    EXPECT_TRUE(is_monthly_opex(ymd(2024, 6, 21)));
    EXPECT_TRUE(is_monthly_opex(ymd(2024, 11, 15)));
    // 2024-02-16 is the third Friday of February.
    EXPECT_TRUE(is_monthly_opex(ymd(2024, 2, 16)));
}

TEST(Calendar_Opex, NonFridayIsNeither) {
    // 2024-03-18 is a Monday.
    EXPECT_FALSE(is_monthly_opex(ymd(2024, 3, 18)));
    EXPECT_FALSE(is_weekly_opex(ymd(2024, 3, 18)));
}

TEST(Calendar_Opex, InvalidDateIsNeither) {
    EXPECT_FALSE(is_monthly_opex(ymd(2024, 2, 30)));
    EXPECT_FALSE(is_weekly_opex(ymd(2024, 2, 30)));
}

// ─── Freshness ────────────────────────────────────────────────────────────────

TEST(Calendar_Freshness, WeekdayMarketHoursIsFresh) {
    // 2024-03-13 is a Wednesday.
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 10, 30)), DataFreshness::Fresh);
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 9)), DataFreshness::Fresh);
}

TEST(Calendar_Freshness, WeekdayOffHoursIsStale) {
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 8, 59)), DataFreshness::Stale);
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 16)), DataFreshness::Stale);
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 22)), DataFreshness::Stale);
}

TEST(Calendar_Freshness, SaturdayAndSundayAreWeekend) {
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 16), 12)), DataFreshness::Weekend);
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 17), 12)), DataFreshness::Weekend);
}

TEST(Calendar_Freshness, CustomTradingHours) {
    const TradingHours extended{.open_hour = 4, .close_hour = 20};
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 5), extended), DataFreshness::Fresh);
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 19, 59), extended), DataFreshness::Fresh);
    EXPECT_EQ(classify_freshness(at(ymd(2024, 3, 13), 20), extended), DataFreshness::Stale);
}
