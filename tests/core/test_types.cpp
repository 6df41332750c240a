#include <gtest/gtest.h>
#include "pfv/types.hpp"

#include <chrono>
#include <limits>

using namespace pfv;

static TechnicalData valid_snapshot() {
    return TechnicalData{
        .current_price       = 188.61,
        .ma200               = 175.0,
        .fifty_two_week_high = 199.62,
        .fifty_two_week_low  = 164.08,
    };
}

// ─── validate_technical_data ──────────────────────────────────────────────────

TEST(Types_Validate, CompleteSnapshotIsValid) {
    EXPECT_TRUE(validate_technical_data(valid_snapshot()));
}

TEST(Types_Validate, ZeroPriceIsInvalid) {
    auto t = valid_snapshot();
    t.current_price = 0.0;
    EXPECT_FALSE(validate_technical_data(t));
}

TEST(Types_Validate, NonFinitePriceIsInvalid) {
    auto t = valid_snapshot();
    t.current_price = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(validate_technical_data(t));
}

TEST(Types_Validate, PriceOnlySnapshotIsValid) {
    auto t = valid_snapshot();
    t.fifty_two_week_low = 0.0;
    t.fifty_two_week_high = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(validate_technical_data(t));
    EXPECT_TRUE(validate_technical_data(TechnicalData{.current_price = 42.0}));
}

TEST(Types_Validate, OptionalFieldsDoNotMatter) {
    auto t = valid_snapshot();
    t.ma200.reset();
    t.ma20 = -5.0;
    EXPECT_TRUE(validate_technical_data(t));
}

// ─── usable ───────────────────────────────────────────────────────────────────

TEST(Types_Usable, FiltersNonPositiveAndNonFinite) {
    EXPECT_EQ(usable(std::optional<double>{}), std::nullopt);
    EXPECT_EQ(usable(std::optional<double>{0.0}), std::nullopt);
    EXPECT_EQ(usable(std::optional<double>{-1.0}), std::nullopt);
    EXPECT_EQ(usable(std::optional<double>{std::numeric_limits<double>::infinity()}),
              std::nullopt);
    EXPECT_EQ(usable(std::optional<double>{186.0}), std::optional<double>{186.0});
}

// ─── Tags ─────────────────────────────────────────────────────────────────────

TEST(Types_ToString, UpperSnakeTags) {
    EXPECT_EQ(to_string(ProfileType::BlueChip), "BLUE_CHIP");
    EXPECT_EQ(to_string(WallType::Combined), "COMBINED");
    EXPECT_EQ(to_string(TechnicalLevelType::FiftyTwoWeekHigh), "52W_HIGH");
    EXPECT_EQ(to_string(MagneticLevelType::RoundMajor), "ROUND_MAJOR");
    EXPECT_EQ(to_string(ConfidenceLevel::Medium), "MEDIUM");
    EXPECT_EQ(to_string(Bias::Bearish), "BEARISH");
    EXPECT_EQ(to_string(DataFreshness::Weekend), "WEEKEND");
}

TEST(Types_ProfileParse, AcceptsTagsCaseInsensitive) {
    EXPECT_EQ(profile_type_from_string("blue_chip"), ProfileType::BlueChip);
    EXPECT_EQ(profile_type_from_string("Meme-Retail"), ProfileType::MemeRetail);
    EXPECT_EQ(profile_type_from_string("ETF"), ProfileType::Etf);
    EXPECT_EQ(profile_type_from_string("low_float"), ProfileType::LowFloat);
    EXPECT_EQ(profile_type_from_string("default"), ProfileType::Default);
}

TEST(Types_ProfileParse, RejectsUnknown) {
    EXPECT_EQ(profile_type_from_string("growth"), std::nullopt);
    EXPECT_EQ(profile_type_from_string(""), std::nullopt);
}

TEST(Types_FormatDate, IsoFormat) {
    using namespace std::chrono;
    EXPECT_EQ(format_date(Date{year{2024}, month{3}, day{5}}), "2024-03-05");
}

TEST(Types_Expiration, TotalOpenInterest) {
    OptionsExpiration e;
    e.total_call_oi = 1500.0;
    e.total_put_oi  = 2500.0;
    EXPECT_DOUBLE_EQ(e.total_oi(), 4000.0);
}
