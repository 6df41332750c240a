#include <gtest/gtest.h>
#include "pfv/fair_value.hpp"
#include "pfv/weighted.hpp"

#include <chrono>
#include <limits>
#include <string>
#include <vector>

using namespace pfv;

// ─── Fixtures ─────────────────────────────────────────────────────────────────

static Date ymd(int y, unsigned m, unsigned d) {
    return Date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
}

/// Strikes 160..215 step 5 with 1 000 OI per side, plus a 20 000 put wall at
/// 180 and a 20 000 call wall at 195.
static OptionsExpiration walled_chain(Date date, int dte) {
    OptionsExpiration e;
    e.expiration = date;
    e.dte = dte;
    for (int k = 160; k < 220; k += 5) {
        const double call_oi = (k == 195) ? 20'000.0 : 1'000.0;
        const double put_oi  = (k == 180) ? 20'000.0 : 1'000.0;
        e.calls.push_back({.strike = static_cast<double>(k), .open_interest = call_oi});
        e.puts.push_back({.strike = static_cast<double>(k), .open_interest = put_oi});
        e.total_call_oi += call_oi;
        e.total_put_oi  += put_oi;
    }
    return e;
}

static PFVInput acme_input() {
    return PFVInput{
        .ticker    = "ACME",
        .technical = TechnicalData{
            .current_price       = 188.61,
            .ma200               = 175.0,
            .fifty_two_week_high = 199.62,
            .fifty_two_week_low  = 164.08,
        },
        .expirations = {walled_chain(ymd(2024, 3, 15), 30)},
    };
}

/// Saturday 2024-03-16 12:00 UTC: a weekend in every time zone.
static std::chrono::system_clock::time_point saturday_noon() {
    return std::chrono::sys_days{ymd(2024, 3, 16)} + std::chrono::hours{12};
}

// ─── Validation ───────────────────────────────────────────────────────────────

TEST(FairValueEngine_Validate, UnusablePriceGivesNullopt) {
    const FairValueEngine engine;

    auto input = acme_input();
    input.technical.current_price = 0.0;
    EXPECT_FALSE(engine.calculate(input).has_value());

    input.technical.current_price = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(engine.calculate(input).has_value());
}

TEST(FairValueEngine_Validate, BadFiftyTwoWeekAnchorIsDropped) {
    auto input = acme_input();
    input.technical.fifty_two_week_low = -1.0;
    const auto r = FairValueEngine{}.calculate_at(input, {}, saturday_noon());
    ASSERT_TRUE(r.has_value());
    for (const auto& l : r->magnetic_levels) {
        EXPECT_NE(l.type, MagneticLevelType::FiftyTwoWeekLow);
    }
}

// ─── Full pipeline ────────────────────────────────────────────────────────────

TEST(FairValueEngine_Calculate, ComponentValues) {
    const FairValueEngine engine;
    const auto r = engine.calculate_at(acme_input(), {}, saturday_noon());
    ASSERT_TRUE(r.has_value());

    ASSERT_EQ(r->components.size(), 5u);
    EXPECT_DOUBLE_EQ(r->components[0].value, 185.0);          // max pain
    EXPECT_DOUBLE_EQ(r->components[1].value, 187.5);          // (180 + 195) / 2
    EXPECT_NEAR(r->components[2].value, 181.556849, 1e-6);   // technical center
    EXPECT_NEAR(r->components[3].value, 181.556849, 1e-6);   // no VWAP: technical center
    EXPECT_NEAR(r->components[4].value, 192.845603, 1e-6);   // round-number center
}

TEST(FairValueEngine_Calculate, HeadlineNumbers) {
    const FairValueEngine engine;
    const auto r = engine.calculate_at(acme_input(), {}, saturday_noon());
    ASSERT_TRUE(r.has_value());

    // 0.30·185 + 0.10·187.5 + 0.25·181.5568 + 0.20·181.5568 + 0.15·192.8456
    EXPECT_DOUBLE_EQ(r->fair_value, 184.88);
    EXPECT_DOUBLE_EQ(r->current_price, 188.61);
    EXPECT_DOUBLE_EQ(r->deviation_pct, -2.0);
    EXPECT_DOUBLE_EQ(r->deviation_dollars, -3.733);

    // −1.98% is inside ±2%, so the trend vote (price above MA200) decides.
    EXPECT_EQ(r->bias, Bias::Bullish);

    EXPECT_NEAR(r->confidence_score, 0.773028, 1e-6);
    EXPECT_EQ(r->confidence, ConfidenceLevel::High);
}

TEST(FairValueEngine_Calculate, UnlistedTickerUsesDefaultProfile) {
    const FairValueEngine engine;
    const auto r = engine.calculate_at(acme_input(), {}, saturday_noon());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->profile.type, ProfileType::Default);
    EXPECT_EQ(r->profile.name, "Standard");
    EXPECT_NEAR(r->profile.weights.sum(), 1.0, 1e-12);
}

TEST(FairValueEngine_Calculate, ExpirationAnalysis) {
    const FairValueEngine engine;
    const auto r = engine.calculate_at(acme_input(), {}, saturday_noon());
    ASSERT_TRUE(r.has_value());

    ASSERT_EQ(r->expiration_analysis.size(), 1u);
    EXPECT_DOUBLE_EQ(r->expiration_analysis[0].weight, 1.0);
    EXPECT_TRUE(r->expiration_analysis[0].is_monthly_opex);
    ASSERT_TRUE(r->primary_expiration.has_value());
    EXPECT_EQ(r->primary_expiration->dte, 30);
    EXPECT_NEAR(r->primary_expiration->max_pain.confidence, 0.689613, 1e-6);
}

TEST(FairValueEngine_Calculate, MagneticLevels) {
    const FairValueEngine engine;
    const auto r = engine.calculate_at(acme_input(), {}, saturday_noon());
    ASSERT_TRUE(r.has_value());

    const auto& levels = r->magnetic_levels;
    ASSERT_EQ(levels.size(), 7u);
    EXPECT_EQ(levels[0].type, MagneticLevelType::PutWall);
    EXPECT_DOUBLE_EQ(levels[0].price, 180.0);
    EXPECT_EQ(levels[1].type, MagneticLevelType::CallWall);
    EXPECT_DOUBLE_EQ(levels[1].price, 195.0);
    EXPECT_EQ(levels[2].type, MagneticLevelType::FiftyTwoWeekHigh);
    EXPECT_EQ(levels[3].type, MagneticLevelType::MA200);
    EXPECT_EQ(levels[4].type, MagneticLevelType::FiftyTwoWeekLow);
    EXPECT_EQ(levels[5].type, MagneticLevelType::RoundMajor);
    EXPECT_DOUBLE_EQ(levels[5].price, 200.0);
    EXPECT_EQ(levels[6].type, MagneticLevelType::MaxPain);

    for (std::size_t i = 1; i < levels.size(); ++i) {
        EXPECT_GE(levels[i - 1].strength, levels[i].strength);
    }

    const auto walls = extract_walls(*r);
    EXPECT_EQ(walls.put_walls, (std::vector<double>{180.0}));
    EXPECT_EQ(walls.call_walls, (std::vector<double>{195.0}));
}

TEST(FairValueEngine_Calculate, TimestampAndFreshness) {
    const FairValueEngine engine;
    const auto now = saturday_noon();
    const auto r = engine.calculate_at(acme_input(), {}, now);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->calculated_at, now);
    EXPECT_EQ(r->data_freshness, DataFreshness::Weekend);
}

TEST(FairValueEngine_Calculate, Deterministic) {
    const FairValueEngine engine;
    const auto a = engine.calculate_at(acme_input(), {}, saturday_noon());
    const auto b = engine.calculate_at(acme_input(), {}, saturday_noon());
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->fair_value, b->fair_value);
    EXPECT_EQ(a->confidence_score, b->confidence_score);
    EXPECT_EQ(a->ai_context, b->ai_context);
    EXPECT_EQ(a->interpretation, b->interpretation);
}

// ─── Without options data ─────────────────────────────────────────────────────

TEST(FairValueEngine_NoOptions, OptionsComponentsFallBackToPrice) {
    const PFVInput input{
        .ticker    = "ZZZQ",
        .technical = TechnicalData{
            .current_price       = 100.0,
            .fifty_two_week_high = 120.0,
            .fifty_two_week_low  = 80.0,
        },
    };
    const auto r = calculate_psychological_fair_value(input);
    ASSERT_TRUE(r.has_value());

    for (const auto& c : r->components) EXPECT_NEAR(c.value, 100.0, 1e-9) << c.name;
    EXPECT_DOUBLE_EQ(r->fair_value, 100.0);
    EXPECT_DOUBLE_EQ(r->deviation_pct, 0.0);
    EXPECT_EQ(r->bias, Bias::Neutral);
    EXPECT_TRUE(r->expiration_analysis.empty());
    EXPECT_FALSE(r->primary_expiration.has_value());

    // Options quality falls back to 0.3: 0.4 + 0.12 + 0.2
    EXPECT_NEAR(r->confidence_score, 0.72, 1e-9);

    ASSERT_EQ(r->magnetic_levels.size(), 3u);
    EXPECT_EQ(r->magnetic_levels[0].type, MagneticLevelType::RoundMajor);
    EXPECT_DOUBLE_EQ(r->magnetic_levels[0].price, 100.0);
}

TEST(FairValueEngine_Degenerate, PriceOnlyBlendsPriceAndRoundCenter) {
    const PFVInput input{
        .ticker    = "ZZZQ",
        .technical = TechnicalData{.current_price = 100.0},
    };
    const auto r = FairValueEngine{}.calculate_at(input, {}, saturday_noon());
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->expiration_analysis.empty());
    EXPECT_FALSE(r->primary_expiration.has_value());
    EXPECT_FALSE(r->support_zone.has_value());
    EXPECT_FALSE(r->resistance_zone.has_value());

    // Max pain, gamma, technical and volume anchors all fall back to price.
    ASSERT_EQ(r->components.size(), 5u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_DOUBLE_EQ(r->components[i].value, 100.0) << r->components[i].name;
    }
    const auto rounds = levels::RoundNumberAnalyzer::analyze(100.0);
    EXPECT_DOUBLE_EQ(r->components[4].value, rounds.magnetic_center);

    double expected = 0.0;
    for (const auto& c : r->components) expected += c.weight * c.value;
    EXPECT_NEAR(r->fair_value, core::round_price(expected), 1e-9);
    EXPECT_NEAR(r->fair_value, 100.0, 1e-9);
    // The score still follows the blend; the grade does not.
    EXPECT_NEAR(r->confidence_score, 0.72, 1e-9);
    EXPECT_EQ(r->confidence, ConfidenceLevel::Low);
    EXPECT_NE(r->interpretation.find("Confidence is LOW"), std::string::npos);

    // Only the round 100 clears the strength floor.
    ASSERT_EQ(r->magnetic_levels.size(), 1u);
    EXPECT_EQ(r->magnetic_levels[0].type, MagneticLevelType::RoundMajor);
    EXPECT_DOUBLE_EQ(r->magnetic_levels[0].price, 100.0);
}

TEST(FairValueEngine_NoOptions, DteWindowExcludesEverything) {
    PFVOptions opts;
    opts.max_dte = 20;
    const auto r = FairValueEngine{}.calculate(acme_input(), opts);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->expiration_analysis.empty());
    // Max pain and gamma center fall back to the current price.
    EXPECT_DOUBLE_EQ(r->components[0].value, 188.61);
    EXPECT_DOUBLE_EQ(r->components[1].value, 188.61);
}

// ─── Profiles and weights ─────────────────────────────────────────────────────

TEST(FairValueEngine_Profile, OverrideSelectsProfile) {
    auto input = acme_input();
    input.profile_override = ProfileType::Etf;
    const auto r = calculate_psychological_fair_value(input);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->profile.type, ProfileType::Etf);
    EXPECT_DOUBLE_EQ(r->components[0].weight, 0.35);
}

TEST(FairValueEngine_Profile, ListedTickerResolves) {
    auto input = acme_input();
    input.ticker = "spy";
    const auto r = calculate_psychological_fair_value(input);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->profile.type, ProfileType::Etf);
}

TEST(FairValueEngine_Profile, CustomWeightsAreNormalized) {
    PFVOptions opts;
    opts.custom_weights = profiles::WeightOverrides{
        .max_pain = 2.0, .gamma_walls = 0.0, .technical = 0.0,
        .volume = 0.0, .round_number = 0.0,
    };
    const auto r = calculate_psychological_fair_value(acme_input(), opts);
    ASSERT_TRUE(r.has_value());
    EXPECT_DOUBLE_EQ(r->profile.weights.max_pain, 1.0);
    // All weight on max pain: the fair value is the max-pain strike.
    EXPECT_DOUBLE_EQ(r->fair_value, 185.0);
}

TEST(FairValueEngine_Profile, InjectedResolver) {
    std::vector<profiles::HeuristicRule> rules = {
        {.name = "everything_low_float",
         .predicate = [](const profiles::HeuristicContext&) { return true; },
         .profile = ProfileType::LowFloat},
    };
    const FairValueEngine engine(PFVConfig{}, profiles::ProfileResolver(nullptr, std::move(rules)));
    const auto r = engine.calculate(acme_input());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->profile.type, ProfileType::LowFloat);
}

// ─── Zones and options ────────────────────────────────────────────────────────

TEST(FairValueEngine_Zones, SupportAndResistanceClusters) {
    const PFVInput input{
        .ticker    = "ZZZQ",
        .technical = TechnicalData{
            .current_price       = 100.0,
            .ma20                = 101.0,
            .ma50                = 101.5,
            .ma200               = 95.0,
            .fifty_two_week_high = 130.0,
            .fifty_two_week_low  = 70.0,
            .recent_swing_low    = 94.0,
        },
    };
    const auto r = calculate_psychological_fair_value(input);
    ASSERT_TRUE(r.has_value());

    ASSERT_TRUE(r->support_zone.has_value());
    EXPECT_DOUBLE_EQ(r->support_zone->low, 94.0);
    EXPECT_DOUBLE_EQ(r->support_zone->high, 95.0);

    ASSERT_TRUE(r->resistance_zone.has_value());
    EXPECT_DOUBLE_EQ(r->resistance_zone->low, 101.0);
    EXPECT_DOUBLE_EQ(r->resistance_zone->high, 101.5);
}

TEST(FairValueEngine_Options, MaxMagneticLevels) {
    PFVOptions opts;
    opts.max_magnetic_levels = 2;
    const auto r = calculate_psychological_fair_value(acme_input(), opts);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->magnetic_levels.size(), 2u);
}

TEST(FairValueEngine_Options, IncludeAllLevels) {
    PFVOptions opts;
    opts.include_all_levels = true;
    const auto r = calculate_psychological_fair_value(acme_input(), opts);
    ASSERT_TRUE(r.has_value());
    // Round 190 and 225 fall under 0.3 and join; 180 and 175 stay merged.
    EXPECT_GT(r->magnetic_levels.size(), 7u);
}

// ─── Text summaries ───────────────────────────────────────────────────────────

TEST(FairValueEngine_Text, InterpretationAndContext) {
    const auto r = FairValueEngine{}.calculate_at(acme_input(), {}, saturday_noon());
    ASSERT_TRUE(r.has_value());

    EXPECT_EQ(r->interpretation,
              "Price is trading 2.0% above fair value ($184.88). "
              "Options mechanics and technical levels suggest gravitational pull upward. "
              "(Profile: Standard)");

    EXPECT_NE(r->ai_context.find("=== PSYCHOLOGICAL FAIR VALUE: ACME ==="), std::string::npos);
    EXPECT_NE(r->ai_context.find("Fair Value: $184.88"), std::string::npos);
    EXPECT_NE(r->ai_context.find("2024-03-15 (30 DTE) [MONTHLY OPEX]: Max Pain $185.00"),
              std::string::npos);
}

TEST(FairValueEngine_Text, NearMonthlyOpexNote) {
    auto input = acme_input();
    input.expirations = {walled_chain(ymd(2024, 3, 15), 5)};
    const auto r = calculate_psychological_fair_value(input);
    ASSERT_TRUE(r.has_value());
    EXPECT_NE(r->interpretation.find("Monthly OPEX in 5 days - max pain magnetism strongest."),
              std::string::npos);
}
