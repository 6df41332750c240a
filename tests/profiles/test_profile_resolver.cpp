#include <gtest/gtest.h>
#include "pfv/profiles.hpp"

#include <memory>
#include <string_view>
#include <vector>

using namespace pfv;
using namespace pfv::profiles;

static TechnicalData snapshot(double price, double high, double low) {
    return TechnicalData{
        .current_price       = price,
        .fifty_two_week_high = high,
        .fifty_two_week_low  = low,
    };
}

static std::vector<OptionsExpiration> chain_with_oi(double total) {
    OptionsExpiration e;
    e.dte = 10;
    e.total_call_oi = total / 2.0;
    e.total_put_oi  = total / 2.0;
    return {e};
}

// ─── Static classification ────────────────────────────────────────────────────

TEST(ProfileResolver_Classify, DefaultListsCaseInsensitive) {
    const auto c = StaticTickerClassifier::with_default_lists();
    EXPECT_EQ(c->classify("SPY"), ProfileType::Etf);
    EXPECT_EQ(c->classify("gme"), ProfileType::MemeRetail);
    EXPECT_EQ(c->classify("Aapl"), ProfileType::BlueChip);
    EXPECT_EQ(c->classify("ACME"), std::nullopt);
}

TEST(ProfileResolver_Classify, EtfCheckedBeforeMemeAndBlueChip) {
    constexpr std::string_view both[] = {"XYZ"};
    const StaticTickerClassifier c(both, both, both);
    EXPECT_EQ(c.classify("xyz"), ProfileType::Etf);
}

TEST(ProfileResolver_Resolve, KnownTickerSkipsHeuristics) {
    // Range/price of 2.0 would trip high_volatility, but the list wins.
    const auto t = snapshot(100.0, 250.0, 50.0);
    const auto chain = chain_with_oi(1000.0);
    EXPECT_EQ(resolve_profile("MSFT", &t, chain).type, ProfileType::BlueChip);
}

// ─── Heuristics ───────────────────────────────────────────────────────────────

TEST(ProfileResolver_Heuristics, HighVolatilityIsMeme) {
    // (250 - 50) / 100 = 2.0 > 1.5
    const auto t = snapshot(100.0, 250.0, 50.0);
    const auto chain = chain_with_oi(1000.0);
    EXPECT_EQ(resolve_profile("ZZZQ", &t, chain).type, ProfileType::MemeRetail);
}

TEST(ProfileResolver_Heuristics, CheapAndVolatileIsLowFloat) {
    // (25 - 4) / 15 = 1.4: above 1.0, below 1.5
    const auto t = snapshot(15.0, 25.0, 4.0);
    const auto chain = chain_with_oi(1000.0);
    EXPECT_EQ(resolve_profile("ZZZQ", &t, chain).type, ProfileType::LowFloat);
}

TEST(ProfileResolver_Heuristics, InstitutionalIsBlueChip) {
    // (330 - 270) / 300 = 0.2 and OI above 100k
    const auto t = snapshot(300.0, 330.0, 270.0);
    const auto chain = chain_with_oi(150'000.0);
    EXPECT_EQ(resolve_profile("ZZZQ", &t, chain).type, ProfileType::BlueChip);
}

TEST(ProfileResolver_Heuristics, InstitutionalNeedsOpenInterest) {
    const auto t = snapshot(300.0, 330.0, 270.0);
    const auto chain = chain_with_oi(50'000.0);
    EXPECT_EQ(resolve_profile("ZZZQ", &t, chain).type, ProfileType::Default);
}

TEST(ProfileResolver_Heuristics, NeedTechnicalAndExpirations) {
    const auto t = snapshot(100.0, 250.0, 50.0);
    EXPECT_EQ(resolve_profile("ZZZQ", &t, {}).type, ProfileType::Default);
    const auto chain = chain_with_oi(1000.0);
    EXPECT_EQ(resolve_profile("ZZZQ", nullptr, chain).type, ProfileType::Default);
}

TEST(ProfileResolver_Heuristics, ContextAggregatesOpenInterest) {
    const auto t = snapshot(50.0, 60.0, 40.0);
    std::vector<OptionsExpiration> chain(2);
    chain[0].total_call_oi = 100.0;
    chain[1].total_put_oi  = 250.0;
    const auto ctx = make_heuristic_context(t, chain);
    EXPECT_DOUBLE_EQ(ctx.total_oi, 350.0);
    EXPECT_DOUBLE_EQ(ctx.range, 20.0);
    EXPECT_DOUBLE_EQ(ctx.volatility_proxy(), 0.4);
}

TEST(ProfileResolver_Heuristics, MissingAnchorMeansNoRange) {
    const auto ctx = make_heuristic_context(snapshot(10.0, 40.0, 0.0), chain_with_oi(1000.0));
    EXPECT_DOUBLE_EQ(ctx.range, 0.0);

    // Without a range neither volatility rule can fire.
    const ProfileResolver resolver;
    const auto t = snapshot(10.0, 40.0, 0.0);
    EXPECT_EQ(resolver.resolve_type("ZZZQ", &t, chain_with_oi(1000.0)), ProfileType::Default);
}

// ─── Injected collaborators ───────────────────────────────────────────────────

namespace {

class FixedClassifier final : public ClassificationProvider {
public:
    explicit FixedClassifier(ProfileType t) : type_(t) {}

    std::optional<ProfileType> classify(std::string_view ticker) const override {
        if (ticker == "HOUSE") return type_;
        return std::nullopt;
    }

private:
    ProfileType type_;
};

}  // namespace

TEST(ProfileResolver_Injected, CustomClassifierAndRules) {
    std::vector<HeuristicRule> rules = {
        {.name = "always_etf",
         .predicate = [](const HeuristicContext&) { return true; },
         .profile = ProfileType::Etf},
    };
    const ProfileResolver resolver(std::make_shared<FixedClassifier>(ProfileType::LowFloat),
                                   std::move(rules));

    const auto t = snapshot(100.0, 110.0, 90.0);
    const auto chain = chain_with_oi(10.0);
    EXPECT_EQ(resolver.resolve_type("HOUSE", &t, chain), ProfileType::LowFloat);
    EXPECT_EQ(resolver.resolve_type("OTHER", &t, chain), ProfileType::Etf);
    // SPY is not in the injected classifier's data.
    EXPECT_EQ(resolver.resolve_type("SPY", nullptr, {}), ProfileType::Default);
}

TEST(ProfileResolver_Injected, NullClassifierFallsThrough) {
    const ProfileResolver resolver(nullptr, default_heuristic_rules());
    EXPECT_EQ(resolver.resolve("SPY", nullptr, {}).type, ProfileType::Default);
}
