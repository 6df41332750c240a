/// @file src/profiles/profile_resolver.cpp
/// @brief Ticker classification and heuristic profile resolution.

#include "pfv/profiles.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace pfv::profiles {

namespace {

[[nodiscard]] std::string upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

[[nodiscard]] std::unordered_set<std::string>
to_set(std::span<const std::string_view> symbols) {
    std::unordered_set<std::string> set;
    set.reserve(symbols.size());
    for (auto s : symbols) set.insert(upper(s));
    return set;
}

}  // namespace

// ─── StaticTickerClassifier ───────────────────────────────────────────────────

StaticTickerClassifier::StaticTickerClassifier(std::span<const std::string_view> etf,
                                               std::span<const std::string_view> meme_retail,
                                               std::span<const std::string_view> blue_chip)
    : etf_(to_set(etf))
    , meme_retail_(to_set(meme_retail))
    , blue_chip_(to_set(blue_chip)) {}

std::shared_ptr<const StaticTickerClassifier> StaticTickerClassifier::with_default_lists() {
    return std::make_shared<StaticTickerClassifier>(
        default_etf_tickers(), default_meme_tickers(), default_blue_chip_tickers());
}

std::optional<ProfileType> StaticTickerClassifier::classify(std::string_view ticker) const {
    const std::string key = upper(ticker);
    if (etf_.contains(key))         return ProfileType::Etf;
    if (meme_retail_.contains(key)) return ProfileType::MemeRetail;
    if (blue_chip_.contains(key))   return ProfileType::BlueChip;
    return std::nullopt;
}

// ─── Heuristics ───────────────────────────────────────────────────────────────

std::vector<HeuristicRule> default_heuristic_rules() {
    return {
        {
            .name      = "high_volatility",
            .predicate = [](const HeuristicContext& c) {
                return c.volatility_proxy() > 1.5;
            },
            .profile   = ProfileType::MemeRetail,
        },
        {
            .name      = "low_price_volatile",
            .predicate = [](const HeuristicContext& c) {
                return c.price < 20.0 && c.volatility_proxy() > 1.0;
            },
            .profile   = ProfileType::LowFloat,
        },
        {
            .name      = "institutional",
            .predicate = [](const HeuristicContext& c) {
                return c.price > 100.0 && c.volatility_proxy() < 0.5 &&
                       c.total_oi > 100'000.0;
            },
            .profile   = ProfileType::BlueChip,
        },
    };
}

HeuristicContext make_heuristic_context(const TechnicalData& technical,
                                        std::span<const OptionsExpiration> expirations) noexcept {
    double total_oi = 0.0;
    for (const auto& e : expirations) total_oi += e.total_oi();

    const auto high = usable(technical.fifty_two_week_high);
    const auto low  = usable(technical.fifty_two_week_low);
    const double range = high && low ? *high - *low : 0.0;
    return {
        .price    = technical.current_price,
        .range    = std::isfinite(range) ? range : 0.0,
        .total_oi = total_oi,
    };
}

// ─── ProfileResolver ──────────────────────────────────────────────────────────

ProfileResolver::ProfileResolver()
    : ProfileResolver(StaticTickerClassifier::with_default_lists(),
                      default_heuristic_rules()) {}

ProfileResolver::ProfileResolver(std::shared_ptr<const ClassificationProvider> classifier,
                                 std::vector<HeuristicRule> rules)
    : classifier_(std::move(classifier))
    , rules_(std::move(rules)) {}

ProfileType ProfileResolver::resolve_type(std::string_view ticker,
                                          const TechnicalData* technical,
                                          std::span<const OptionsExpiration> expirations) const {
    if (classifier_) {
        if (auto known = classifier_->classify(ticker)) return *known;
    }

    if (technical != nullptr && !expirations.empty()) {
        const HeuristicContext ctx = make_heuristic_context(*technical, expirations);
        for (const auto& rule : rules_) {
            if (rule.predicate && rule.predicate(ctx)) return rule.profile;
        }
    }

    return ProfileType::Default;
}

TickerProfile ProfileResolver::resolve(std::string_view ticker,
                                       const TechnicalData* technical,
                                       std::span<const OptionsExpiration> expirations) const {
    return ProfileRegistry::get_profile(resolve_type(ticker, technical, expirations));
}

TickerProfile resolve_profile(std::string_view ticker,
                              const TechnicalData* technical,
                              std::span<const OptionsExpiration> expirations) {
    const ProfileResolver resolver;
    return resolver.resolve(ticker, technical, expirations);
}

}  // namespace pfv::profiles
