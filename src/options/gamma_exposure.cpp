/// @file src/options/gamma_exposure.cpp
/// @brief Dollar gamma exposure per strike and the gamma flip point.

#include "pfv/gamma_walls.hpp"

#include <cmath>
#include <map>

namespace pfv::options {

namespace {

[[nodiscard]] double contract_gamma(const OptionContract& c, double spot, int dte) noexcept {
    if (c.gamma && std::isfinite(*c.gamma) && *c.gamma != 0.0) return *c.gamma;
    return estimate_gamma(c.strike, spot, dte);
}

}  // namespace

double estimate_gamma(double strike, double spot, int dte) noexcept {
    if (!(spot > 0.0) || dte < 0) return 0.0;
    const double moneyness  = std::abs(spot - strike) / spot;
    const double time_decay = std::sqrt(static_cast<double>(dte) / 365.0);
    return constants::GAMMA_ESTIMATE_PEAK *
           std::exp(-moneyness * constants::GAMMA_ESTIMATE_MONEYNESS_DECAY) * time_decay;
}

std::vector<StrikeExposure>
estimate_gamma_exposure(const OptionsExpiration& expiration, double current_price) {
    std::map<double, StrikeExposure> by_strike;
    const double scale = constants::CONTRACT_MULTIPLIER * current_price;

    for (const auto& c : expiration.calls) {
        if (!std::isfinite(c.strike)) continue;
        auto& e = by_strike[c.strike];
        e.strike = c.strike;
        e.call_gex += contract_gamma(c, current_price, expiration.dte) * c.open_interest * scale;
    }
    for (const auto& p : expiration.puts) {
        if (!std::isfinite(p.strike)) continue;
        auto& e = by_strike[p.strike];
        e.strike = p.strike;
        e.put_gex += contract_gamma(p, current_price, expiration.dte) * p.open_interest * scale;
    }

    std::vector<StrikeExposure> out;
    out.reserve(by_strike.size());
    for (auto& [strike, e] : by_strike) {
        e.net_gex = e.call_gex - e.put_gex;
        out.push_back(e);
    }
    return out;
}

std::optional<double> find_gamma_flip(const std::vector<StrikeExposure>& exposures) noexcept {
    for (std::size_t i = 0; i + 1 < exposures.size(); ++i) {
        const auto& cur  = exposures[i];
        const auto& next = exposures[i + 1];
        const bool flips = (cur.net_gex > 0.0 && next.net_gex < 0.0) ||
                           (cur.net_gex < 0.0 && next.net_gex > 0.0);
        if (!flips) continue;

        const double ratio = std::abs(cur.net_gex) /
                             (std::abs(cur.net_gex) + std::abs(next.net_gex));
        return cur.strike + ratio * (next.strike - cur.strike);
    }
    return std::nullopt;
}

}  // namespace pfv::options
