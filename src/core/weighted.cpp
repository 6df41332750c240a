/// @file src/core/weighted.cpp
/// @brief Weighted averages, normalization and display rounding.
///
/// Vectors are mapped into Eigen without copying; every reduction is a dot
/// product or a sum over the mapped view.

#include "pfv/weighted.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace pfv::core {

namespace {

using ConstVecMap = Eigen::Map<const Eigen::VectorXd>;

[[nodiscard]] ConstVecMap as_vector(std::span<const double> v) noexcept {
    return ConstVecMap(v.data(), static_cast<Eigen::Index>(v.size()));
}

}  // namespace

// ─── Weighted reductions ──────────────────────────────────────────────────────

double weighted_average(std::span<const double> values,
                        std::span<const double> weights,
                        double fallback) noexcept {
    if (values.empty() || values.size() != weights.size()) return fallback;

    const auto v = as_vector(values);
    const auto w = as_vector(weights);

    const double total = w.sum();
    if (!std::isfinite(total) || total <= 0.0) return fallback;

    const double result = v.dot(w) / total;
    return std::isfinite(result) ? result : fallback;
}

double weighted_sum(std::span<const double> values,
                    std::span<const double> weights,
                    double fallback) noexcept {
    if (values.empty() || values.size() != weights.size()) return fallback;

    const double result = as_vector(values).dot(as_vector(weights));
    return std::isfinite(result) ? result : fallback;
}

std::vector<double> normalize(std::span<const double> weights) {
    const auto n = static_cast<Eigen::Index>(weights.size());
    if (n == 0) return {};

    Eigen::VectorXd w = as_vector(weights).unaryExpr([](double x) {
        return (std::isfinite(x) && x > 0.0) ? x : 0.0;
    });

    const double total = w.sum();
    if (std::isfinite(total) && total > 0.0) {
        w /= total;
    } else {
        w.setConstant(1.0 / static_cast<double>(n));
    }
    return {w.data(), w.data() + n};
}

MeanStd mean_and_stddev(std::span<const double> values) noexcept {
    if (values.empty()) return {};

    const auto v = as_vector(values);
    const double mean = v.mean();
    // Population variance (n denominator).
    const double var = (v.array() - mean).square().mean();
    return {mean, std::sqrt(var)};
}

// ─── Rounding ─────────────────────────────────────────────────────────────────

double round_price(double price) noexcept {
    if (!std::isfinite(price)) return price;
    if (std::abs(price) >= 10.0) return std::round(price * 100.0) / 100.0;
    return std::round(price * 1000.0) / 1000.0;
}

double round_percent(double pct) noexcept {
    if (!std::isfinite(pct)) return pct;
    return std::round(pct * 10.0) / 10.0;
}

}  // namespace pfv::core
