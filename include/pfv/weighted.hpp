#pragma once

/// @file include/pfv/weighted.hpp
/// @brief Weighted-average and normalization helpers shared by every
///        weighted-center computation in the engine.
///
/// All helpers guard against empty inputs, zero weight sums and non-finite
/// values, returning the caller's fallback instead of dividing by zero.

#include <span>
#include <vector>

namespace pfv::core {

/// Σ v_i·w_i / Σ w_i, or `fallback` when the inputs are empty, differ in
/// length, or the weight sum is not positive and finite.
[[nodiscard]] double weighted_average(std::span<const double> values,
                                      std::span<const double> weights,
                                      double fallback) noexcept;

/// Σ v_i·w_i without renormalizing; `fallback` when empty or mismatched.
[[nodiscard]] double weighted_sum(std::span<const double> values,
                                  std::span<const double> weights,
                                  double fallback) noexcept;

/// Scale `weights` to sum to 1.  Negative or non-finite entries count as 0;
/// when nothing positive remains every entry becomes 1 / n.
[[nodiscard]] std::vector<double> normalize(std::span<const double> weights);

/// Population mean and standard deviation.  Both 0 for an empty input.
struct MeanStd {
    double mean   = 0.0;
    double stddev = 0.0;
};
[[nodiscard]] MeanStd mean_and_stddev(std::span<const double> values) noexcept;

/// Round a price for display: cents at or above $10 in magnitude, tenths of
/// a cent below.
[[nodiscard]] double round_price(double price) noexcept;

/// Round a percentage to one decimal.
[[nodiscard]] double round_percent(double pct) noexcept;

}  // namespace pfv::core
