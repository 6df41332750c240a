#pragma once

/// @file include/pfv/report.hpp
/// @brief Plain-text renderings of PFV results for consoles and for a
///        language model's context window.
///
/// Every formatter is a pure function of its argument; none reads the clock.

#include "pfv/fair_value.hpp"
#include "pfv/gamma_walls.hpp"
#include "pfv/max_pain.hpp"
#include "pfv/multi_expiry.hpp"
#include "pfv/round_numbers.hpp"
#include "pfv/technical_levels.hpp"

#include <span>
#include <string>
#include <string_view>

namespace pfv::report {

[[nodiscard]] std::string format_max_pain(const options::MaxPainResult& result);

[[nodiscard]] std::string
format_gamma_walls(const options::GammaWallsResult& result, double current_price);

[[nodiscard]] std::string
format_technical_levels(const levels::TechnicalLevelsResult& result);

[[nodiscard]] std::string
format_round_numbers(const levels::RoundNumbersResult& result, double current_price);

[[nodiscard]] std::string
format_multi_expiration(std::span<const options::ExpirationAnalysis> analyses);

/// Console report of a full result.
[[nodiscard]] std::string format_pfv_result(const PsychologicalFairValue& result);

/// Compact block for a language model's context.
[[nodiscard]] std::string
build_ai_context(const std::string& ticker,
                 double fair_value, double current_price, double deviation_pct,
                 Bias bias, ConfidenceLevel confidence,
                 std::span<const ComponentBreakdown> components,
                 std::span<const MagneticLevel> magnetic_levels,
                 std::span<const options::ExpirationAnalysis> analyses);

/// One-paragraph reading of the result.
[[nodiscard]] std::string
build_interpretation(double fair_value, double current_price, double deviation_pct,
                     Bias bias, ConfidenceLevel confidence,
                     const profiles::TickerProfile& profile,
                     std::span<const options::ExpirationAnalysis> analyses);

/// "HIGH" / "MEDIUM" / "LOW" for a max-pain confidence (strict > 0.7 / > 0.4).
[[nodiscard]] std::string_view max_pain_confidence_label(double confidence) noexcept;

/// Signed percentage with one decimal, "+1.5%" / "-0.3%" / "0.0%".
[[nodiscard]] std::string signed_pct(double pct);

}  // namespace pfv::report
