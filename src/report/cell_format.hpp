#pragma once

#include "compare/comparison_entry.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace benchdiff::report {

// "1234567" -> "1,234,567".
std::string FormatWithThousands(std::uint64_t value);

// Always signed: "+1,200", "-26", "+0".
std::string FormatSignedWithThousands(std::int64_t value);

// Fraction rendered as a percent with up to 4 decimals, trailing zeros
// trimmed: 0.025 -> "2.5", 0.05 -> "5", 0.000125 -> "0.0125".
std::string FormatThresholdPercent(double threshold_fraction);

// Diff cell for one metric:
// - "-" for both zero, zero absolute change, or |percent| < 0.01
// - "+100% 🚀" when the baseline is zero and current positive
// - "-100% 🗑️" when the current is zero and baseline positive
// - otherwise "<signed absolute> (<signed percent, 2 decimals>%)"
std::string FormatDiffCell(const compare::MetricDelta& delta);

std::string EscapeHtml(std::string_view input);

} // namespace benchdiff::report
