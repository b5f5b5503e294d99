#pragma once

#include "compare/comparison_entry.hpp"

#include <string>

namespace benchdiff::compare {

// Stable lowercase name used in logs and the JSON summary.
const char* ToString(ComparisonStatus status);

// Report indicator for a status (🆕, 🚮, 🔴, 🟢, ⚪).
const char* StatusIndicator(ComparisonStatus status);

// Legend wording for a status.
const char* LegendLabel(ComparisonStatus status);

// Assigns exactly one status, first match wins:
// 1) New: baseline all zero and current has any positive metric.
// 2) Removed: current all zero and baseline has any positive metric.
// 3) Regression: any infinite increase, or any finite fraction > +threshold.
// 4) Improvement: any finite fraction < -threshold.
// 5) Unchanged.
//
// Full decreases count as the finite fraction -1. `threshold_fraction` is
// applied uniformly to all three metrics and must be finite and >= 0.
ComparisonStatus Classify(const ComparisonEntry& entry, double threshold_fraction);

} // namespace benchdiff::compare
