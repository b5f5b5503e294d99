#pragma once

#include "compare/comparison_entry.hpp"

#include <cstdint>

namespace benchdiff::compare {

// Percent magnitudes below this value (in percent units, i.e. 0.01%) render
// as "no visible diff". Classification ignores the floor.
inline constexpr double kDisplayNoiseFloorPercent = 0.01;

// Computes absolute and percentage change for one metric.
//
// Contract:
// - absolute = current - baseline, signed and clamped to the int64 range.
// - zero baselines produce a sentinel PercentKind and never divide.
MetricDelta ComputeMetricDelta(std::uint64_t baseline, std::uint64_t current);

// Fills `entry.deltas` for all three metrics from `entry.baseline` and
// `entry.current`.
void ComputeDeltas(ComparisonEntry& entry);

// True when the delta has no visible change at display precision: both zero,
// absolute zero, or a finite percent magnitude under the noise floor.
bool IsBelowDisplayFloor(const MetricDelta& delta);

} // namespace benchdiff::compare
