#include "compare/delta_calculator.hpp"

#include <cmath>
#include <limits>

namespace benchdiff::compare {

namespace {

// current - baseline, clamped to the int64 range.
std::int64_t SignedDifference(std::uint64_t baseline, std::uint64_t current) {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (current >= baseline) {
    const std::uint64_t up = current - baseline;
    return up > kMax ? std::numeric_limits<std::int64_t>::max() : static_cast<std::int64_t>(up);
  }
  const std::uint64_t down = baseline - current;
  if (down > kMax) {
    return std::numeric_limits<std::int64_t>::min();
  }
  return -static_cast<std::int64_t>(down);
}

} // namespace

MetricDelta ComputeMetricDelta(std::uint64_t baseline, std::uint64_t current) {
  MetricDelta delta;
  delta.absolute = SignedDifference(baseline, current);

  if (baseline == 0U) {
    if (current == 0U) {
      delta.percent = {.kind = PercentKind::kBothZero, .fraction = 0.0};
    } else {
      delta.percent = {.kind = PercentKind::kInfiniteIncrease, .fraction = 0.0};
    }
    return delta;
  }

  if (current == 0U) {
    delta.percent = {.kind = PercentKind::kFullDecrease, .fraction = -1.0};
    return delta;
  }

  delta.percent = {
      .kind = PercentKind::kFinite,
      .fraction = (static_cast<double>(current) - static_cast<double>(baseline)) /
                  static_cast<double>(baseline),
  };
  return delta;
}

void ComputeDeltas(ComparisonEntry& entry) {
  for (const MetricKind kind : kAllMetricKinds) {
    entry.Delta(kind) = ComputeMetricDelta(entry.baseline.Get(kind), entry.current.Get(kind));
  }
}

bool IsBelowDisplayFloor(const MetricDelta& delta) {
  switch (delta.percent.kind) {
  case PercentKind::kBothZero:
    return true;
  case PercentKind::kInfiniteIncrease:
  case PercentKind::kFullDecrease:
    return false;
  case PercentKind::kFinite:
    break;
  }

  if (delta.absolute == 0) {
    return true;
  }
  return std::fabs(delta.percent.fraction * 100.0) < kDisplayNoiseFloorPercent;
}

} // namespace benchdiff::compare
