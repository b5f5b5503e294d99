#pragma once

#include "compare/metric_record.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace benchdiff::compare {

// How a percentage delta was derived. Zero baselines never reach a division;
// they map to one of the explicit sentinel kinds instead.
enum class PercentKind {
  // baseline == 0 and current == 0; fraction is 0.
  kBothZero,
  // baseline > 0 and current > 0; fraction is (current - baseline) / baseline.
  kFinite,
  // baseline == 0 and current > 0; fraction is meaningless (+infinity).
  kInfiniteIncrease,
  // baseline > 0 and current == 0; fraction is exactly -1.
  kFullDecrease,
};

struct PercentDelta {
  PercentKind kind = PercentKind::kBothZero;
  double fraction = 0.0;

  bool IsInfinite() const {
    return kind == PercentKind::kInfiniteIncrease;
  }
};

struct MetricDelta {
  std::int64_t absolute = 0;
  PercentDelta percent;
};

enum class ComparisonStatus {
  kNew,
  kRemoved,
  kRegression,
  kImprovement,
  kUnchanged,
};

// One function reconciled across both runs. Built by the reconciler, enriched
// with deltas and status, then rendered read-only.
struct ComparisonEntry {
  std::string name;
  MetricRecord baseline;
  MetricRecord current;
  std::array<MetricDelta, 3> deltas{};
  ComparisonStatus status = ComparisonStatus::kUnchanged;

  const MetricDelta& Delta(MetricKind kind) const {
    return deltas[static_cast<std::size_t>(kind)];
  }
  MetricDelta& Delta(MetricKind kind) {
    return deltas[static_cast<std::size_t>(kind)];
  }
};

} // namespace benchdiff::compare
