#include "compare/classifier.hpp"

namespace benchdiff::compare {

const char* ToString(ComparisonStatus status) {
  switch (status) {
  case ComparisonStatus::kNew:
    return "new";
  case ComparisonStatus::kRemoved:
    return "removed";
  case ComparisonStatus::kRegression:
    return "regression";
  case ComparisonStatus::kImprovement:
    return "improvement";
  case ComparisonStatus::kUnchanged:
    return "unchanged";
  }
  return "unchanged";
}

const char* StatusIndicator(ComparisonStatus status) {
  switch (status) {
  case ComparisonStatus::kNew:
    return "🆕";
  case ComparisonStatus::kRemoved:
    return "🚮";
  case ComparisonStatus::kRegression:
    return "🔴";
  case ComparisonStatus::kImprovement:
    return "🟢";
  case ComparisonStatus::kUnchanged:
    return "⚪";
  }
  return "⚪";
}

const char* LegendLabel(ComparisonStatus status) {
  switch (status) {
  case ComparisonStatus::kNew:
    return "New";
  case ComparisonStatus::kRemoved:
    return "Removed";
  case ComparisonStatus::kRegression:
    return "Regression";
  case ComparisonStatus::kImprovement:
    return "Improvement";
  case ComparisonStatus::kUnchanged:
    return "No significant change";
  }
  return "No significant change";
}

ComparisonStatus Classify(const ComparisonEntry& entry, double threshold_fraction) {
  // Structural events first; they are independent of the threshold.
  if (entry.baseline.AllZero() && entry.current.AnyPositive()) {
    return ComparisonStatus::kNew;
  }
  if (entry.current.AllZero() && entry.baseline.AnyPositive()) {
    return ComparisonStatus::kRemoved;
  }

  bool regression = false;
  bool improvement = false;
  for (const MetricKind kind : kAllMetricKinds) {
    const PercentDelta& percent = entry.Delta(kind).percent;
    if (percent.IsInfinite()) {
      regression = true;
      continue;
    }
    if (percent.fraction > threshold_fraction) {
      regression = true;
    } else if (percent.fraction < -threshold_fraction) {
      improvement = true;
    }
  }

  if (regression) {
    return ComparisonStatus::kRegression;
  }
  if (improvement) {
    return ComparisonStatus::kImprovement;
  }
  return ComparisonStatus::kUnchanged;
}

} // namespace benchdiff::compare
