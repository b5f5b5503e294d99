#include "compare/unit_comparison.hpp"

#include "compare/classifier.hpp"
#include "compare/delta_calculator.hpp"

#include <algorithm>

namespace benchdiff::compare {

void StatusCounts::Add(ComparisonStatus status) {
  switch (status) {
  case ComparisonStatus::kNew:
    ++new_count;
    return;
  case ComparisonStatus::kRemoved:
    ++removed_count;
    return;
  case ComparisonStatus::kRegression:
    ++regression_count;
    return;
  case ComparisonStatus::kImprovement:
    ++improvement_count;
    return;
  case ComparisonStatus::kUnchanged:
    ++unchanged_count;
    return;
  }
}

void StatusCounts::Merge(const StatusCounts& other) {
  new_count += other.new_count;
  removed_count += other.removed_count;
  regression_count += other.regression_count;
  improvement_count += other.improvement_count;
  unchanged_count += other.unchanged_count;
}

std::size_t StatusCounts::Total() const {
  return new_count + removed_count + regression_count + improvement_count + unchanged_count;
}

void SortEntriesByName(std::vector<ComparisonEntry>& entries) {
  std::sort(entries.begin(), entries.end(),
            [](const ComparisonEntry& lhs, const ComparisonEntry& rhs) {
              return lhs.name < rhs.name;
            });
}

bool CompareUnit(const std::string& unit_name, const ResultSet& baseline, const ResultSet& current,
                 const CompareOptions& options, UnitComparison& comparison, std::string& error) {
  comparison = UnitComparison{};
  comparison.unit_name = unit_name;

  ReconcileResult reconciled;
  const bool reconciled_ok =
      Reconcile(baseline, current, options.duplicate_policy, reconciled, error);
  comparison.skipped = std::move(reconciled.skipped);
  comparison.duplicates = std::move(reconciled.duplicates);
  if (!reconciled_ok) {
    return false;
  }

  comparison.entries = std::move(reconciled.entries);
  for (auto& entry : comparison.entries) {
    ComputeDeltas(entry);
    entry.status = Classify(entry, options.threshold_fraction);
    comparison.counts.Add(entry.status);
  }

  SortEntriesByName(comparison.entries);
  return true;
}

} // namespace benchdiff::compare
