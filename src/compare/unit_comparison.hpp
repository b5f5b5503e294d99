#pragma once

#include "compare/comparison_entry.hpp"
#include "compare/metric_record.hpp"
#include "compare/reconciler.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace benchdiff::compare {

struct CompareOptions {
  double threshold_fraction = 0.025;
  DuplicateNamePolicy duplicate_policy = DuplicateNamePolicy::kLastWriteWins;
};

struct StatusCounts {
  std::size_t new_count = 0;
  std::size_t removed_count = 0;
  std::size_t regression_count = 0;
  std::size_t improvement_count = 0;
  std::size_t unchanged_count = 0;

  void Add(ComparisonStatus status);
  void Merge(const StatusCounts& other);
  std::size_t Total() const;
};

// Fully classified comparison of one unit, entries sorted by name in byte order.
struct UnitComparison {
  std::string unit_name;
  std::vector<ComparisonEntry> entries;
  std::vector<SkippedRecord> skipped;
  std::vector<DuplicateRecord> duplicates;
  StatusCounts counts;
};

// Sorts entries by name, ascending, case-sensitive byte order.
void SortEntriesByName(std::vector<ComparisonEntry>& entries);

// Reconciles, computes deltas and classifies every function of one unit.
//
// Contract:
// - returns false and sets `error` only when reconciliation rejects the input
//   (duplicate names under DuplicateNamePolicy::kReject).
// - an empty `comparison.entries` means nothing comparable; not an error.
bool CompareUnit(const std::string& unit_name, const ResultSet& baseline, const ResultSet& current,
                 const CompareOptions& options, UnitComparison& comparison, std::string& error);

} // namespace benchdiff::compare
