#pragma once

#include "compare/unit_comparison.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace benchdiff::report {

// How a unit ended up in the document.
enum class UnitOutcome {
  // Table rendered.
  kCompared,
  // Both runs loaded but nothing survived filtering. Counts as compared.
  kNoComparableFunctions,
  // Inputs loaded but failed validation: skip notice, not compared.
  kInvalidInput,
  // File missing, unreadable or not JSON: error notice, not compared.
  kLoadFailed,
};

const char* ToString(UnitOutcome outcome);

struct UnitSection {
  std::string unit_name;
  UnitOutcome outcome = UnitOutcome::kCompared;
  // Populated for kCompared and kNoComparableFunctions.
  compare::UnitComparison comparison;
  // Human-readable reason for kInvalidInput and kLoadFailed.
  std::string detail;

  bool CountsAsCompared() const;
};

// Whole-run result, sections in discovery order.
struct ComparisonReport {
  double threshold_fraction = 0.0;
  std::vector<UnitSection> sections;

  std::size_t UnitsDiscovered() const;
  std::size_t UnitsCompared() const;
  std::size_t UnitsSkipped() const;
  compare::StatusCounts TotalCounts() const;
};

} // namespace benchdiff::report
