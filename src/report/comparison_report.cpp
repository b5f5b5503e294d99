#include "report/comparison_report.hpp"

namespace benchdiff::report {

const char* ToString(UnitOutcome outcome) {
  switch (outcome) {
  case UnitOutcome::kCompared:
    return "compared";
  case UnitOutcome::kNoComparableFunctions:
    return "no_comparable_functions";
  case UnitOutcome::kInvalidInput:
    return "invalid_input";
  case UnitOutcome::kLoadFailed:
    return "load_failed";
  }
  return "load_failed";
}

bool UnitSection::CountsAsCompared() const {
  return outcome == UnitOutcome::kCompared || outcome == UnitOutcome::kNoComparableFunctions;
}

std::size_t ComparisonReport::UnitsDiscovered() const {
  return sections.size();
}

std::size_t ComparisonReport::UnitsCompared() const {
  std::size_t compared = 0;
  for (const auto& section : sections) {
    if (section.CountsAsCompared()) {
      ++compared;
    }
  }
  return compared;
}

std::size_t ComparisonReport::UnitsSkipped() const {
  return UnitsDiscovered() - UnitsCompared();
}

compare::StatusCounts ComparisonReport::TotalCounts() const {
  compare::StatusCounts totals;
  for (const auto& section : sections) {
    totals.Merge(section.comparison.counts);
  }
  return totals;
}

} // namespace benchdiff::report
