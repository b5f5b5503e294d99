#pragma once

#include "compare/unit_comparison.hpp"
#include "config/comparison_config.hpp"
#include "config/manifest.hpp"
#include "core/logging/logger.hpp"
#include "discovery/unit_discovery.hpp"
#include "report/comparison_report.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace benchdiff::orchestrator {

// Loads, compares and classifies one unit. Never fails: load errors and
// invalid inputs become the section outcome.
report::UnitSection CompareUnitSource(const discovery::UnitSource& source,
                                      const compare::CompareOptions& options,
                                      core::logging::Logger& logger);

// Processes units sequentially in the given order. A failure in one unit
// does not affect any other unit.
report::ComparisonReport BuildComparisonReport(const std::vector<discovery::UnitSource>& units,
                                               const compare::CompareOptions& options,
                                               double threshold_fraction,
                                               core::logging::Logger& logger);

struct RunOutcome {
  report::ComparisonReport report;
  std::size_t units_compared = 0;
  std::size_t regressions = 0;
};

// Full comparison run: discover units, build the report, then publish the
// markdown document, the optional JSON summary and the optional GitHub
// outputs.
//
// Contract:
// - returns false and sets `error` when discovery fails or any output cannot
//   be written; per-unit problems never fail the run.
// - `outcome` is filled as far as the run got.
bool RunComparison(const config::ComparisonConfig& config, const config::Manifest* manifest,
                   core::logging::Logger& logger, RunOutcome& outcome, std::string& error);

} // namespace benchdiff::orchestrator
