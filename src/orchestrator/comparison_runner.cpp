#include "orchestrator/comparison_runner.hpp"

#include "ci/github_outputs.hpp"
#include "compare/reconciler.hpp"
#include "report/markdown_report_writer.hpp"
#include "report/summary_json_writer.hpp"
#include "results/profile_report_io.hpp"

#include <utility>

namespace benchdiff::orchestrator {

namespace {

using report::UnitOutcome;
using report::UnitSection;

// Loads one side. Returns false after filling the section outcome when the
// unit cannot be compared.
bool LoadSide(const std::filesystem::path& path, compare::RunSide side, compare::ResultSet& records,
              UnitSection& section, core::logging::Logger& logger) {
  std::string error;
  const results::LoadStatus status = results::LoadResultSet(path, records, error);
  switch (status) {
  case results::LoadStatus::kLoaded:
    logger.Debug("loaded result file", {{"side", compare::ToString(side)},
                                        {"path", path.string()},
                                        {"records", std::to_string(records.size())}});
    return true;
  case results::LoadStatus::kUnreadable:
  case results::LoadStatus::kMalformed:
    section.outcome = UnitOutcome::kLoadFailed;
    section.detail = error;
    logger.Error("failed to load result file", {{"side", compare::ToString(side)},
                                                {"status", results::ToString(status)},
                                                {"error", error}});
    return false;
  case results::LoadStatus::kInvalidStructure:
    section.outcome = UnitOutcome::kInvalidInput;
    section.detail = std::string(compare::ToString(side)) + " result file '" +
                     path.filename().string() + "': " + error;
    logger.Warn("skipping unit with invalid result file", {{"side", compare::ToString(side)},
                                                           {"path", path.string()},
                                                           {"error", error}});
    return false;
  }
  return false;
}

void LogReconcileNotes(const compare::UnitComparison& comparison, core::logging::Logger& logger) {
  for (const auto& skipped : comparison.skipped) {
    logger.Debug("skipping record", {{"side", compare::ToString(skipped.side)},
                                     {"name", skipped.name},
                                     {"reason", skipped.reason}});
  }
  for (const auto& duplicate : comparison.duplicates) {
    logger.Warn("duplicate function name", {{"side", compare::ToString(duplicate.side)},
                                            {"name", duplicate.name}});
  }
}

} // namespace

UnitSection CompareUnitSource(const discovery::UnitSource& source,
                              const compare::CompareOptions& options,
                              core::logging::Logger& logger) {
  UnitSection section;
  section.unit_name = source.name;

  logger.Info("comparing unit", {{"baseline", source.baseline_path.string()},
                                 {"current", source.current_path.string()}});

  compare::ResultSet baseline;
  if (!LoadSide(source.baseline_path, compare::RunSide::kBaseline, baseline, section, logger)) {
    return section;
  }
  compare::ResultSet current;
  if (!LoadSide(source.current_path, compare::RunSide::kCurrent, current, section, logger)) {
    return section;
  }

  std::string error;
  const bool compared =
      compare::CompareUnit(source.name, baseline, current, options, section.comparison, error);
  LogReconcileNotes(section.comparison, logger);
  if (!compared) {
    section.outcome = UnitOutcome::kInvalidInput;
    section.detail = error;
    logger.Warn("skipping unit with rejected input", {{"error", error}});
    return section;
  }

  if (section.comparison.entries.empty()) {
    section.outcome = UnitOutcome::kNoComparableFunctions;
    logger.Warn("no valid benchmark functions found in either run");
    return section;
  }

  const compare::StatusCounts& counts = section.comparison.counts;
  section.outcome = UnitOutcome::kCompared;
  logger.Info("unit compared", {{"functions", std::to_string(section.comparison.entries.size())},
                                {"regressions", std::to_string(counts.regression_count)},
                                {"improvements", std::to_string(counts.improvement_count)},
                                {"new", std::to_string(counts.new_count)},
                                {"removed", std::to_string(counts.removed_count)}});
  return section;
}

report::ComparisonReport BuildComparisonReport(const std::vector<discovery::UnitSource>& units,
                                               const compare::CompareOptions& options,
                                               double threshold_fraction,
                                               core::logging::Logger& logger) {
  report::ComparisonReport comparison_report;
  comparison_report.threshold_fraction = threshold_fraction;
  comparison_report.sections.reserve(units.size());

  for (const auto& unit : units) {
    logger.SetUnit(unit.name);
    logger.BeginGroup("Comparing Contract: " + unit.name);
    comparison_report.sections.push_back(CompareUnitSource(unit, options, logger));
    logger.EndGroup();
    logger.ClearUnit();
  }

  if (!units.empty() && comparison_report.UnitsCompared() == 0U) {
    logger.Warn("found units but failed to process or validate any for comparison");
  }
  return comparison_report;
}

bool RunComparison(const config::ComparisonConfig& config, const config::Manifest* manifest,
                   core::logging::Logger& logger, RunOutcome& outcome, std::string& error) {
  outcome = RunOutcome{};

  logger.Info("starting benchmark comparison",
              {{"threshold_fraction", std::to_string(config.threshold_fraction)},
               {"reports_dir", config.reports_dir.string()},
               {"report_path", config.report_path.string()}});

  std::vector<discovery::UnitSource> units;
  if (!discovery::DiscoverUnits(config, manifest, units, error)) {
    return false;
  }
  if (units.empty()) {
    logger.Warn("no benchmark results found to compare");
  } else {
    logger.Info("discovered units", {{"count", std::to_string(units.size())}});
  }

  outcome.report =
      BuildComparisonReport(units, config.ToCompareOptions(), config.threshold_fraction, logger);
  outcome.units_compared = outcome.report.UnitsCompared();
  outcome.regressions = outcome.report.TotalCounts().regression_count;

  if (!report::WriteMarkdownReport(outcome.report, config.report_path, error)) {
    error = "failed to write comparison report: " + error;
    return false;
  }
  logger.Info("comparison report written",
              {{"path", config.report_path.string()},
               {"units_compared", std::to_string(outcome.units_compared)}});

  if (config.summary_json_path.has_value()) {
    if (!report::WriteSummaryJson(outcome.report, config.summary_json_path.value(), error)) {
      error = "failed to write summary json: " + error;
      return false;
    }
    logger.Info("summary json written", {{"path", config.summary_json_path->string()}});
  }

  if (config.github_output_path.has_value()) {
    const ci::GithubOutputs outputs{
        .report_path = config.report_path,
        .units_compared = outcome.units_compared,
        .regressions = outcome.regressions,
        .comparison_markdown = report::RenderMarkdownReport(outcome.report),
    };
    if (!ci::AppendGithubOutputs(outputs, config.github_output_path.value(), error)) {
      return false;
    }
    logger.Debug("github outputs written", {{"path", config.github_output_path->string()}});
  }

  return true;
}

} // namespace benchdiff::orchestrator
