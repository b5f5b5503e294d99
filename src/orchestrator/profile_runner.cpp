#include "orchestrator/profile_runner.hpp"

#include "discovery/unit_discovery.hpp"
#include "profiler/profiler.hpp"
#include "profiler/suite_factory.hpp"
#include "results/profile_report_io.hpp"

#include <algorithm>
#include <memory>

namespace benchdiff::orchestrator {

namespace {

bool ProfileUnit(const config::ManifestUnit& unit, const std::filesystem::path& output_path,
                 core::logging::Logger& logger, std::string& error) {
  std::unique_ptr<profiler::IBenchmarkSuite> suite;
  if (!profiler::CreateBenchmarkSuite(unit.definition_path, suite, error)) {
    return false;
  }

  profiler::Profiler profiler(logger);
  core::schema::ProfileReport report;
  if (!profiler.ProfileSuite(*suite, report, error)) {
    return false;
  }

  return results::WriteProfileReportJson(report, output_path, error);
}

} // namespace

std::vector<config::ManifestUnit> SelectProfileUnits(const config::Manifest& manifest,
                                                     const std::vector<std::string>& requested,
                                                     std::vector<std::string>& unknown_names) {
  unknown_names.clear();
  if (requested.empty()) {
    return manifest.units;
  }

  for (const auto& name : requested) {
    if (manifest.FindUnit(name) == nullptr) {
      unknown_names.push_back(name);
    }
  }

  std::vector<config::ManifestUnit> selected;
  for (const auto& unit : manifest.units) {
    if (std::find(requested.begin(), requested.end(), unit.name) != requested.end()) {
      selected.push_back(unit);
    }
  }
  return selected;
}

ProfileRunOutcome RunProfileUnits(const std::vector<config::ManifestUnit>& units,
                                  const std::filesystem::path& output_dir,
                                  const std::string& suffix, core::logging::Logger& logger) {
  ProfileRunOutcome outcome;
  for (const auto& unit : units) {
    const std::filesystem::path output_path =
        discovery::BuildResultFilePath(output_dir, unit.name, suffix);

    logger.SetUnit(unit.name);
    logger.BeginGroup("Running benchmark: " + unit.name);
    logger.Info("running benchmark", {{"definition", unit.definition_path.string()},
                                      {"output", output_path.string()}});

    std::string error;
    if (ProfileUnit(unit, output_path, logger, error)) {
      logger.Info("benchmark finished", {{"output", output_path.string()}});
      outcome.written_reports.push_back(output_path);
    } else {
      logger.Error("benchmark failed", {{"error", error}});
      outcome.failed_units.push_back(unit.name);
    }

    logger.EndGroup();
    logger.ClearUnit();
  }
  return outcome;
}

} // namespace benchdiff::orchestrator
