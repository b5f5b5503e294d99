#include "../common/assertions.hpp"
#include "../common/result_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "orchestrator/comparison_runner.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

using benchdiff::report::UnitOutcome;
using benchdiff::tests::common::AssertContains;
using benchdiff::tests::common::AssertNotContains;
using benchdiff::tests::common::Fail;
using benchdiff::tests::common::FixtureFunction;
using benchdiff::tests::common::WriteResultFile;

} // namespace

int main() {
  const fs::path root = benchdiff::tests::common::CreateUniqueTempDir("benchdiff-runner");
  const fs::path reports = root / "benchmarks";

  // Alpha: mint grows 10% on gates, burn disappears.
  WriteResultFile(reports, "Alpha", "_base",
                  {{.name = "mint", .gates = 1'000, .da_gas = 100, .l2_gas = 2'000},
                   {.name = "burn", .gates = 500, .da_gas = 50, .l2_gas = 1'000}});
  WriteResultFile(reports, "Alpha", "_latest",
                  {{.name = "mint", .gates = 1'100, .da_gas = 100, .l2_gas = 2'000},
                   {.name = "unknown_function_0x01", .gates = 9, .da_gas = 0, .l2_gas = 0}});

  // Beta: malformed current file.
  WriteResultFile(reports, "Beta", "_base", {{.name = "f", .gates = 1}});
  benchdiff::tests::common::WriteFixtureFile(reports / "Beta_latest.benchmark.json",
                                             "{\"results\": [oops]}");

  // Gamma: identical runs.
  WriteResultFile(reports, "Gamma", "_base", {{.name = "swap", .gates = 300, .l2_gas = 30}});
  WriteResultFile(reports, "Gamma", "_latest", {{.name = "swap", .gates = 300, .l2_gas = 30}});

  benchdiff::config::ComparisonConfig config;
  config.reports_dir = reports;
  config.report_path = root / "out" / "benchmark_diff.md";
  config.summary_json_path = root / "out" / "summary.json";
  config.github_output_path = root / "github_output.txt";

  std::ostringstream log_stream;
  benchdiff::core::logging::Logger logger(benchdiff::core::logging::LogLevel::kDebug, log_stream);

  benchdiff::orchestrator::RunOutcome outcome;
  std::string error;
  if (!benchdiff::orchestrator::RunComparison(config, nullptr, logger, outcome, error)) {
    Fail("comparison run failed: " + error);
  }

  // One bad unit does not stop the others.
  if (outcome.report.sections.size() != 3U) {
    Fail("expected 3 sections");
  }
  if (outcome.report.sections[0].outcome != UnitOutcome::kCompared ||
      outcome.report.sections[1].outcome != UnitOutcome::kLoadFailed ||
      outcome.report.sections[2].outcome != UnitOutcome::kCompared) {
    Fail("unexpected section outcomes");
  }
  if (outcome.units_compared != 2U) {
    Fail("expected 2 compared units, got " + std::to_string(outcome.units_compared));
  }
  if (outcome.regressions != 1U) {
    Fail("expected exactly one regression (Alpha mint)");
  }

  const std::string markdown = benchdiff::tests::common::ReadFileToString(config.report_path);
  AssertContains(markdown, "## Contract: Alpha\n<table>");
  AssertContains(markdown, "<td><code>burn</code></td>");
  AssertContains(markdown, "+100 (+10.00%)");
  AssertNotContains(markdown, "unknown_function");
  AssertContains(markdown, "## Contract: Beta\n\n\n⚠️ Error comparing benchmarks for this contract: "
                           "invalid JSON in");
  AssertContains(markdown, "_Summary: 2 of 3 contract(s) compared; 1 skipped._");

  const std::string summary = benchdiff::tests::common::ReadFileToString(*config.summary_json_path);
  AssertContains(summary, "\"units_compared\":2");
  AssertContains(summary, "{\"name\":\"Beta\",\"outcome\":\"load_failed\",");

  const std::string github_output =
      benchdiff::tests::common::ReadFileToString(*config.github_output_path);
  AssertContains(github_output, "units_compared=2\n");
  AssertContains(github_output, "regressions=1\n");
  AssertContains(github_output, "comparison_markdown<<BENCHDIFF_MARKDOWN_EOF\n");

  const std::string logs = log_stream.str();
  AssertContains(logs, "unit=\"Beta\" msg=\"failed to load result file\"");
  AssertContains(logs, "msg=\"skipping record\" side=\"current\" name=\"unknown_function_0x01\"");

  // Rendering the same inputs again gives identical bytes.
  std::ostringstream quiet;
  benchdiff::core::logging::Logger quiet_logger(benchdiff::core::logging::LogLevel::kError, quiet);
  config.summary_json_path.reset();
  config.github_output_path.reset();
  config.report_path = root / "out" / "second.md";
  benchdiff::orchestrator::RunOutcome second;
  if (!benchdiff::orchestrator::RunComparison(config, nullptr, quiet_logger, second, error)) {
    Fail("second comparison run failed: " + error);
  }
  if (benchdiff::tests::common::ReadFileToString(config.report_path) != markdown) {
    Fail("report output is not deterministic");
  }

  // An unwritable report path fails the run.
  config.report_path = reports;
  if (benchdiff::orchestrator::RunComparison(config, nullptr, quiet_logger, second, error)) {
    Fail("writing the report over a directory must fail");
  }
  AssertContains(error, "failed to write comparison report");

  benchdiff::tests::common::RemovePathBestEffort(root);
  return 0;
}
