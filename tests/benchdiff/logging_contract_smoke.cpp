#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/result_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

int main() {
  using benchdiff::tests::common::AssertContains;
  using benchdiff::tests::common::AssertNotContains;
  using benchdiff::tests::common::Fail;

  // Key/value lines carry the active unit and quote values.
  std::ostringstream kv_stream;
  benchdiff::core::logging::Logger kv_logger(benchdiff::core::logging::LogLevel::kInfo, kv_stream);
  kv_logger.Debug("hidden");
  kv_logger.SetUnit("Token");
  kv_logger.Warn("duplicate function name", {{"name", "say \"hi\"\n"}});
  kv_logger.ClearUnit();
  kv_logger.Info("done");
  const std::string kv = kv_stream.str();
  AssertNotContains(kv, "hidden");
  AssertContains(kv, "level=WARN unit=\"Token\" msg=\"duplicate function name\" "
                     "name=\"say \\\"hi\\\"\\n\"");
  AssertContains(kv, "level=INFO unit=\"-\" msg=\"done\"");

  // GitHub format maps levels onto workflow commands.
  std::ostringstream gh_stream;
  benchdiff::core::logging::Logger gh_logger(benchdiff::core::logging::LogLevel::kDebug, gh_stream);
  gh_logger.SetFormat(benchdiff::core::logging::LogFormat::kGithubActions);
  gh_logger.SetUnit("Token");
  gh_logger.BeginGroup("Comparing Contract: Token");
  gh_logger.Warn("skipping unit", {{"error", "line1\nline2 100%"}});
  gh_logger.EndGroup();
  const std::string gh = gh_stream.str();
  AssertContains(gh, "::group::Comparing Contract: Token\n");
  AssertContains(gh, "::warning::[Token] skipping unit error=line1%0Aline2 100%25\n");
  AssertContains(gh, "::endgroup::\n");

  // The CLI flag switches the whole run to workflow commands.
  const fs::path root = benchdiff::tests::common::CreateUniqueTempDir("benchdiff-logging");
  const fs::path reports = root / "benchmarks";
  benchdiff::tests::common::WriteResultFile(reports, "Token", "_base", {{.name = "mint", .gates = 5}});
  benchdiff::tests::common::WriteFixtureFile(reports / "Token_latest.benchmark.json", "[]");

  std::string stdout_text;
  std::string stderr_text;
  const int exit_code = benchdiff::tests::common::DispatchWithCapturedStreams(
      {"benchdiff", "compare", "--reports-dir", reports.string(), "--out",
       (root / "diff.md").string(), "--no-github-output", "--log-format", "github"},
      stdout_text, stderr_text);
  if (exit_code != 0) {
    Fail("compare failed:\n" + stderr_text);
  }
  AssertContains(stderr_text, "::group::Comparing Contract: Token\n");
  AssertContains(stderr_text, "::warning::[Token] skipping unit with invalid result file");
  AssertNotContains(stderr_text, "ts_utc=");

  std::string ignored;
  if (benchdiff::tests::common::DispatchWithCapturedStreams(
          {"benchdiff", "compare", "--log-format", "json"}, ignored, stderr_text) != 2) {
    Fail("unknown log format must be a usage error");
  }
  AssertContains(stderr_text, "invalid --log-format 'json' (expected kv|github)");

  benchdiff::tests::common::RemovePathBestEffort(root);
  return 0;
}
