#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/result_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using benchdiff::core::errors::ExitCode;
using benchdiff::core::errors::ToInt;
using benchdiff::tests::common::AssertContains;
using benchdiff::tests::common::Fail;

int Run(const std::vector<std::string>& argv, std::string& stdout_text, std::string& stderr_text) {
  return benchdiff::tests::common::DispatchWithCapturedStreams(argv, stdout_text, stderr_text);
}

void WriteDefinition(const fs::path& path, std::uint64_t mint_gates) {
  benchdiff::tests::common::WriteFixtureFile(
      path, "{\"calls\":[{\"name\":\"mint\",\"steps\":[{\"function\":\"mint\",\"gate_count\":" +
                std::to_string(mint_gates) +
                "}],\"gas\":{\"gas_limits\":{\"da_gas\":10,\"l2_gas\":100}}}]}");
}

} // namespace

int main() {
  const fs::path root = benchdiff::tests::common::CreateUniqueTempDir("benchdiff-cli-profile");
  const fs::path manifest = root / "Nargo.toml";
  const fs::path output_dir = root / "benchmarks";
  benchdiff::tests::common::WriteFixtureFile(manifest, "[package]\n"
                                                       "name = \"token\"\n"
                                                       "\n"
                                                       "[benchmark]\n"
                                                       "token = \"bench/token.json\"\n"
                                                       "amm = \"bench/amm.json\"\n");
  WriteDefinition(root / "bench" / "token.json", 1'000);
  WriteDefinition(root / "bench" / "amm.json", 2'000);

  std::string out;
  std::string err;

  // Baseline run for every declared unit.
  int exit_code = Run({"benchdiff", "profile", "--manifest", manifest.string(), "--output-dir",
                       output_dir.string(), "--suffix", "_base", "--log-level", "error"},
                      out, err);
  if (exit_code != ToInt(ExitCode::kSuccess)) {
    Fail("baseline profile failed:\n" + err);
  }
  AssertContains(out, "profile_report: " + (output_dir / "token_base.benchmark.json").string());
  AssertContains(out, "profile_report: " + (output_dir / "amm_base.benchmark.json").string());

  // Current run for one unit only, with more gates.
  WriteDefinition(root / "bench" / "token.json", 1'500);
  exit_code = Run({"benchdiff", "profile", "--manifest", manifest.string(), "--contracts", "token",
                   "--output-dir", output_dir.string(), "--suffix", "_latest"},
                  out, err);
  if (exit_code != ToInt(ExitCode::kSuccess)) {
    Fail("current profile failed:\n" + err);
  }
  if (fs::exists(output_dir / "amm_latest.benchmark.json")) {
    Fail("--contracts must restrict the profiled units");
  }
  AssertContains(err, "msg=\"running benchmark\"");

  // The produced files feed straight into compare through the manifest.
  exit_code = Run({"benchdiff", "compare", "--manifest", manifest.string(), "--out",
                   (root / "diff.md").string(), "--no-github-output", "--fail-on-regression"},
                  out, err);
  if (exit_code != ToInt(ExitCode::kRegressionDetected)) {
    Fail("expected regression from profiled results, got exit " + std::to_string(exit_code) +
         "\n" + err);
  }
  const std::string markdown = benchdiff::tests::common::ReadFileToString(root / "diff.md");
  AssertContains(markdown, "## Contract: token\n<table>");
  AssertContains(markdown, "+500 (+50.00%)");
  AssertContains(markdown, "## Contract: amm\n\n\n⚠️ Error comparing benchmarks");

  // Unknown names are warned about; none known is a usage error.
  exit_code = Run({"benchdiff", "profile", "--manifest", manifest.string(), "--contracts",
                   "token,vault", "--output-dir", output_dir.string()},
                  out, err);
  if (exit_code != ToInt(ExitCode::kSuccess)) {
    Fail("partially known contracts should still run");
  }
  AssertContains(err, "requested contract not found in manifest");
  exit_code = Run({"benchdiff", "profile", "--manifest", manifest.string(), "--contracts", "vault"},
                  out, err);
  if (exit_code != ToInt(ExitCode::kUsage)) {
    Fail("unknown-only contracts must be a usage error");
  }

  // A failing unit fails the command but the others are still written.
  fs::remove(root / "bench" / "amm.json");
  exit_code = Run({"benchdiff", "profile", "--manifest", manifest.string(), "--output-dir",
                   (root / "partial").string()},
                  out, err);
  if (exit_code != ToInt(ExitCode::kFailure)) {
    Fail("missing definition must fail the profile command");
  }
  if (!fs::exists(root / "partial" / "token_base.benchmark.json")) {
    Fail("healthy units must still be profiled");
  }
  AssertContains(err, "1 of 2 benchmark(s) failed");

  // Defaults line up: a plain profile run writes baselines into the reports
  // directory compare reads, under the base suffix.
  const fs::path project = root / "project";
  const fs::path project_manifest = project / "Nargo.toml";
  benchdiff::tests::common::WriteFixtureFile(project_manifest, "[benchmark]\n"
                                                               "vault = \"vault.json\"\n");
  WriteDefinition(project / "vault.json", 2'000);
  exit_code = Run({"benchdiff", "profile", "--manifest", project_manifest.string()}, out, err);
  if (exit_code != ToInt(ExitCode::kSuccess)) {
    Fail("default profile failed:\n" + err);
  }
  AssertContains(out, "profile_report: " +
                          (project / "benchmarks" / "vault_base.benchmark.json").string());
  WriteDefinition(project / "vault.json", 3'000);
  exit_code = Run({"benchdiff", "profile", "--manifest", project_manifest.string(), "--suffix",
                   "_latest"},
                  out, err);
  if (exit_code != ToInt(ExitCode::kSuccess)) {
    Fail("latest profile failed:\n" + err);
  }
  exit_code = Run({"benchdiff", "compare", "--manifest", project_manifest.string(), "--out",
                   (project / "diff.md").string(), "--no-github-output", "--fail-on-regression"},
                  out, err);
  if (exit_code != ToInt(ExitCode::kRegressionDetected)) {
    Fail("default profile output must be comparable, got exit " + std::to_string(exit_code) +
         "\n" + err);
  }
  AssertContains(out, "units_compared: 1\n");
  AssertContains(benchdiff::tests::common::ReadFileToString(project / "diff.md"),
                 "+1,000 (+50.00%)");

  // Manifest problems.
  const fs::path empty_manifest = root / "Empty.toml";
  benchdiff::tests::common::WriteFixtureFile(empty_manifest, "[package]\nname = \"x\"\n");
  exit_code = Run({"benchdiff", "profile", "--manifest", empty_manifest.string()}, out, err);
  if (exit_code != ToInt(ExitCode::kConfigInvalid)) {
    Fail("manifest without units must be a config error");
  }
  exit_code = Run({"benchdiff", "profile", "--manifest", (root / "nope.toml").string()}, out, err);
  if (exit_code != ToInt(ExitCode::kConfigInvalid)) {
    Fail("missing manifest must be a config error");
  }

  benchdiff::tests::common::RemovePathBestEffort(root);
  return 0;
}
