#include "config/comparison_config.hpp"
#include "config/manifest.hpp"
#include "config/toml_reader.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void RequireContains(const std::string& text, const std::string& needle) {
  INFO(text);
  REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("TOML reader keeps sections and entries in file order", "[config][toml]") {
  const std::string text = "# project\n"
                           "[package]\n"
                           "name = \"token\"\n"
                           "\n"
                           "[benchmark]\n"
                           "zeta = 'bench/zeta.json'   # literal\n"
                           "alpha = \"bench/alpha.json\"\n"
                           "regression_threshold_percentage = 2.5\n"
                           "enabled = true\n"
                           "limit = 1_000\n"
                           "tags = [\"a\", \"b\"]\n";

  benchdiff::config::TomlDocument document;
  std::string error;
  REQUIRE(benchdiff::config::ParseTomlDocument(text, document, error));

  const auto* benchmark = benchdiff::config::FindSection(document, "benchmark");
  REQUIRE(benchmark != nullptr);
  REQUIRE(benchmark->entries.size() == 6U);
  REQUIRE(benchmark->entries[0].key == "zeta");
  REQUIRE(benchmark->entries[0].value.string_value == "bench/zeta.json");
  REQUIRE(benchmark->entries[1].key == "alpha");
  REQUIRE(benchmark->entries[2].value.AsDouble() == 2.5);
  REQUIRE(benchmark->entries[3].value.bool_value);
  REQUIRE(benchmark->entries[4].value.integer_value == 1000);
  REQUIRE(benchmark->entries[5].value.array_value.size() == 2U);
  REQUIRE(benchmark->entries[5].line == 11U);
}

TEST_CASE("TOML reader rejects malformed input with line numbers", "[config][toml]") {
  benchdiff::config::TomlDocument document;
  std::string error;

  REQUIRE_FALSE(benchdiff::config::ParseTomlDocument("[a]\nx = 1\n[b\n", document, error));
  RequireContains(error, "manifest parse error at line 3");

  REQUIRE_FALSE(benchdiff::config::ParseTomlDocument("x = { a = 1, }\n", document, error));
  RequireContains(error, "trailing comma in inline table");

  REQUIRE_FALSE(benchdiff::config::ParseTomlDocument("x = 1\nx = 2\n", document, error));
  RequireContains(error, "line 2: duplicate key 'x'");

  REQUIRE_FALSE(benchdiff::config::ParseTomlDocument("[a]\n[a]\n", document, error));
  RequireContains(error, "line 2: duplicate section [a]");

  REQUIRE_FALSE(benchdiff::config::ParseTomlDocument("x = \"open\n", document, error));
  RequireContains(error, "unterminated string");

  REQUIRE_FALSE(benchdiff::config::ParseTomlDocument("x = [\n  1,\n  2\n", document, error));
  RequireContains(error, "line 1: unterminated array");

  REQUIRE_FALSE(benchdiff::config::ParseTomlDocument("x = 1 2\n", document, error));
  RequireContains(error, "unexpected trailing content");
}

TEST_CASE("TOML reader handles multi-line and structured values", "[config][toml]") {
  const std::string text = "title = \"\"\"\n"
                           "first\n"
                           "second\"\"\"\n"
                           "a.b = 0x1F\n"
                           "released = 1979-05-27 07:32:00Z\n"
                           "nested = [ [1, 2], # inline comment\n"
                           "  ['x'] ,\n"
                           "]\n"
                           "\n"
                           "[[bin]]\n"
                           "name = \"one\"\n"
                           "[[bin]]\n"
                           "name = \"two\"\n"
                           "[deps]\n"
                           "lib = { path = \"../lib\", tag = 'v1' }\n";

  benchdiff::config::TomlDocument document;
  std::string error;
  REQUIRE(benchdiff::config::ParseTomlDocument(text, document, error));

  const auto* root = benchdiff::config::FindSection(document, "");
  REQUIRE(root != nullptr);
  REQUIRE(root->entries[0].value.string_value == "first\nsecond");
  REQUIRE(root->entries[1].key == "a.b");
  REQUIRE(root->entries[1].value.integer_value == 31);
  REQUIRE(root->entries[2].value.type == benchdiff::config::TomlValue::Type::kDateTime);
  REQUIRE(root->entries[2].value.string_value == "1979-05-27 07:32:00Z");
  REQUIRE(root->entries[3].value.array_value.size() == 2U);
  REQUIRE(root->entries[3].value.array_value[0].array_value.size() == 2U);
  REQUIRE(root->entries[3].line == 6U);

  REQUIRE(document.sections.size() == 4U);
  REQUIRE(document.sections[1].array_of_tables);
  REQUIRE(document.sections[2].entries[0].value.string_value == "two");
  REQUIRE(benchdiff::config::FindSection(document, "bin") == nullptr);

  const auto* deps = benchdiff::config::FindSection(document, "deps");
  REQUIRE(deps != nullptr);
  const auto& lib = deps->entries[0].value;
  REQUIRE(lib.IsTable());
  REQUIRE(lib.table_value.size() == 2U);
  REQUIRE(lib.table_value[1].key == "tag");
  REQUIRE(lib.table_value[1].value.string_value == "v1");
}

TEST_CASE("Manifest reads a workspace project with dependencies", "[config][manifest]") {
  const std::string text =
      "[workspace]\n"
      "members = [\n"
      "  \"contracts/token\",\n"
      "  \"contracts/amm\", # pool\n"
      "]\n"
      "\n"
      "[package]\n"
      "name = \"token_contract\"\n"
      "authors = [\"\"]\n"
      "compiler_version = \">=0.25.0\"\n"
      "type = \"contract\"\n"
      "\n"
      "[dependencies]\n"
      "aztec = { git = \"https://github.com/AztecProtocol/aztec-packages/\", "
      "tag = \"v0.76.4\", directory = \"noir-projects/aztec-nr/aztec\" }\n"
      "\n"
      "[benchmark]\n"
      "token = \"benchmarks/token.benchmark.ts\"\n";

  benchdiff::config::Manifest manifest;
  std::string error;
  const bool parsed = benchdiff::config::ParseManifestText(text, fs::path("proj"), manifest, error);
  INFO(error);
  REQUIRE(parsed);
  REQUIRE(manifest.workspace_members ==
          std::vector<std::string>{"contracts/token", "contracts/amm"});
  REQUIRE(manifest.units.size() == 1U);
  REQUIRE(manifest.units[0].name == "token");
  REQUIRE(manifest.units[0].definition_path == fs::path("proj") / "benchmarks/token.benchmark.ts");
}

TEST_CASE("Manifest declares units and settings under [benchmark]", "[config][manifest]") {
  const std::string text = "[workspace]\n"
                           "members = [\"contracts/token\"]\n"
                           "\n"
                           "[benchmark]\n"
                           "regression_threshold_percentage = 5\n"
                           "report_path = \"out/diff.md\"\n"
                           "token = \"bench/token.json\"\n"
                           "amm = \"/abs/amm.json\"\n"
                           "ignored = 12\n";

  benchdiff::config::Manifest manifest;
  std::string error;
  REQUIRE(benchdiff::config::ParseManifestText(text, fs::path("proj"), manifest, error));

  REQUIRE(manifest.units.size() == 2U);
  REQUIRE(manifest.units[0].name == "token");
  REQUIRE(manifest.units[0].definition_path == fs::path("proj") / "bench/token.json");
  REQUIRE(manifest.units[1].definition_path == fs::path("/abs/amm.json"));
  REQUIRE(manifest.regression_threshold_percentage.value() == 5.0);
  REQUIRE(manifest.report_path.value() == fs::path("proj") / "out/diff.md");
  REQUIRE_FALSE(manifest.reports_dir.has_value());
  REQUIRE(manifest.workspace_members == std::vector<std::string>{"contracts/token"});
  REQUIRE(manifest.FindUnit("amm") != nullptr);
  REQUIRE(manifest.FindUnit("ignored") == nullptr);
}

TEST_CASE("Manifest rejects invalid settings", "[config][manifest]") {
  benchdiff::config::Manifest manifest;
  std::string error;

  REQUIRE_FALSE(benchdiff::config::ParseManifestText(
      "[benchmark]\nregression_threshold_percentage = \"high\"\n", {}, manifest, error));
  RequireContains(error, "manifest [benchmark] regression_threshold_percentage (line 2)");

  REQUIRE_FALSE(benchdiff::config::ParseManifestText(
      "[benchmark]\nregression_threshold_percentage = -1\n", {}, manifest, error));
  RequireContains(error, "finite number >= 0");

  REQUIRE_FALSE(
      benchdiff::config::ParseManifestText("[benchmark]\nreports_dir = \"\"\n", {}, manifest, error));
  RequireContains(error, "non-empty string");

  REQUIRE_FALSE(
      benchdiff::config::ParseManifestText("[workspace]\nmembers = [1]\n", {}, manifest, error));
  RequireContains(error, "array of strings");
}

TEST_CASE("Threshold parsing accepts fractions only", "[config][threshold]") {
  double fraction = 0.0;
  std::string error;
  REQUIRE(benchdiff::config::ParseThresholdFraction("0.05", fraction, error));
  REQUIRE(fraction == 0.05);
  REQUIRE(benchdiff::config::ParseThresholdFraction("0", fraction, error));
  REQUIRE(fraction == 0.0);

  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction("", fraction, error));
  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction("abc", fraction, error));
  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction("0.05x", fraction, error));
  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction("-0.1", fraction, error));
  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction("inf", fraction, error));
  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction(" 0.05", fraction, error));
  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction("0x1p-3", fraction, error));
  REQUIRE_FALSE(benchdiff::config::ParseThresholdFraction("2.5%", fraction, error));
  REQUIRE(benchdiff::config::ParseThresholdFraction("5e-2", fraction, error));
  REQUIRE(fraction == 0.05);
}

TEST_CASE("Config resolution prefers CLI, then manifest, then defaults", "[config][resolve]") {
  benchdiff::config::ComparisonConfig config;
  std::string error;

  REQUIRE(benchdiff::config::ResolveComparisonConfig({}, nullptr, config, error));
  REQUIRE(config.threshold_fraction == 0.025);
  REQUIRE(config.report_path == fs::path("benchmark_diff.md"));
  REQUIRE(config.reports_dir == fs::path("benchmarks"));
  REQUIRE(config.base_suffix == "_base");
  REQUIRE(config.latest_suffix == "_latest");

  benchdiff::config::Manifest manifest;
  manifest.base_dir = "proj";
  manifest.regression_threshold_percentage = 10.0;
  REQUIRE(benchdiff::config::ResolveComparisonConfig({}, &manifest, config, error));
  REQUIRE(config.threshold_fraction == 0.1);
  REQUIRE(config.reports_dir == fs::path("proj") / "benchmarks");

  benchdiff::config::ComparisonOverrides overrides;
  overrides.threshold_fraction = 0.01;
  overrides.reports_dir = fs::path("cli-dir");
  overrides.duplicate_policy = benchdiff::compare::DuplicateNamePolicy::kReject;
  REQUIRE(benchdiff::config::ResolveComparisonConfig(overrides, &manifest, config, error));
  REQUIRE(config.threshold_fraction == 0.01);
  REQUIRE(config.reports_dir == fs::path("cli-dir"));
  REQUIRE(config.ToCompareOptions().duplicate_policy ==
          benchdiff::compare::DuplicateNamePolicy::kReject);
}

TEST_CASE("Config resolution rejects equal suffixes", "[config][resolve]") {
  benchdiff::config::ComparisonOverrides overrides;
  overrides.base_suffix = "_x";
  overrides.latest_suffix = "_x";

  benchdiff::config::ComparisonConfig config;
  std::string error;
  REQUIRE_FALSE(benchdiff::config::ResolveComparisonConfig(overrides, nullptr, config, error));
  RequireContains(error, "must differ");
}
