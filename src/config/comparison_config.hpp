#pragma once

#include "compare/reconciler.hpp"
#include "compare/unit_comparison.hpp"
#include "config/manifest.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace benchdiff::config {

inline constexpr double kDefaultThresholdFraction = 0.025;
inline constexpr std::string_view kDefaultReportPath = "benchmark_diff.md";
inline constexpr std::string_view kDefaultReportsDir = "benchmarks";
inline constexpr std::string_view kDefaultBaseSuffix = "_base";
inline constexpr std::string_view kDefaultLatestSuffix = "_latest";

// Settings for one comparison run, passed explicitly through the orchestrator.
struct ComparisonConfig {
  double threshold_fraction = kDefaultThresholdFraction;
  std::filesystem::path report_path{std::string(kDefaultReportPath)};
  std::filesystem::path reports_dir{std::string(kDefaultReportsDir)};
  std::string base_suffix{kDefaultBaseSuffix};
  std::string latest_suffix{kDefaultLatestSuffix};
  std::optional<std::filesystem::path> summary_json_path;
  std::optional<std::filesystem::path> github_output_path;
  bool fail_on_regression = false;
  compare::DuplicateNamePolicy duplicate_policy = compare::DuplicateNamePolicy::kLastWriteWins;

  compare::CompareOptions ToCompareOptions() const;
};

// Values given on the command line. Unset fields fall through to the manifest,
// then to defaults.
struct ComparisonOverrides {
  std::optional<double> threshold_fraction;
  std::optional<std::filesystem::path> report_path;
  std::optional<std::filesystem::path> reports_dir;
  std::optional<std::string> base_suffix;
  std::optional<std::string> latest_suffix;
  std::optional<std::filesystem::path> summary_json_path;
  std::optional<std::filesystem::path> github_output_path;
  bool fail_on_regression = false;
  std::optional<compare::DuplicateNamePolicy> duplicate_policy;
};

// Parses a threshold fraction such as "0.05". Rejects empty, non-numeric,
// non-finite and negative values.
bool ParseThresholdFraction(std::string_view raw, double& fraction, std::string& error);

// Converts a manifest percentage (2.5 means 2.5%) to a fraction.
double PercentageToFraction(double percentage);

// Applies precedence CLI > manifest > default. `manifest` may be null.
//
// Contract:
// - a manifest without `reports_dir` still anchors the default reports dir at
//   the manifest directory.
// - suffixes must be non-empty and distinct; otherwise returns false.
bool ResolveComparisonConfig(const ComparisonOverrides& overrides, const Manifest* manifest,
                             ComparisonConfig& config, std::string& error);

} // namespace benchdiff::config
