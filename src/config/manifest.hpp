#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::config {

// A benchmarked unit declared under `[benchmark]`, e.g. `token = "bench/token.json"`.
struct ManifestUnit {
  std::string name;
  // Resolved against the manifest directory.
  std::filesystem::path definition_path;
};

// Project manifest content relevant to benchmarking. Optional fields stay
// unset when the manifest does not mention them; defaults are applied by
// ResolveComparisonConfig.
struct Manifest {
  std::filesystem::path manifest_path;
  std::filesystem::path base_dir;
  std::vector<ManifestUnit> units;
  std::optional<double> regression_threshold_percentage;
  std::optional<std::filesystem::path> report_path;
  std::optional<std::filesystem::path> reports_dir;
  std::vector<std::string> workspace_members;

  const ManifestUnit* FindUnit(std::string_view name) const;
};

inline constexpr std::string_view kDefaultManifestFileName = "Nargo.toml";

// Parses manifest text. Relative paths are resolved against `base_dir`.
//
// Contract:
// - `[benchmark]` keys `regression_threshold_percentage`, `report_path` and
//   `reports_dir` are settings; every other string-valued key declares a unit,
//   in file order. Non-string values under other keys are ignored.
// - `regression_threshold_percentage` must be a finite number >= 0.
// - `report_path`, `reports_dir` and `[workspace] members` must be strings
//   (members: an array of strings).
bool ParseManifestText(std::string_view text, const std::filesystem::path& base_dir,
                       Manifest& manifest, std::string& error);

// Reads and parses `manifest_path`; base directory is the file's parent.
bool LoadManifest(const std::filesystem::path& manifest_path, Manifest& manifest,
                  std::string& error);

} // namespace benchdiff::config
