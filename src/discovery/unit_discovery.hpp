#pragma once

#include "config/comparison_config.hpp"
#include "config/manifest.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::discovery {

inline constexpr std::string_view kResultFileExtension = ".benchmark.json";

// One unit to compare and where its two result files are expected.
struct UnitSource {
  std::string name;
  std::filesystem::path baseline_path;
  std::filesystem::path current_path;
};

// `<reports_dir>/<unit><suffix>.benchmark.json`
std::filesystem::path BuildResultFilePath(const std::filesystem::path& reports_dir,
                                          std::string_view unit_name, std::string_view suffix);

// Resolves the ordered list of units for one comparison run.
//
// Contract:
// - manifest declaring units: one source per declared unit, manifest order,
//   files are not checked for existence.
// - otherwise: scans `config.reports_dir` for baseline/current result files,
//   groups by unit name, returns units sorted by name; a unit seen on one side
//   only is still returned.
// - a scan of a missing or unreadable directory returns false.
bool DiscoverUnits(const config::ComparisonConfig& config, const config::Manifest* manifest,
                   std::vector<UnitSource>& units, std::string& error);

} // namespace benchdiff::discovery
