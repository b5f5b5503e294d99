#include "discovery/unit_discovery.hpp"

#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace benchdiff::discovery {

namespace {

bool EndsWith(std::string_view text, std::string_view suffix) {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

// Returns the unit name when `file_name` is `<unit><suffix>.benchmark.json`
// with a non-empty unit.
bool MatchResultFileName(std::string_view file_name, std::string_view suffix,
                         std::string& unit_name) {
  const std::string full_suffix = std::string(suffix) + std::string(kResultFileExtension);
  if (!EndsWith(file_name, full_suffix) || file_name.size() == full_suffix.size()) {
    return false;
  }
  unit_name = std::string(file_name.substr(0, file_name.size() - full_suffix.size()));
  return true;
}

bool ScanReportsDir(const config::ComparisonConfig& config, std::vector<UnitSource>& units,
                    std::string& error) {
  std::error_code ec;
  if (!fs::exists(config.reports_dir, ec) || ec) {
    error = "reports directory not found: " + config.reports_dir.string();
    return false;
  }
  if (!fs::is_directory(config.reports_dir, ec) || ec) {
    error = "reports path is not a directory: " + config.reports_dir.string();
    return false;
  }

  // Longer suffix first: when one suffix ends with the other, the longer
  // match names the unit.
  std::string_view first_suffix = config.base_suffix;
  std::string_view second_suffix = config.latest_suffix;
  if (second_suffix.size() > first_suffix.size()) {
    std::swap(first_suffix, second_suffix);
  }

  std::set<std::string> names;
  fs::directory_iterator it(config.reports_dir, ec);
  if (ec) {
    error = "unable to read reports directory '" + config.reports_dir.string() +
            "': " + ec.message();
    return false;
  }
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      error = "unable to read reports directory '" + config.reports_dir.string() +
              "': " + ec.message();
      return false;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) {
      continue;
    }

    const std::string file_name = it->path().filename().string();
    std::string unit_name;
    if (MatchResultFileName(file_name, first_suffix, unit_name) ||
        MatchResultFileName(file_name, second_suffix, unit_name)) {
      names.insert(unit_name);
    }
  }
  if (ec) {
    error = "unable to read reports directory '" + config.reports_dir.string() +
            "': " + ec.message();
    return false;
  }

  for (const auto& name : names) {
    units.push_back(UnitSource{
        .name = name,
        .baseline_path = BuildResultFilePath(config.reports_dir, name, config.base_suffix),
        .current_path = BuildResultFilePath(config.reports_dir, name, config.latest_suffix),
    });
  }
  return true;
}

} // namespace

fs::path BuildResultFilePath(const fs::path& reports_dir, std::string_view unit_name,
                             std::string_view suffix) {
  return reports_dir /
         (std::string(unit_name) + std::string(suffix) + std::string(kResultFileExtension));
}

bool DiscoverUnits(const config::ComparisonConfig& config, const config::Manifest* manifest,
                   std::vector<UnitSource>& units, std::string& error) {
  units.clear();

  if (manifest != nullptr && !manifest->units.empty()) {
    units.reserve(manifest->units.size());
    for (const auto& unit : manifest->units) {
      units.push_back(UnitSource{
          .name = unit.name,
          .baseline_path = BuildResultFilePath(config.reports_dir, unit.name, config.base_suffix),
          .current_path = BuildResultFilePath(config.reports_dir, unit.name, config.latest_suffix),
      });
    }
    return true;
  }

  return ScanReportsDir(config, units, error);
}

} // namespace benchdiff::discovery
