#pragma once

#include "config/manifest.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace benchdiff::orchestrator {

struct ProfileRunOutcome {
  std::vector<std::filesystem::path> written_reports;
  std::vector<std::string> failed_units;
};

// Picks the manifest units to profile. An empty `requested` list selects all
// units in manifest order; otherwise the manifest order is kept and unknown
// names are returned in `unknown_names`.
std::vector<config::ManifestUnit> SelectProfileUnits(const config::Manifest& manifest,
                                                     const std::vector<std::string>& requested,
                                                     std::vector<std::string>& unknown_names);

// Profiles each unit and writes `<output_dir>/<unit><suffix>.benchmark.json`.
// A failing unit is logged and recorded in `failed_units`; the remaining
// units still run.
ProfileRunOutcome RunProfileUnits(const std::vector<config::ManifestUnit>& units,
                                  const std::filesystem::path& output_dir,
                                  const std::string& suffix, core::logging::Logger& logger);

} // namespace benchdiff::orchestrator
