#include "config/manifest.hpp"

#include "config/toml_reader.hpp"
#include "core/fs_utils.hpp"

#include <cmath>
#include <utility>

namespace benchdiff::config {

namespace {

constexpr std::string_view kBenchmarkSection = "benchmark";
constexpr std::string_view kWorkspaceSection = "workspace";
constexpr std::string_view kThresholdKey = "regression_threshold_percentage";
constexpr std::string_view kReportPathKey = "report_path";
constexpr std::string_view kReportsDirKey = "reports_dir";
constexpr std::string_view kMembersKey = "members";

std::string EntryError(const TomlEntry& entry, std::string_view section, std::string_view message) {
  return "manifest [" + std::string(section) + "] " + entry.key + " (line " +
         std::to_string(entry.line) + ") " + std::string(message);
}

std::filesystem::path ResolveAgainst(const std::filesystem::path& base_dir,
                                     const std::string& raw) {
  const std::filesystem::path path(raw);
  if (path.is_absolute() || base_dir.empty()) {
    return path;
  }
  return base_dir / path;
}

bool ReadPathSetting(const TomlEntry& entry, const std::filesystem::path& base_dir,
                     std::optional<std::filesystem::path>& out, std::string& error) {
  if (!entry.value.IsString() || entry.value.string_value.empty()) {
    error = EntryError(entry, kBenchmarkSection, "must be a non-empty string");
    return false;
  }
  out = ResolveAgainst(base_dir, entry.value.string_value);
  return true;
}

bool ApplyBenchmarkSection(const TomlSection& section, Manifest& manifest, std::string& error) {
  for (const auto& entry : section.entries) {
    if (entry.key == kThresholdKey) {
      if (!entry.value.IsNumber()) {
        error = EntryError(entry, kBenchmarkSection,
                           std::string("must be a number, got ") + ToString(entry.value.type));
        return false;
      }
      const double percentage = entry.value.AsDouble();
      if (!std::isfinite(percentage) || percentage < 0.0) {
        error = EntryError(entry, kBenchmarkSection, "must be a finite number >= 0");
        return false;
      }
      manifest.regression_threshold_percentage = percentage;
      continue;
    }
    if (entry.key == kReportPathKey) {
      if (!ReadPathSetting(entry, manifest.base_dir, manifest.report_path, error)) {
        return false;
      }
      continue;
    }
    if (entry.key == kReportsDirKey) {
      if (!ReadPathSetting(entry, manifest.base_dir, manifest.reports_dir, error)) {
        return false;
      }
      continue;
    }

    if (!entry.value.IsString()) {
      continue;
    }
    manifest.units.push_back(ManifestUnit{
        .name = entry.key,
        .definition_path = ResolveAgainst(manifest.base_dir, entry.value.string_value),
    });
  }
  return true;
}

bool ApplyWorkspaceSection(const TomlSection& section, Manifest& manifest, std::string& error) {
  const TomlEntry* members = FindEntry(section, kMembersKey);
  if (members == nullptr) {
    return true;
  }
  if (!members->value.IsArray()) {
    error = EntryError(*members, kWorkspaceSection, "must be an array of strings");
    return false;
  }
  for (const auto& item : members->value.array_value) {
    if (!item.IsString()) {
      error = EntryError(*members, kWorkspaceSection, "must be an array of strings");
      return false;
    }
    manifest.workspace_members.push_back(item.string_value);
  }
  return true;
}

} // namespace

const ManifestUnit* Manifest::FindUnit(std::string_view name) const {
  for (const auto& unit : units) {
    if (unit.name == name) {
      return &unit;
    }
  }
  return nullptr;
}

bool ParseManifestText(std::string_view text, const std::filesystem::path& base_dir,
                       Manifest& manifest, std::string& error) {
  Manifest parsed;
  parsed.base_dir = base_dir;

  TomlDocument document;
  if (!ParseTomlDocument(text, document, error)) {
    return false;
  }

  if (const TomlSection* benchmark = FindSection(document, kBenchmarkSection);
      benchmark != nullptr) {
    if (!ApplyBenchmarkSection(*benchmark, parsed, error)) {
      return false;
    }
  }
  if (const TomlSection* workspace = FindSection(document, kWorkspaceSection);
      workspace != nullptr) {
    if (!ApplyWorkspaceSection(*workspace, parsed, error)) {
      return false;
    }
  }

  manifest = std::move(parsed);
  return true;
}

bool LoadManifest(const std::filesystem::path& manifest_path, Manifest& manifest,
                  std::string& error) {
  std::string text;
  if (!core::ReadTextFile(manifest_path, text, error)) {
    error = "unable to load manifest: " + error;
    return false;
  }
  if (!ParseManifestText(text, manifest_path.parent_path(), manifest, error)) {
    return false;
  }
  manifest.manifest_path = manifest_path;
  return true;
}

} // namespace benchdiff::config
