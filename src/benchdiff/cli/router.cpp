#include "benchdiff/cli/router.hpp"

#include "ci/github_outputs.hpp"
#include "compare/reconciler.hpp"
#include "config/comparison_config.hpp"
#include "config/manifest.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "orchestrator/comparison_runner.hpp"
#include "orchestrator/profile_runner.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace benchdiff::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitRegressionDetected =
    core::errors::ToInt(core::errors::ExitCode::kRegressionDetected);

constexpr std::string_view kVersion = "benchdiff 0.1.0";

struct LogOptions {
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  core::logging::LogFormat format = core::logging::LogFormat::kKeyValue;
};

struct CompareCommandOptions {
  std::optional<fs::path> manifest_path;
  config::ComparisonOverrides overrides;
  bool use_github_output_env = true;
  LogOptions log;
};

// Unset output_dir and suffix fall back to the comparison defaults, so a
// plain `profile` run writes baselines where `compare` looks for them.
struct ProfileCommandOptions {
  std::optional<fs::path> manifest_path;
  std::vector<std::string> contracts;
  std::optional<fs::path> output_dir;
  std::optional<std::string> suffix;
  LogOptions log;
};

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  benchdiff compare [--manifest <Nargo.toml>] [--reports-dir <dir>] "
         "[--base-suffix <s>] [--latest-suffix <s>] [--threshold <fraction>] "
         "[--out <report.md>] [--summary-json <path>] [--github-output <path> | "
         "--no-github-output] [--fail-on-regression] [--reject-duplicate-names] "
         "[--log-level <debug|info|warn|error>] [--log-format <kv|github>]\n"
      << "  benchdiff profile [--manifest <Nargo.toml>] [--contracts <a,b,...>] "
         "[--output-dir <dir>] [--suffix <s> (default: base suffix)] "
         "[--log-level <debug|info|warn|error>] [--log-format <kv|github>]\n"
      << "  benchdiff version\n";
}

// Shared value lookup for `--flag <value>` pairs.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

// Handles the logging flags shared by every command. Sets `consumed` when
// args[i] was a logging flag; returns false only on a bad value.
bool ParseLogOption(const std::vector<std::string_view>& args, std::size_t& i, LogOptions& log,
                    bool& consumed, std::string& error) {
  const std::string_view token = args[i];
  std::string_view value;
  consumed = false;
  if (token == "--log-level") {
    consumed = true;
    return TakeValue(args, i, token, value, error) &&
           core::logging::ParseLogLevel(value, log.level, error);
  }
  if (token == "--log-format") {
    consumed = true;
    return TakeValue(args, i, token, value, error) &&
           core::logging::ParseLogFormat(value, log.format, error);
  }
  return true;
}

void ApplyLogOptions(const LogOptions& options, core::logging::Logger& logger) {
  logger.SetMinLevel(options.level);
  logger.SetFormat(options.format);
}

std::vector<std::string> SplitCommaList(std::string_view raw) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= raw.size()) {
    std::size_t end = raw.find(',', start);
    if (end == std::string_view::npos) {
      end = raw.size();
    }
    const std::string_view item = raw.substr(start, end - start);
    if (!item.empty()) {
      items.emplace_back(item);
    }
    start = end + 1;
  }
  return items;
}

// Loads the manifest named on the command line, or the default one in the
// working directory. A missing default is only an error when `required`.
bool LoadCommandManifest(const std::optional<fs::path>& explicit_path, bool required,
                         config::Manifest& manifest, bool& loaded, std::string& error) {
  loaded = false;
  const fs::path path = explicit_path.value_or(fs::path(std::string(config::kDefaultManifestFileName)));

  if (!explicit_path.has_value() && !required) {
    std::error_code ec;
    if (!fs::exists(path, ec) || ec) {
      return true;
    }
  }

  if (!config::LoadManifest(path, manifest, error)) {
    return false;
  }
  loaded = true;
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

bool ParseCompareOptions(const std::vector<std::string_view>& args, CompareCommandOptions& options,
                         std::string& error) {
  config::ComparisonOverrides& overrides = options.overrides;
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseLogOption(args, i, options.log, consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--fail-on-regression") {
      overrides.fail_on_regression = true;
      continue;
    }
    if (token == "--reject-duplicate-names") {
      overrides.duplicate_policy = compare::DuplicateNamePolicy::kReject;
      continue;
    }
    if (token == "--no-github-output") {
      options.use_github_output_env = false;
      overrides.github_output_path.reset();
      continue;
    }
    if (token == "--threshold") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      double fraction = 0.0;
      if (!config::ParseThresholdFraction(value, fraction, error)) {
        return false;
      }
      overrides.threshold_fraction = fraction;
      continue;
    }
    if (token == "--manifest" || token == "--reports-dir" || token == "--out" ||
        token == "--summary-json" || token == "--github-output" || token == "--base-suffix" ||
        token == "--latest-suffix") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = std::string(token) + " cannot be empty";
        return false;
      }
      const fs::path path{std::string(value)};
      if (token == "--manifest") {
        options.manifest_path = path;
      } else if (token == "--reports-dir") {
        overrides.reports_dir = path;
      } else if (token == "--out") {
        overrides.report_path = path;
      } else if (token == "--summary-json") {
        overrides.summary_json_path = path;
      } else if (token == "--github-output") {
        overrides.github_output_path = path;
        options.use_github_output_env = false;
      } else if (token == "--base-suffix") {
        overrides.base_suffix = std::string(value);
      } else {
        overrides.latest_suffix = std::string(value);
      }
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.use_github_output_env && !overrides.github_output_path.has_value()) {
    overrides.github_output_path = ci::GithubOutputPathFromEnvironment();
  }
  return true;
}

int CommandCompare(const std::vector<std::string_view>& args) {
  CompareCommandOptions options;
  std::string error;
  if (!ParseCompareOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger;
  ApplyLogOptions(options.log, logger);

  config::Manifest manifest;
  bool manifest_loaded = false;
  if (!LoadCommandManifest(options.manifest_path, false, manifest, manifest_loaded, error)) {
    logger.Error("invalid manifest", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (manifest_loaded) {
    logger.Info("manifest loaded", {{"path", manifest.manifest_path.string()},
                                    {"units", std::to_string(manifest.units.size())}});
  }

  config::ComparisonConfig comparison_config;
  if (!config::ResolveComparisonConfig(options.overrides, manifest_loaded ? &manifest : nullptr,
                                       comparison_config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  orchestrator::RunOutcome outcome;
  if (!orchestrator::RunComparison(comparison_config, manifest_loaded ? &manifest : nullptr,
                                   logger, outcome, error)) {
    logger.Error("comparison failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "report: " << comparison_config.report_path.string() << '\n';
  std::cout << "units_discovered: " << outcome.report.UnitsDiscovered() << '\n';
  std::cout << "units_compared: " << outcome.units_compared << '\n';
  std::cout << "regressions: " << outcome.regressions << '\n';

  if (comparison_config.fail_on_regression && outcome.regressions > 0U) {
    logger.Error("regressions detected", {{"count", std::to_string(outcome.regressions)}});
    return kExitRegressionDetected;
  }
  return kExitSuccess;
}

bool ParseProfileOptions(const std::vector<std::string_view>& args, ProfileCommandOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool consumed = false;
    if (!ParseLogOption(args, i, options.log, consumed, error)) {
      return false;
    }
    if (consumed) {
      continue;
    }

    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--manifest") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.manifest_path = fs::path(std::string(value));
      continue;
    }
    if (token == "--contracts") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      const std::vector<std::string> names = SplitCommaList(value);
      if (names.empty()) {
        error = "--contracts requires at least one name";
        return false;
      }
      options.contracts.insert(options.contracts.end(), names.begin(), names.end());
      continue;
    }
    if (token == "--output-dir") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--output-dir cannot be empty";
        return false;
      }
      options.output_dir = fs::path(std::string(value));
      continue;
    }
    if (token == "--suffix") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.suffix = std::string(value);
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

int CommandProfile(const std::vector<std::string_view>& args) {
  ProfileCommandOptions options;
  std::string error;
  if (!ParseProfileOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger;
  ApplyLogOptions(options.log, logger);

  config::Manifest manifest;
  bool manifest_loaded = false;
  if (!LoadCommandManifest(options.manifest_path, true, manifest, manifest_loaded, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (manifest.units.empty()) {
    std::cerr << "error: no contracts found in the [benchmark] section of "
              << manifest.manifest_path.string() << '\n';
    return kExitConfigInvalid;
  }

  std::vector<std::string> unknown_names;
  const std::vector<config::ManifestUnit> units =
      orchestrator::SelectProfileUnits(manifest, options.contracts, unknown_names);
  for (const auto& name : unknown_names) {
    logger.Warn("requested contract not found in manifest", {{"name", name}});
  }
  if (units.empty()) {
    std::cerr << "error: none of the requested contracts are declared in the [benchmark] "
                 "section\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::ComparisonConfig defaults;
  if (!config::ResolveComparisonConfig({}, &manifest, defaults, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  const fs::path output_dir = options.output_dir.value_or(defaults.reports_dir);
  const std::string suffix = options.suffix.value_or(defaults.base_suffix);

  logger.Info("running benchmarks", {{"count", std::to_string(units.size())},
                                     {"output_dir", output_dir.string()},
                                     {"suffix", suffix}});
  const orchestrator::ProfileRunOutcome outcome =
      orchestrator::RunProfileUnits(units, output_dir, suffix, logger);

  for (const auto& path : outcome.written_reports) {
    std::cout << "profile_report: " << path.string() << '\n';
  }
  if (!outcome.failed_units.empty()) {
    std::cerr << "error: " << outcome.failed_units.size() << " of " << units.size()
              << " benchmark(s) failed\n";
    return kExitFailure;
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "compare") {
    return CommandCompare(args);
  }

  if (command == "profile") {
    return CommandProfile(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace benchdiff::cli
