#include "config/comparison_config.hpp"

#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>

namespace benchdiff::config {

compare::CompareOptions ComparisonConfig::ToCompareOptions() const {
  return compare::CompareOptions{
      .threshold_fraction = threshold_fraction,
      .duplicate_policy = duplicate_policy,
  };
}

bool ParseThresholdFraction(std::string_view raw, double& fraction, std::string& error) {
  if (raw.empty()) {
    error = "threshold cannot be empty";
    return false;
  }

  // from_chars is locale-independent and rejects leading whitespace, a
  // leading '+' and hex floats.
  const std::string text(raw);
  double parsed = 0.0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed, std::chars_format::general);
  if (ec == std::errc::result_out_of_range) {
    error = "threshold out of range: " + text;
    return false;
  }
  if (ec != std::errc() || ptr != end) {
    error = "invalid threshold '" + text + "' (expected a fraction such as 0.05)";
    return false;
  }

  if (!std::isfinite(parsed)) {
    error = "threshold must be finite: " + text;
    return false;
  }
  if (parsed < 0.0) {
    error = "threshold must be >= 0: " + text;
    return false;
  }

  fraction = parsed;
  return true;
}

double PercentageToFraction(double percentage) {
  return percentage / 100.0;
}

bool ResolveComparisonConfig(const ComparisonOverrides& overrides, const Manifest* manifest,
                             ComparisonConfig& config, std::string& error) {
  ComparisonConfig resolved;

  if (overrides.threshold_fraction.has_value()) {
    resolved.threshold_fraction = overrides.threshold_fraction.value();
  } else if (manifest != nullptr && manifest->regression_threshold_percentage.has_value()) {
    resolved.threshold_fraction =
        PercentageToFraction(manifest->regression_threshold_percentage.value());
  }
  if (!std::isfinite(resolved.threshold_fraction) || resolved.threshold_fraction < 0.0) {
    error = "threshold must be a finite fraction >= 0";
    return false;
  }

  if (overrides.report_path.has_value()) {
    resolved.report_path = overrides.report_path.value();
  } else if (manifest != nullptr && manifest->report_path.has_value()) {
    resolved.report_path = manifest->report_path.value();
  }

  if (overrides.reports_dir.has_value()) {
    resolved.reports_dir = overrides.reports_dir.value();
  } else if (manifest != nullptr && manifest->reports_dir.has_value()) {
    resolved.reports_dir = manifest->reports_dir.value();
  } else if (manifest != nullptr && !manifest->base_dir.empty()) {
    resolved.reports_dir = manifest->base_dir / std::string(kDefaultReportsDir);
  }

  if (overrides.base_suffix.has_value()) {
    resolved.base_suffix = overrides.base_suffix.value();
  }
  if (overrides.latest_suffix.has_value()) {
    resolved.latest_suffix = overrides.latest_suffix.value();
  }
  if (resolved.base_suffix.empty() || resolved.latest_suffix.empty()) {
    error = "result file suffixes cannot be empty";
    return false;
  }
  if (resolved.base_suffix == resolved.latest_suffix) {
    error = "baseline and current suffixes must differ (both '" + resolved.base_suffix + "')";
    return false;
  }

  resolved.summary_json_path = overrides.summary_json_path;
  resolved.github_output_path = overrides.github_output_path;
  resolved.fail_on_regression = overrides.fail_on_regression;
  if (overrides.duplicate_policy.has_value()) {
    resolved.duplicate_policy = overrides.duplicate_policy.value();
  }

  config = std::move(resolved);
  return true;
}

} // namespace benchdiff::config
