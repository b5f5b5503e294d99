#pragma once

#include "report/comparison_report.hpp"

#include <filesystem>
#include <string>

namespace benchdiff::report {

// Machine-readable run summary for CI steps that gate on counts.
std::string ToSummaryJson(const ComparisonReport& report);

// Contract:
// - writes ToSummaryJson(report) atomically to `output_path`.
// - returns false and sets `error` on failure.
bool WriteSummaryJson(const ComparisonReport& report, const std::filesystem::path& output_path,
                      std::string& error);

} // namespace benchdiff::report
