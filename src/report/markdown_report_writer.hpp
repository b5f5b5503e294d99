#pragma once

#include "report/comparison_report.hpp"

#include <filesystem>
#include <string>

namespace benchdiff::report {

// Renders the comparison document posted on pull requests.
//
// Contract:
// - output is a pure function of `report`; identical input gives identical
//   bytes.
// - a report with no sections renders the short "no results" document.
// - function rows follow the entry order in each section (name-sorted by
//   compare::CompareUnit).
std::string RenderMarkdownReport(const ComparisonReport& report);

// Writes RenderMarkdownReport(report) atomically to `output_path`, creating
// parent directories as needed.
bool WriteMarkdownReport(const ComparisonReport& report, const std::filesystem::path& output_path,
                         std::string& error);

} // namespace benchdiff::report
