#pragma once

#include "compare/metric_record.hpp"
#include "core/schema/profile_report.hpp"

#include <filesystem>
#include <string>

namespace benchdiff::results {

// Outcome of reading one result file. The comparison report renders
// kUnreadable/kMalformed as an error notice and kInvalidStructure as a skip
// notice.
enum class LoadStatus {
  kLoaded,
  kUnreadable,
  kMalformed,
  kInvalidStructure,
};

const char* ToString(LoadStatus status);

// Reads `<unit><suffix>.benchmark.json`.
//
// Contract:
// - only `results` is read; `summary` and `gasSummary` are derived data.
// - absent metric fields load as 0, an absent `name` loads as "".
// - a metric field present with a non-numeric, negative or fractional value
//   is kInvalidStructure, never coerced. So is a value above kMaxMetricValue
//   or a gas dimension whose execution plus teardown sum exceeds it.
// - on any status other than kLoaded, `report` is left empty and `error`
//   describes the first problem found.
LoadStatus LoadProfileReport(const std::filesystem::path& path,
                             core::schema::ProfileReport& report,
                             std::string& error);

// Same as LoadProfileReport, projected onto the compared metrics.
LoadStatus LoadResultSet(const std::filesystem::path& path,
                         compare::ResultSet& result_set,
                         std::string& error);

// Writes the full result-file document atomically, creating parent
// directories as needed.
bool WriteProfileReportJson(const core::schema::ProfileReport& report,
                            const std::filesystem::path& output_path,
                            std::string& error);

} // namespace benchdiff::results
