#include "report/summary_json_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <sstream>

namespace benchdiff::report {

namespace {

void WriteCounts(std::ostream& out, const compare::StatusCounts& counts) {
  out << "\"new\":" << counts.new_count << ","
      << "\"removed\":" << counts.removed_count << ","
      << "\"regression\":" << counts.regression_count << ","
      << "\"improvement\":" << counts.improvement_count << ","
      << "\"unchanged\":" << counts.unchanged_count;
}

} // namespace

std::string ToSummaryJson(const ComparisonReport& report) {
  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\":\"1.0\",\n"
      << "  \"threshold_fraction\":" << core::FormatFixedDouble(report.threshold_fraction, 6)
      << ",\n"
      << "  \"units_discovered\":" << report.UnitsDiscovered() << ",\n"
      << "  \"units_compared\":" << report.UnitsCompared() << ",\n"
      << "  \"units_skipped\":" << report.UnitsSkipped() << ",\n"
      << "  \"functions\":{";
  WriteCounts(out, report.TotalCounts());
  out << "},\n"
      << "  \"units\":[";

  for (std::size_t i = 0; i < report.sections.size(); ++i) {
    const UnitSection& section = report.sections[i];
    if (i != 0U) {
      out << ",";
    }
    out << "\n    {"
        << "\"name\":" << core::QuoteJson(section.unit_name) << ","
        << "\"outcome\":\"" << ToString(section.outcome) << "\",";
    WriteCounts(out, section.comparison.counts);
    out << "}";
  }

  if (!report.sections.empty()) {
    out << "\n  ";
  }
  out << "]\n"
      << "}\n";
  return out.str();
}

bool WriteSummaryJson(const ComparisonReport& report, const std::filesystem::path& output_path,
                      std::string& error) {
  return core::WriteTextFileAtomic(output_path, ToSummaryJson(report), error);
}

} // namespace benchdiff::report
