#include "report/markdown_report_writer.hpp"

#include "compare/classifier.hpp"
#include "core/fs_utils.hpp"
#include "report/cell_format.hpp"

#include <array>
#include <sstream>
#include <string_view>
#include <vector>

namespace benchdiff::report {

namespace {

constexpr std::string_view kReportMarker = "<!-- benchmark-diff -->";
constexpr std::string_view kTitle = "# Benchmark Comparison";
constexpr std::string_view kSectionSeparator = "\n---\n";

constexpr std::array<compare::ComparisonStatus, 5> kLegendOrder = {
    compare::ComparisonStatus::kImprovement,
    compare::ComparisonStatus::kRegression,
    compare::ComparisonStatus::kUnchanged,
    compare::ComparisonStatus::kNew,
    compare::ComparisonStatus::kRemoved,
};

std::string BuildLegendLine() {
  std::ostringstream out;
  out << "Legends: ";
  for (std::size_t i = 0; i < kLegendOrder.size(); ++i) {
    if (i != 0U) {
      out << " | ";
    }
    out << compare::StatusIndicator(kLegendOrder[i]) << " "
        << compare::LegendLabel(kLegendOrder[i]);
  }
  return out.str();
}

std::string SectionHeading(const UnitSection& section) {
  return "## Contract: " + EscapeHtml(section.unit_name);
}

void AppendTableHeader(std::vector<std::string>& lines) {
  lines.emplace_back("<table>");
  lines.emplace_back("<thead>");
  lines.emplace_back("<tr>");
  lines.emplace_back("  <th></th>");
  lines.emplace_back("  <th>Function</th>");
  for (const compare::MetricKind kind : compare::kAllMetricKinds) {
    lines.push_back(std::string("  <th colspan=\"3\" align=\"center\">") +
                    compare::DisplayName(kind) + "</th>");
  }
  lines.emplace_back("</tr>");
  lines.emplace_back("<tr>");
  lines.emplace_back("  <th>Status</th>");
  lines.emplace_back("  <th></th>");
  for (std::size_t i = 0; i < compare::kAllMetricKinds.size(); ++i) {
    lines.emplace_back("  <th align=\"right\">Base</th>");
    lines.emplace_back("  <th align=\"right\">PR</th>");
    lines.emplace_back("  <th align=\"center\">Diff</th>");
  }
  lines.emplace_back("</tr>");
  lines.emplace_back("</thead>");
  lines.emplace_back("<tbody>");
}

void AppendEntryRow(const compare::ComparisonEntry& entry, std::vector<std::string>& lines) {
  lines.emplace_back("<tr>");
  lines.push_back(std::string("  <td align=\"center\">") + compare::StatusIndicator(entry.status) +
                  "</td>");
  lines.push_back("  <td><code>" + EscapeHtml(entry.name) + "</code></td>");
  for (const compare::MetricKind kind : compare::kAllMetricKinds) {
    lines.push_back("  <td align=\"right\">" + FormatWithThousands(entry.baseline.Get(kind)) +
                    "</td>");
    lines.push_back("  <td align=\"right\">" + FormatWithThousands(entry.current.Get(kind)) +
                    "</td>");
    lines.push_back("  <td align=\"center\">" + FormatDiffCell(entry.Delta(kind)) + "</td>");
  }
  lines.emplace_back("</tr>");
}

std::string RenderTable(const compare::UnitComparison& comparison) {
  std::vector<std::string> lines;
  AppendTableHeader(lines);
  for (const auto& entry : comparison.entries) {
    AppendEntryRow(entry, lines);
  }
  lines.emplace_back("</tbody>");
  lines.emplace_back("</table>");

  std::string table;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i != 0U) {
      table += '\n';
    }
    table += lines[i];
  }
  return table;
}

void AppendSection(const UnitSection& section, std::vector<std::string>& blocks) {
  switch (section.outcome) {
  case UnitOutcome::kCompared:
    blocks.push_back(SectionHeading(section));
    blocks.push_back(RenderTable(section.comparison));
    break;
  case UnitOutcome::kNoComparableFunctions:
    blocks.push_back(SectionHeading(section));
    blocks.emplace_back("\n_No valid benchmark functions found to compare._\n");
    break;
  case UnitOutcome::kInvalidInput:
    blocks.push_back(SectionHeading(section));
    blocks.emplace_back("\n_Skipped: Invalid benchmark JSON structure._\n");
    if (!section.detail.empty()) {
      blocks.push_back("> " + EscapeHtml(section.detail));
    }
    break;
  case UnitOutcome::kLoadFailed:
    blocks.push_back(SectionHeading(section) + "\n");
    blocks.push_back("\n⚠️ Error comparing benchmarks for this contract: " +
                     EscapeHtml(section.detail) + "\n");
    break;
  }
  blocks.emplace_back(kSectionSeparator);
}

std::string BuildSummaryLine(const ComparisonReport& report) {
  std::ostringstream out;
  out << "_Summary: " << report.UnitsCompared() << " of " << report.UnitsDiscovered()
      << " contract(s) compared; " << report.UnitsSkipped() << " skipped._";
  return out.str();
}

} // namespace

std::string RenderMarkdownReport(const ComparisonReport& report) {
  if (report.sections.empty()) {
    return std::string(kTitle) + "\n\n_No benchmark results found to compare._\n";
  }

  std::vector<std::string> blocks;
  blocks.emplace_back(kReportMarker);
  blocks.emplace_back(kTitle);
  blocks.push_back("_Comparison Threshold: " + FormatThresholdPercent(report.threshold_fraction) +
                   "%_\n");
  blocks.push_back(BuildLegendLine() + "\n");

  for (const auto& section : report.sections) {
    AppendSection(section, blocks);
  }

  if (report.UnitsCompared() == 0U) {
    blocks.emplace_back(
        "\n_Found contract pairs but failed to process or validate any for comparison._\n");
  }
  blocks.push_back(BuildSummaryLine(report));

  std::string document;
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    if (i != 0U) {
      document += '\n';
    }
    document += blocks[i];
  }
  document += '\n';
  return document;
}

bool WriteMarkdownReport(const ComparisonReport& report, const std::filesystem::path& output_path,
                         std::string& error) {
  return core::WriteTextFileAtomic(output_path, RenderMarkdownReport(report), error);
}

} // namespace benchdiff::report
