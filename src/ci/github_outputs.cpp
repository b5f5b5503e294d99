#include "ci/github_outputs.hpp"

#include "core/fs_utils.hpp"

#include <cstdlib>
#include <sstream>

namespace benchdiff::ci {

namespace {

constexpr std::string_view kDelimiterBase = "BENCHDIFF_MARKDOWN_EOF";

bool ContainsLine(std::string_view text, std::string_view line) {
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view current = text.substr(start, end - start);
    if (!current.empty() && current.back() == '\r') {
      current.remove_suffix(1);
    }
    if (current == line) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

} // namespace

std::string ChooseHeredocDelimiter(std::string_view value) {
  std::string delimiter(kDelimiterBase);
  for (std::size_t attempt = 1; ContainsLine(value, delimiter); ++attempt) {
    delimiter = std::string(kDelimiterBase) + "_" + std::to_string(attempt);
  }
  return delimiter;
}

std::string FormatGithubOutputs(const GithubOutputs& outputs) {
  const std::string delimiter = ChooseHeredocDelimiter(outputs.comparison_markdown);

  std::ostringstream out;
  out << "report_path=" << outputs.report_path.string() << "\n"
      << "units_compared=" << outputs.units_compared << "\n"
      << "regressions=" << outputs.regressions << "\n"
      << "comparison_markdown<<" << delimiter << "\n"
      << outputs.comparison_markdown;
  if (outputs.comparison_markdown.empty() || outputs.comparison_markdown.back() != '\n') {
    out << "\n";
  }
  out << delimiter << "\n";
  return out.str();
}

std::optional<std::filesystem::path> GithubOutputPathFromEnvironment() {
  const char* raw = std::getenv(std::string(kGithubOutputEnvVar).c_str());
  if (raw == nullptr || std::string_view(raw).empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(raw);
}

bool AppendGithubOutputs(const GithubOutputs& outputs, const std::filesystem::path& output_path,
                         std::string& error) {
  if (!core::AppendTextFile(output_path, FormatGithubOutputs(outputs), error)) {
    error = "failed to write GitHub outputs: " + error;
    return false;
  }
  return true;
}

} // namespace benchdiff::ci
