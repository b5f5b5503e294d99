#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace benchdiff::ci {

inline constexpr std::string_view kGithubOutputEnvVar = "GITHUB_OUTPUT";

// Step outputs published after a comparison run.
struct GithubOutputs {
  std::filesystem::path report_path;
  std::size_t units_compared = 0;
  std::size_t regressions = 0;
  std::string comparison_markdown;
};

// Picks a heredoc delimiter that does not occur as a line of `value`.
std::string ChooseHeredocDelimiter(std::string_view value);

// Renders `name=value` lines plus a `comparison_markdown<<DELIM` block.
std::string FormatGithubOutputs(const GithubOutputs& outputs);

// Path from the GITHUB_OUTPUT environment variable, if set and non-empty.
std::optional<std::filesystem::path> GithubOutputPathFromEnvironment();

// Contract:
// - appends, never truncates; other steps write to the same file.
// - returns false and sets `error` when the file cannot be written.
bool AppendGithubOutputs(const GithubOutputs& outputs, const std::filesystem::path& output_path,
                         std::string& error);

} // namespace benchdiff::ci
