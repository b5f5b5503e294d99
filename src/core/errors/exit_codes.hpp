#pragma once

namespace benchdiff::core::errors {

// Stable process-exit contract for CI wrappers.
//
// 0/1/2 keep their conventional meanings (success, command failure, usage).
// The remaining values let a workflow distinguish a broken manifest from a
// comparison that ran and found regressions.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kRegressionDetected = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace benchdiff::core::errors
