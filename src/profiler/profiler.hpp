#pragma once

#include "core/logging/logger.hpp"
#include "core/schema/profile_report.hpp"
#include "profiler/benchmark_suite.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::profiler {

inline constexpr std::string_view kUnknownFunctionPrefix = "unknown_function_";
inline constexpr std::string_view kNoSelector = "no_selector";
inline constexpr std::string_view kFailedSuffix = " (FAILED)";

// Target name, or `unknown_function_<selector>` (`unknown_function_no_selector`
// without a selector) when the target cannot name itself.
std::string ResolveTargetName(const ICallTarget& target);

// Sum of the gate counts that are present.
std::uint64_t SumGateCounts(const std::vector<ExecutionStep>& steps);

class Profiler {
public:
  explicit Profiler(core::logging::Logger& logger) : logger_(logger) {}

  // Measures one call. A failing step yields `<name> (FAILED)` with all
  // metrics zero so the comparison can never mistake it for a free call.
  core::schema::ProfileResult ProfileOne(ICallTarget& target);

  // Measures calls sequentially, one result per target, in target order.
  std::vector<core::schema::ProfileResult> ProfileTargets(const CallTargetList& targets);

  // Setup, target discovery, profiling and teardown for one suite.
  //
  // Contract:
  // - returns false and sets `error` when Setup or GetTargets fails.
  // - Teardown runs after every successful Setup.
  // - failing calls do not fail the suite; they become FAILED records.
  bool ProfileSuite(IBenchmarkSuite& suite, core::schema::ProfileReport& report,
                    std::string& error);

private:
  core::logging::Logger& logger_;
};

} // namespace benchdiff::profiler
