#include "profiler/profiler.hpp"

#include <utility>

namespace benchdiff::profiler {

namespace {

core::schema::ProfileResult FailedResult(const std::string& name) {
  core::schema::ProfileResult result;
  result.name = name + std::string(kFailedSuffix);
  return result;
}

} // namespace

std::string ResolveTargetName(const ICallTarget& target) {
  std::string name = target.Name();
  if (!name.empty()) {
    return name;
  }
  const std::string selector = target.Selector();
  return std::string(kUnknownFunctionPrefix) +
         (selector.empty() ? std::string(kNoSelector) : selector);
}

std::uint64_t SumGateCounts(const std::vector<ExecutionStep>& steps) {
  std::uint64_t total = 0;
  for (const auto& step : steps) {
    if (step.gate_count.has_value()) {
      total += step.gate_count.value();
    }
  }
  return total;
}

core::schema::ProfileResult Profiler::ProfileOne(ICallTarget& target) {
  const std::string name = ResolveTargetName(target);
  logger_.Info("profiling function", {{"name", name}});

  std::string error;
  core::schema::GasLimits gas;
  if (!target.EstimateGas(gas, error)) {
    logger_.Error("gas estimation failed", {{"name", name}, {"error", error}});
    return FailedResult(name);
  }

  std::vector<ExecutionStep> steps;
  if (!target.Profile(steps, error)) {
    logger_.Error("profiling failed", {{"name", name}, {"error", error}});
    return FailedResult(name);
  }

  if (!target.SendAndWait(error)) {
    logger_.Error("send failed", {{"name", name}, {"error", error}});
    return FailedResult(name);
  }

  core::schema::ProfileResult result;
  result.name = name;
  result.total_gate_count = SumGateCounts(steps);
  result.gate_counts.reserve(steps.size());
  for (const auto& step : steps) {
    result.gate_counts.push_back({
        .circuit_name = step.function_name,
        .gate_count = step.gate_count.value_or(0),
    });
  }
  result.gas = gas;

  logger_.Info("function profiled", {{"name", name},
                                     {"gates", std::to_string(result.total_gate_count)},
                                     {"da_gas", std::to_string(gas.gas_limits.da_gas)},
                                     {"l2_gas", std::to_string(gas.gas_limits.l2_gas)}});
  return result;
}

std::vector<core::schema::ProfileResult> Profiler::ProfileTargets(const CallTargetList& targets) {
  std::vector<core::schema::ProfileResult> results;
  results.reserve(targets.size());
  for (const auto& target : targets) {
    results.push_back(ProfileOne(*target));
  }
  return results;
}

bool Profiler::ProfileSuite(IBenchmarkSuite& suite, core::schema::ProfileReport& report,
                            std::string& error) {
  report = core::schema::ProfileReport{};

  BenchmarkContext context;
  if (!suite.Setup(context, error)) {
    error = "benchmark setup failed: " + error;
    return false;
  }

  CallTargetList targets;
  if (!suite.GetTargets(context, targets, error)) {
    error = "failed to get benchmark targets: " + error;
    suite.Teardown(context);
    return false;
  }

  if (targets.empty()) {
    logger_.Warn("no benchmark targets returned; writing empty report");
  } else {
    logger_.Info("profiling targets", {{"count", std::to_string(targets.size())}});
    report.results = ProfileTargets(targets);
  }

  suite.Teardown(context);
  return true;
}

} // namespace benchdiff::profiler
