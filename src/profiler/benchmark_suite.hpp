#pragma once

#include "core/schema/profile_report.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace benchdiff::profiler {

// Opaque values produced by suite setup and handed back to target discovery
// and teardown.
using BenchmarkContext = std::map<std::string, std::string>;

// One execution step reported by profiling a call. Steps without a gate count
// are kept in the breakdown but do not contribute to the total.
struct ExecutionStep {
  std::string function_name;
  std::optional<std::uint64_t> gate_count;
};

// One contract function call to measure.
//
// Contract:
// - each operation is a single blocking request/response.
// - the profiler calls EstimateGas, Profile and SendAndWait in that order and
//   stops at the first failure.
class ICallTarget {
public:
  virtual ~ICallTarget() = default;

  // User-facing function name; may be empty when the call cannot name itself.
  virtual std::string Name() const = 0;

  // Function selector; may be empty.
  virtual std::string Selector() const = 0;

  virtual bool EstimateGas(core::schema::GasLimits& gas, std::string& error) = 0;

  virtual bool Profile(std::vector<ExecutionStep>& steps, std::string& error) = 0;

  // Submits the call and waits for it to be mined so later calls observe its
  // state changes.
  virtual bool SendAndWait(std::string& error) = 0;
};

using CallTargetList = std::vector<std::unique_ptr<ICallTarget>>;

// A benchmark definition for one unit.
class IBenchmarkSuite {
public:
  virtual ~IBenchmarkSuite() = default;

  virtual bool Setup(BenchmarkContext& context, std::string& error) = 0;

  virtual bool GetTargets(const BenchmarkContext& context, CallTargetList& targets,
                          std::string& error) = 0;

  // Runs after a successful Setup, whether or not profiling succeeded.
  virtual void Teardown(BenchmarkContext& context) = 0;
};

} // namespace benchdiff::profiler
