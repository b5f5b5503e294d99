#pragma once

#include "profiler/benchmark_suite.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::profiler {

// Which call operation a recorded failure is replayed at.
enum class FailStage {
  kEstimateGas,
  kProfile,
  kSendAndWait,
};

const char* ToString(FailStage stage);
bool ParseFailStage(std::string_view text, FailStage& stage);

// One recorded call as it appears in a definition file.
struct RecordedCall {
  std::string name;
  std::string selector;
  std::vector<ExecutionStep> steps;
  core::schema::GasLimits gas;
  std::optional<std::string> error;
  FailStage fail_stage = FailStage::kEstimateGas;
};

struct RecordedSuiteDefinition {
  std::optional<std::string> setup_error;
  std::vector<RecordedCall> calls;
};

// Parses a recorded-call definition:
//   { "setup": {"error": "..."},
//     "calls": [ { "name": "...", "selector": "...",
//                  "steps": [{"function": "...", "gate_count": N}],
//                  "gas": {"gas_limits": {"da_gas": N, "l2_gas": N},
//                          "teardown_gas_limits": {...}},
//                  "error": "...", "fail_stage": "profile" } ] }
// Every field except `calls` is optional.
bool ParseRecordedSuiteDefinition(std::string_view text, RecordedSuiteDefinition& definition,
                                  std::string& error);

// Deterministic suite replaying recorded measurements, used where no live
// network is available (CI dry runs, tests).
class RecordedCallSuite final : public IBenchmarkSuite {
public:
  RecordedCallSuite(std::filesystem::path definition_path, RecordedSuiteDefinition definition);

  static bool Load(const std::filesystem::path& definition_path,
                   std::unique_ptr<IBenchmarkSuite>& suite, std::string& error);

  bool Setup(BenchmarkContext& context, std::string& error) override;
  bool GetTargets(const BenchmarkContext& context, CallTargetList& targets,
                  std::string& error) override;
  void Teardown(BenchmarkContext& context) override;

private:
  std::filesystem::path definition_path_;
  RecordedSuiteDefinition definition_;
};

} // namespace benchdiff::profiler
