#include "profiler/recorded_call_suite.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <utility>

namespace benchdiff::profiler {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kContextDefinitionKey = "definition";

bool ReadOptionalString(const JsonValue& object, std::string_view key, std::string_view path,
                        std::optional<std::string>& out, std::string& error) {
  out.reset();
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    return true;
  }
  if (!field->IsString()) {
    error = "'" + std::string(path) + "." + std::string(key) + "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadCount(const JsonValue& object, std::string_view key, std::string_view path,
               std::uint64_t& out, std::string& error) {
  out = 0;
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    return true;
  }
  if (!core::json::TryGetNonNegativeInteger(*field, out)) {
    error = "'" + std::string(path) + "." + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  return true;
}

bool ParseGasVector(const JsonValue& parent, std::string_view key, std::string_view path,
                    core::schema::GasVector& gas, std::string& error) {
  const JsonValue* object = core::json::FindField(parent, key);
  if (object == nullptr) {
    return true;
  }
  const std::string object_path = std::string(path) + "." + std::string(key);
  if (!object->IsObject()) {
    error = "'" + object_path + "' must be an object";
    return false;
  }
  return ReadCount(*object, "da_gas", object_path, gas.da_gas, error) &&
         ReadCount(*object, "l2_gas", object_path, gas.l2_gas, error);
}

bool ParseSteps(const JsonValue& call, const std::string& path, std::vector<ExecutionStep>& steps,
                std::string& error) {
  const JsonValue* field = core::json::FindField(call, "steps");
  if (field == nullptr) {
    return true;
  }
  if (!field->IsArray()) {
    error = "'" + path + ".steps' must be an array";
    return false;
  }

  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    const std::string step_path = path + ".steps[" + std::to_string(i) + "]";
    if (!item.IsObject()) {
      error = "'" + step_path + "' must be an object";
      return false;
    }

    ExecutionStep step;
    std::optional<std::string> function_name;
    if (!ReadOptionalString(item, "function", step_path, function_name, error)) {
      return false;
    }
    step.function_name = function_name.value_or("");

    if (core::json::FindField(item, "gate_count") != nullptr) {
      std::uint64_t gate_count = 0;
      if (!ReadCount(item, "gate_count", step_path, gate_count, error)) {
        return false;
      }
      step.gate_count = gate_count;
    }
    steps.push_back(std::move(step));
  }
  return true;
}

bool ParseCall(const JsonValue& item, std::size_t index, RecordedCall& call, std::string& error) {
  const std::string path = "calls[" + std::to_string(index) + "]";
  if (!item.IsObject()) {
    error = "'" + path + "' must be an object";
    return false;
  }

  call = RecordedCall{};
  std::optional<std::string> text;
  if (!ReadOptionalString(item, "name", path, text, error)) {
    return false;
  }
  call.name = text.value_or("");
  if (!ReadOptionalString(item, "selector", path, text, error)) {
    return false;
  }
  call.selector = text.value_or("");

  if (!ParseSteps(item, path, call.steps, error)) {
    return false;
  }

  if (const JsonValue* gas = core::json::FindField(item, "gas"); gas != nullptr) {
    if (!gas->IsObject()) {
      error = "'" + path + ".gas' must be an object";
      return false;
    }
    const std::string gas_path = path + ".gas";
    if (!ParseGasVector(*gas, "gas_limits", gas_path, call.gas.gas_limits, error) ||
        !ParseGasVector(*gas, "teardown_gas_limits", gas_path, call.gas.teardown_gas_limits,
                        error)) {
      return false;
    }
  }

  if (!ReadOptionalString(item, "error", path, call.error, error)) {
    return false;
  }
  if (!ReadOptionalString(item, "fail_stage", path, text, error)) {
    return false;
  }
  if (text.has_value() && !ParseFailStage(text.value(), call.fail_stage)) {
    error = "'" + path + ".fail_stage' must be one of estimate_gas, profile, send_and_wait";
    return false;
  }
  return true;
}

class RecordedCallTarget final : public ICallTarget {
public:
  explicit RecordedCallTarget(RecordedCall call) : call_(std::move(call)) {}

  std::string Name() const override {
    return call_.name;
  }

  std::string Selector() const override {
    return call_.selector;
  }

  bool EstimateGas(core::schema::GasLimits& gas, std::string& error) override {
    if (FailsAt(FailStage::kEstimateGas, error)) {
      return false;
    }
    gas = call_.gas;
    return true;
  }

  bool Profile(std::vector<ExecutionStep>& steps, std::string& error) override {
    if (FailsAt(FailStage::kProfile, error)) {
      return false;
    }
    steps = call_.steps;
    return true;
  }

  bool SendAndWait(std::string& error) override {
    return !FailsAt(FailStage::kSendAndWait, error);
  }

private:
  bool FailsAt(FailStage stage, std::string& error) const {
    if (!call_.error.has_value() || call_.fail_stage != stage) {
      return false;
    }
    error = call_.error.value();
    return true;
  }

  RecordedCall call_;
};

} // namespace

const char* ToString(FailStage stage) {
  switch (stage) {
  case FailStage::kEstimateGas:
    return "estimate_gas";
  case FailStage::kProfile:
    return "profile";
  case FailStage::kSendAndWait:
    return "send_and_wait";
  }
  return "estimate_gas";
}

bool ParseFailStage(std::string_view text, FailStage& stage) {
  if (text == "estimate_gas") {
    stage = FailStage::kEstimateGas;
    return true;
  }
  if (text == "profile") {
    stage = FailStage::kProfile;
    return true;
  }
  if (text == "send_and_wait") {
    stage = FailStage::kSendAndWait;
    return true;
  }
  return false;
}

bool ParseRecordedSuiteDefinition(std::string_view text, RecordedSuiteDefinition& definition,
                                  std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "benchmark definition root must be an object";
    return false;
  }

  RecordedSuiteDefinition parsed;
  if (const JsonValue* setup = core::json::FindField(root, "setup"); setup != nullptr) {
    if (!setup->IsObject()) {
      error = "'setup' must be an object";
      return false;
    }
    if (!ReadOptionalString(*setup, "error", "setup", parsed.setup_error, error)) {
      return false;
    }
  }

  const JsonValue* calls = core::json::FindField(root, "calls");
  if (calls == nullptr || !calls->IsArray()) {
    error = "benchmark definition requires a 'calls' array";
    return false;
  }
  for (std::size_t i = 0; i < calls->array_value.size(); ++i) {
    RecordedCall call;
    if (!ParseCall(calls->array_value[i], i, call, error)) {
      return false;
    }
    parsed.calls.push_back(std::move(call));
  }

  definition = std::move(parsed);
  return true;
}

RecordedCallSuite::RecordedCallSuite(std::filesystem::path definition_path,
                                     RecordedSuiteDefinition definition)
    : definition_path_(std::move(definition_path)), definition_(std::move(definition)) {}

bool RecordedCallSuite::Load(const std::filesystem::path& definition_path,
                             std::unique_ptr<IBenchmarkSuite>& suite, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(definition_path, text, error)) {
    return false;
  }

  RecordedSuiteDefinition definition;
  if (!ParseRecordedSuiteDefinition(text, definition, error)) {
    error = "invalid benchmark definition '" + definition_path.string() + "': " + error;
    return false;
  }

  suite = std::make_unique<RecordedCallSuite>(definition_path, std::move(definition));
  return true;
}

bool RecordedCallSuite::Setup(BenchmarkContext& context, std::string& error) {
  if (definition_.setup_error.has_value()) {
    error = definition_.setup_error.value();
    return false;
  }
  context[std::string(kContextDefinitionKey)] = definition_path_.string();
  return true;
}

bool RecordedCallSuite::GetTargets(const BenchmarkContext& context, CallTargetList& targets,
                                   std::string& error) {
  if (context.find(std::string(kContextDefinitionKey)) == context.end()) {
    error = "benchmark context is missing; Setup must run first";
    return false;
  }

  targets.clear();
  targets.reserve(definition_.calls.size());
  for (const auto& call : definition_.calls) {
    targets.push_back(std::make_unique<RecordedCallTarget>(call));
  }
  return true;
}

void RecordedCallSuite::Teardown(BenchmarkContext& context) {
  context.clear();
}

} // namespace benchdiff::profiler
