#include "results/profile_report_io.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

namespace benchdiff::results {

namespace {

using JsonValue = core::json::Value;
using core::schema::GasLimits;
using core::schema::GasVector;
using core::schema::GateCount;
using core::schema::ProfileReport;
using core::schema::ProfileResult;

std::string FieldPath(std::string_view parent, std::string_view key) {
  return std::string(parent) + "." + std::string(key);
}

// Absent -> 0. Present but not a non-negative integer -> error.
bool ReadOptionalCount(const JsonValue& object, std::string_view key, std::string_view parent,
                       std::uint64_t& value, std::string& error) {
  value = 0;
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    return true;
  }
  if (!core::json::TryGetNonNegativeInteger(*field, value)) {
    error = "field '" + FieldPath(parent, key) + "' must be a non-negative integer";
    return false;
  }
  if (value > core::schema::kMaxMetricValue) {
    error = "field '" + FieldPath(parent, key) + "' exceeds the maximum metric value 2^53";
    value = 0;
    return false;
  }
  return true;
}

bool CheckGasTotal(std::uint64_t total, std::string_view parent, std::string_view dimension,
                   std::string& error) {
  if (total > core::schema::kMaxMetricValue) {
    error = "summed " + std::string(dimension) + " of '" + std::string(parent) +
            "' exceeds the maximum metric value 2^53";
    return false;
  }
  return true;
}

// Absent -> nullptr with success; present non-object -> error.
bool FindOptionalObject(const JsonValue& object, std::string_view key, std::string_view parent,
                        const JsonValue*& out, std::string& error) {
  out = core::json::FindField(object, key);
  if (out != nullptr && !out->IsObject()) {
    error = "field '" + FieldPath(parent, key) + "' must be an object, got " +
            core::json::ToString(out->type);
    return false;
  }
  return true;
}

bool ParseGasVector(const JsonValue& parent_object, std::string_view key, std::string_view parent,
                    GasVector& gas, std::string& error) {
  gas = GasVector{};
  const JsonValue* object = nullptr;
  if (!FindOptionalObject(parent_object, key, parent, object, error)) {
    return false;
  }
  if (object == nullptr) {
    return true;
  }

  const std::string path = FieldPath(parent, key);
  return ReadOptionalCount(*object, "daGas", path, gas.da_gas, error) &&
         ReadOptionalCount(*object, "l2Gas", path, gas.l2_gas, error);
}

bool ParseGas(const JsonValue& result_object, std::string_view parent, GasLimits& gas,
              std::string& error) {
  gas = GasLimits{};
  const JsonValue* gas_object = nullptr;
  if (!FindOptionalObject(result_object, "gas", parent, gas_object, error)) {
    return false;
  }
  if (gas_object == nullptr) {
    return true;
  }

  const std::string path = FieldPath(parent, "gas");
  return ParseGasVector(*gas_object, "gasLimits", path, gas.gas_limits, error) &&
         ParseGasVector(*gas_object, "teardownGasLimits", path, gas.teardown_gas_limits, error) &&
         CheckGasTotal(core::schema::TotalDaGas(gas), path, "daGas", error) &&
         CheckGasTotal(core::schema::TotalL2Gas(gas), path, "l2Gas", error);
}

bool ParseGateCounts(const JsonValue& result_object, std::string_view parent,
                     std::vector<GateCount>& gate_counts, std::string& error) {
  gate_counts.clear();
  const JsonValue* field = core::json::FindField(result_object, "gateCounts");
  if (field == nullptr) {
    return true;
  }
  const std::string path = FieldPath(parent, "gateCounts");
  if (!field->IsArray()) {
    error = "field '" + path + "' must be an array";
    return false;
  }

  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    const std::string item_path = path + "[" + std::to_string(i) + "]";
    if (!item.IsObject()) {
      error = "'" + item_path + "' must be an object";
      return false;
    }

    GateCount gate_count;
    if (const JsonValue* circuit = core::json::FindField(item, "circuitName"); circuit != nullptr) {
      if (!circuit->IsString()) {
        error = "field '" + FieldPath(item_path, "circuitName") + "' must be a string";
        return false;
      }
      gate_count.circuit_name = circuit->string_value;
    }
    if (!ReadOptionalCount(item, "gateCount", item_path, gate_count.gate_count, error)) {
      return false;
    }
    gate_counts.push_back(std::move(gate_count));
  }
  return true;
}

bool ParseResult(const JsonValue& item, std::size_t index, ProfileResult& result,
                 std::string& error) {
  const std::string path = "results[" + std::to_string(index) + "]";
  if (!item.IsObject()) {
    error = "'" + path + "' must be an object, got " + core::json::ToString(item.type);
    return false;
  }

  result = ProfileResult{};
  if (const JsonValue* name = core::json::FindField(item, "name"); name != nullptr) {
    if (!name->IsString()) {
      error = "field '" + FieldPath(path, "name") + "' must be a string";
      return false;
    }
    result.name = name->string_value;
  }

  return ReadOptionalCount(item, "totalGateCount", path, result.total_gate_count, error) &&
         ParseGateCounts(item, path, result.gate_counts, error) &&
         ParseGas(item, path, result.gas, error);
}

} // namespace

const char* ToString(LoadStatus status) {
  switch (status) {
  case LoadStatus::kLoaded:
    return "loaded";
  case LoadStatus::kUnreadable:
    return "unreadable";
  case LoadStatus::kMalformed:
    return "malformed";
  case LoadStatus::kInvalidStructure:
    return "invalid_structure";
  }
  return "unreadable";
}

LoadStatus LoadProfileReport(const std::filesystem::path& path, ProfileReport& report,
                             std::string& error) {
  report = ProfileReport{};

  std::string contents;
  if (!core::ReadTextFile(path, contents, error)) {
    return LoadStatus::kUnreadable;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(contents, root, parse_error)) {
    error = "invalid JSON in " + path.string() + ": " + parse_error;
    return LoadStatus::kMalformed;
  }

  if (!root.IsObject()) {
    error = "root must be an object, got " + std::string(core::json::ToString(root.type));
    return LoadStatus::kInvalidStructure;
  }

  const JsonValue* results = core::json::FindField(root, "results");
  if (results == nullptr) {
    error = "missing required field 'results'";
    return LoadStatus::kInvalidStructure;
  }
  if (!results->IsArray()) {
    error = "field 'results' must be an array, got " +
            std::string(core::json::ToString(results->type));
    return LoadStatus::kInvalidStructure;
  }

  ProfileReport loaded;
  loaded.results.reserve(results->array_value.size());
  for (std::size_t i = 0; i < results->array_value.size(); ++i) {
    ProfileResult result;
    if (!ParseResult(results->array_value[i], i, result, error)) {
      return LoadStatus::kInvalidStructure;
    }
    loaded.results.push_back(std::move(result));
  }

  report = std::move(loaded);
  return LoadStatus::kLoaded;
}

LoadStatus LoadResultSet(const std::filesystem::path& path, compare::ResultSet& result_set,
                         std::string& error) {
  result_set.clear();
  ProfileReport report;
  const LoadStatus status = LoadProfileReport(path, report, error);
  if (status == LoadStatus::kLoaded) {
    result_set = compare::ToResultSet(report);
  }
  return status;
}

bool WriteProfileReportJson(const ProfileReport& report, const std::filesystem::path& output_path,
                            std::string& error) {
  return core::WriteTextFileAtomic(output_path, core::schema::ToJson(report), error);
}

} // namespace benchdiff::results
