#include "core/schema/profile_report.hpp"

#include "core/json_utils.hpp"

#include <limits>
#include <map>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::core::schema {

namespace {

// Name-keyed summary that keeps first-seen order; a repeated name updates the
// value in place.
class OrderedSummary {
public:
  void Set(const std::string& name, std::uint64_t value) {
    const auto it = values_.find(name);
    if (it == values_.end()) {
      order_.push_back(name);
      values_.emplace(name, value);
      return;
    }
    it->second = value;
  }

  void Write(std::ostream& out, std::string_view key) const {
    out << "  \"" << key << "\": {";
    if (order_.empty()) {
      out << "}";
      return;
    }
    out << "\n";
    for (std::size_t i = 0; i < order_.size(); ++i) {
      out << "    " << QuoteJson(order_[i]) << ": " << values_.at(order_[i]);
      out << (i + 1U < order_.size() ? ",\n" : "\n");
    }
    out << "  }";
  }

private:
  std::vector<std::string> order_;
  std::map<std::string, std::uint64_t> values_;
};

std::uint64_t SaturatingAdd(std::uint64_t a, std::uint64_t b) {
  if (a > std::numeric_limits<std::uint64_t>::max() - b) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return a + b;
}

} // namespace

std::uint64_t TotalDaGas(const GasLimits& gas) {
  return SaturatingAdd(gas.gas_limits.da_gas, gas.teardown_gas_limits.da_gas);
}

std::uint64_t TotalL2Gas(const GasLimits& gas) {
  return SaturatingAdd(gas.gas_limits.l2_gas, gas.teardown_gas_limits.l2_gas);
}

std::string ToJson(const GasVector& gas) {
  std::ostringstream out;
  out << "{"
      << "\"daGas\":" << gas.da_gas << ","
      << "\"l2Gas\":" << gas.l2_gas << "}";
  return out.str();
}

std::string ToJson(const GasLimits& gas) {
  std::ostringstream out;
  out << "{"
      << "\"gasLimits\":" << ToJson(gas.gas_limits) << ","
      << "\"teardownGasLimits\":" << ToJson(gas.teardown_gas_limits) << "}";
  return out.str();
}

std::string ToJson(const GateCount& gate_count) {
  std::ostringstream out;
  out << "{"
      << "\"circuitName\":" << QuoteJson(gate_count.circuit_name) << ","
      << "\"gateCount\":" << gate_count.gate_count << "}";
  return out.str();
}

std::string ToJson(const ProfileResult& result) {
  std::ostringstream out;
  out << "{"
      << "\"name\":" << QuoteJson(result.name) << ","
      << "\"totalGateCount\":" << result.total_gate_count << ","
      << "\"gateCounts\":[";
  for (std::size_t i = 0; i < result.gate_counts.size(); ++i) {
    if (i != 0U) {
      out << ",";
    }
    out << ToJson(result.gate_counts[i]);
  }
  out << "],"
      << "\"gas\":" << ToJson(result.gas) << "}";
  return out.str();
}

std::string ToJson(const ProfileReport& report) {
  OrderedSummary gate_summary;
  OrderedSummary gas_summary;
  for (const auto& result : report.results) {
    gate_summary.Set(result.name, result.total_gate_count);
    gas_summary.Set(result.name, TotalDaGas(result.gas) + TotalL2Gas(result.gas));
  }

  std::ostringstream out;
  out << "{\n";
  gate_summary.Write(out, "summary");
  out << ",\n"
      << "  \"results\": [";
  if (report.results.empty()) {
    out << "]";
  } else {
    out << "\n";
    for (std::size_t i = 0; i < report.results.size(); ++i) {
      out << "    " << ToJson(report.results[i]);
      out << (i + 1U < report.results.size() ? ",\n" : "\n");
    }
    out << "  ]";
  }
  out << ",\n";
  gas_summary.Write(out, "gasSummary");
  out << "\n}\n";
  return out.str();
}

} // namespace benchdiff::core::schema
