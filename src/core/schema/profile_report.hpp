#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace benchdiff::core::schema {

// Largest metric value accepted from a result file. JSON numbers are held as
// doubles, so anything above 2^53 has already lost precision.
inline constexpr std::uint64_t kMaxMetricValue = std::uint64_t{1} << 53;

// One gas dimension pair as reported by gas estimation.
struct GasVector {
  std::uint64_t da_gas = 0;
  std::uint64_t l2_gas = 0;
};

// Execution limits and teardown limits are reported separately and summed
// before comparison.
struct GasLimits {
  GasVector gas_limits;
  GasVector teardown_gas_limits;
};

// Gate count for one circuit/execution step of a profiled call.
struct GateCount {
  std::string circuit_name;
  std::uint64_t gate_count = 0;
};

// Measured output of profiling one contract function call.
struct ProfileResult {
  std::string name;
  std::uint64_t total_gate_count = 0;
  std::vector<GateCount> gate_counts;
  GasLimits gas;
};

// Contents of one `<unit><suffix>.benchmark.json` file. The `summary` and
// `gasSummary` maps of the file format are derived from `results` on write
// and ignored on load.
struct ProfileReport {
  std::vector<ProfileResult> results;
};

// Execution plus teardown. Saturates at the uint64 maximum instead of wrapping.
std::uint64_t TotalDaGas(const GasLimits& gas);
std::uint64_t TotalL2Gas(const GasLimits& gas);

// Compact single-line serializers with canonical key order.
std::string ToJson(const GasVector& gas);
std::string ToJson(const GasLimits& gas);
std::string ToJson(const GateCount& gate_count);
std::string ToJson(const ProfileResult& result);

// Full result-file document, pretty-printed with one result per line so
// reviewers can diff result files in pull requests.
std::string ToJson(const ProfileReport& report);

} // namespace benchdiff::core::schema
