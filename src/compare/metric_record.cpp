#include "compare/metric_record.hpp"

namespace benchdiff::compare {

const char* ToString(MetricKind kind) {
  switch (kind) {
  case MetricKind::kGates:
    return "gates";
  case MetricKind::kDaGas:
    return "da_gas";
  case MetricKind::kL2Gas:
    return "l2_gas";
  }
  return "gates";
}

const char* DisplayName(MetricKind kind) {
  switch (kind) {
  case MetricKind::kGates:
    return "Gates";
  case MetricKind::kDaGas:
    return "DA Gas";
  case MetricKind::kL2Gas:
    return "L2 Gas";
  }
  return "Gates";
}

std::uint64_t MetricRecord::Get(MetricKind kind) const {
  switch (kind) {
  case MetricKind::kGates:
    return gate_count;
  case MetricKind::kDaGas:
    return gas_primary;
  case MetricKind::kL2Gas:
    return gas_secondary;
  }
  return 0;
}

bool MetricRecord::AllZero() const {
  return gate_count == 0U && gas_primary == 0U && gas_secondary == 0U;
}

bool MetricRecord::AnyPositive() const {
  return !AllZero();
}

MetricRecord ToMetricRecord(const core::schema::ProfileResult& result) {
  MetricRecord record;
  record.name = result.name;
  record.gate_count = result.total_gate_count;
  record.gas_primary = core::schema::TotalDaGas(result.gas);
  record.gas_secondary = core::schema::TotalL2Gas(result.gas);
  return record;
}

ResultSet ToResultSet(const core::schema::ProfileReport& report) {
  ResultSet records;
  records.reserve(report.results.size());
  for (const auto& result : report.results) {
    records.push_back(ToMetricRecord(result));
  }
  return records;
}

} // namespace benchdiff::compare
