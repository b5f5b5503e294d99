#pragma once

#include "core/schema/profile_report.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace benchdiff::compare {

// The three compared metric dimensions, in report column order.
enum class MetricKind {
  kGates = 0,
  kDaGas = 1,
  kL2Gas = 2,
};

inline constexpr std::array<MetricKind, 3> kAllMetricKinds = {
    MetricKind::kGates,
    MetricKind::kDaGas,
    MetricKind::kL2Gas,
};

const char* ToString(MetricKind kind);

// Column heading used in rendered tables.
const char* DisplayName(MetricKind kind);

// Measured output for one benchmarked function in one run. Every metric is
// always present; an unmeasured metric is zero.
struct MetricRecord {
  std::string name;
  std::uint64_t gate_count = 0;
  std::uint64_t gas_primary = 0;
  std::uint64_t gas_secondary = 0;

  std::uint64_t Get(MetricKind kind) const;
  bool AllZero() const;
  bool AnyPositive() const;
};

// Records of one unit in one run, in producer order. Names are not guaranteed
// unique here; reconciliation decides what a duplicate means.
using ResultSet = std::vector<MetricRecord>;

// Gas dimensions are the sums of execution and teardown limits.
MetricRecord ToMetricRecord(const core::schema::ProfileResult& result);
ResultSet ToResultSet(const core::schema::ProfileReport& report);

} // namespace benchdiff::compare
