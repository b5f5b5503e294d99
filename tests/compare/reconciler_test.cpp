#include "compare/reconciler.hpp"
#include "compare/unit_comparison.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

namespace {

using benchdiff::compare::ComparisonStatus;
using benchdiff::compare::DuplicateNamePolicy;
using benchdiff::compare::MetricRecord;
using benchdiff::compare::ReconcileResult;
using benchdiff::compare::ResultSet;

MetricRecord Record(const std::string& name, std::uint64_t gates, std::uint64_t da = 0,
                    std::uint64_t l2 = 0) {
  MetricRecord record;
  record.name = name;
  record.gate_count = gates;
  record.gas_primary = da;
  record.gas_secondary = l2;
  return record;
}

} // namespace

TEST_CASE("Excluded names report the matched rule", "[compare][reconciler]") {
  std::string reason;
  REQUIRE(benchdiff::compare::IsExcludedName("", reason));
  REQUIRE(reason == "empty name");
  REQUIRE(benchdiff::compare::IsExcludedName("unknown_function_0x1234", reason));
  REQUIRE(reason == "placeholder name");
  REQUIRE(benchdiff::compare::IsExcludedName("transfer (FAILED)", reason));
  REQUIRE(reason == "failed measurement");
  REQUIRE_FALSE(benchdiff::compare::IsExcludedName("transfer", reason));
  REQUIRE(reason.empty());
}

TEST_CASE("Reconcile takes the union of names and zero-fills missing sides",
          "[compare][reconciler]") {
  const ResultSet baseline = {Record("burn", 100), Record("mint", 200)};
  const ResultSet current = {Record("mint", 210), Record("approve", 50)};

  ReconcileResult result;
  std::string error;
  REQUIRE(benchdiff::compare::Reconcile(baseline, current, DuplicateNamePolicy::kLastWriteWins,
                                        result, error));
  REQUIRE(result.entries.size() == 3U);

  for (const auto& entry : result.entries) {
    REQUIRE(entry.baseline.name == entry.name);
    REQUIRE(entry.current.name == entry.name);
    if (entry.name == "burn") {
      REQUIRE(entry.current.AllZero());
    } else if (entry.name == "approve") {
      REQUIRE(entry.baseline.AllZero());
    }
  }
}

TEST_CASE("Reconcile filters excluded records on both sides", "[compare][reconciler]") {
  const ResultSet baseline = {Record("", 1), Record("mint", 10)};
  const ResultSet current = {Record("unknown_function_0xdead", 1), Record("mint (FAILED)", 0),
                             Record("mint", 10)};

  ReconcileResult result;
  std::string error;
  REQUIRE(benchdiff::compare::Reconcile(baseline, current, DuplicateNamePolicy::kLastWriteWins,
                                        result, error));
  REQUIRE(result.entries.size() == 1U);
  REQUIRE(result.entries.front().name == "mint");
  REQUIRE(result.skipped.size() == 3U);
}

TEST_CASE("Duplicate names keep the later record by default", "[compare][reconciler]") {
  const ResultSet baseline = {Record("mint", 10), Record("mint", 20)};
  const ResultSet current = {Record("mint", 20)};

  ReconcileResult result;
  std::string error;
  REQUIRE(benchdiff::compare::Reconcile(baseline, current, DuplicateNamePolicy::kLastWriteWins,
                                        result, error));
  REQUIRE(result.entries.size() == 1U);
  REQUIRE(result.entries.front().baseline.gate_count == 20U);
  REQUIRE(result.duplicates.size() == 1U);
  REQUIRE(result.duplicates.front().side == benchdiff::compare::RunSide::kBaseline);
}

TEST_CASE("Duplicate names fail under the reject policy", "[compare][reconciler]") {
  const ResultSet baseline = {Record("mint", 10)};
  const ResultSet current = {Record("mint", 10), Record("mint", 11)};

  ReconcileResult result;
  std::string error;
  REQUIRE_FALSE(benchdiff::compare::Reconcile(baseline, current, DuplicateNamePolicy::kReject,
                                              result, error));
  REQUIRE(error == "duplicate function name 'mint' in current results");
}

TEST_CASE("Duplicate name policy parses its stable names", "[compare][reconciler]") {
  DuplicateNamePolicy policy = DuplicateNamePolicy::kLastWriteWins;
  REQUIRE(benchdiff::compare::ParseDuplicateNamePolicy("reject", policy));
  REQUIRE(policy == DuplicateNamePolicy::kReject);
  REQUIRE(benchdiff::compare::ParseDuplicateNamePolicy("last_wins", policy));
  REQUIRE(policy == DuplicateNamePolicy::kLastWriteWins);
  REQUIRE_FALSE(benchdiff::compare::ParseDuplicateNamePolicy("first_wins", policy));
}

TEST_CASE("CompareUnit sorts entries by byte order and counts statuses",
          "[compare][unit_comparison]") {
  const ResultSet baseline = {Record("transfer", 1'000, 10, 10), Record("Burn", 500, 5, 5),
                              Record("approve", 300, 3, 3)};
  const ResultSet current = {Record("transfer", 1'200, 10, 10), Record("approve", 300, 3, 3),
                             Record("mint", 800, 8, 8)};

  benchdiff::compare::UnitComparison comparison;
  std::string error;
  REQUIRE(benchdiff::compare::CompareUnit("Token", baseline, current, {}, comparison, error));
  REQUIRE(comparison.unit_name == "Token");
  REQUIRE(comparison.entries.size() == 4U);
  REQUIRE(comparison.entries[0].name == "Burn");
  REQUIRE(comparison.entries[1].name == "approve");
  REQUIRE(comparison.entries[2].name == "mint");
  REQUIRE(comparison.entries[3].name == "transfer");

  REQUIRE(comparison.entries[0].status == ComparisonStatus::kRemoved);
  REQUIRE(comparison.entries[1].status == ComparisonStatus::kUnchanged);
  REQUIRE(comparison.entries[2].status == ComparisonStatus::kNew);
  REQUIRE(comparison.entries[3].status == ComparisonStatus::kRegression);

  REQUIRE(comparison.counts.removed_count == 1U);
  REQUIRE(comparison.counts.unchanged_count == 1U);
  REQUIRE(comparison.counts.new_count == 1U);
  REQUIRE(comparison.counts.regression_count == 1U);
  REQUIRE(comparison.counts.Total() == 4U);
}

TEST_CASE("CompareUnit with nothing comparable succeeds with no entries",
          "[compare][unit_comparison]") {
  const ResultSet baseline = {Record("unknown_function_1", 10)};
  benchdiff::compare::UnitComparison comparison;
  std::string error;
  REQUIRE(benchdiff::compare::CompareUnit("Empty", baseline, {}, {}, comparison, error));
  REQUIRE(comparison.entries.empty());
  REQUIRE(comparison.skipped.size() == 1U);
}
