#pragma once

#include "compare/comparison_entry.hpp"
#include "compare/metric_record.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace benchdiff::compare {

enum class RunSide {
  kBaseline,
  kCurrent,
};

const char* ToString(RunSide side);

// What to do when one run reports the same function name twice.
enum class DuplicateNamePolicy {
  kLastWriteWins,
  kReject,
};

const char* ToString(DuplicateNamePolicy policy);
bool ParseDuplicateNamePolicy(std::string_view text, DuplicateNamePolicy& policy);

// A record left out of comparison because its name is not a real measurement.
struct SkippedRecord {
  RunSide side = RunSide::kBaseline;
  std::string name;
  std::string reason;
};

// A name seen more than once within one run.
struct DuplicateRecord {
  RunSide side = RunSide::kBaseline;
  std::string name;
};

struct ReconcileResult {
  std::vector<ComparisonEntry> entries;
  std::vector<SkippedRecord> skipped;
  std::vector<DuplicateRecord> duplicates;
};

// Returns true when `name` must not be compared: empty, an auto-generated
// `unknown_function...` placeholder, or a `(FAILED)` measurement. `reason`
// names the matched rule.
bool IsExcludedName(std::string_view name, std::string& reason);

// Builds one entry per surviving function name across both runs. A side that
// lacks the name gets an all-zero record carrying the name. Deltas and status
// are left at their defaults.
//
// Contract:
// - pure function of its inputs; no logging.
// - excluded records are listed in `result.skipped`.
// - duplicates are listed in `result.duplicates`; with kLastWriteWins the
//   later record is kept, with kReject the call returns false and sets `error`.
// - both inputs empty after filtering yields an empty entry list and true.
bool Reconcile(const ResultSet& baseline, const ResultSet& current, DuplicateNamePolicy policy,
               ReconcileResult& result, std::string& error);

} // namespace benchdiff::compare
