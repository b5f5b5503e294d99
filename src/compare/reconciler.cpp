#include "compare/reconciler.hpp"

#include <map>
#include <set>

namespace benchdiff::compare {

namespace {

constexpr std::string_view kUnknownFunctionPrefix = "unknown_function";
constexpr std::string_view kFailedMarker = "(FAILED)";

MetricRecord ZeroRecord(const std::string& name) {
  MetricRecord record;
  record.name = name;
  return record;
}

// Collapses one run into name -> record. Returns false only for a rejected
// duplicate.
bool IndexSide(const ResultSet& records, RunSide side, DuplicateNamePolicy policy,
               std::map<std::string, MetricRecord>& indexed, ReconcileResult& result,
               std::string& error) {
  for (const auto& record : records) {
    std::string reason;
    if (IsExcludedName(record.name, reason)) {
      result.skipped.push_back({.side = side, .name = record.name, .reason = reason});
      continue;
    }

    const auto [it, inserted] = indexed.insert({record.name, record});
    if (inserted) {
      continue;
    }

    result.duplicates.push_back({.side = side, .name = record.name});
    if (policy == DuplicateNamePolicy::kReject) {
      error = "duplicate function name '" + record.name + "' in " + ToString(side) + " results";
      return false;
    }
    it->second = record;
  }
  return true;
}

} // namespace

const char* ToString(RunSide side) {
  switch (side) {
  case RunSide::kBaseline:
    return "baseline";
  case RunSide::kCurrent:
    return "current";
  }
  return "baseline";
}

const char* ToString(DuplicateNamePolicy policy) {
  switch (policy) {
  case DuplicateNamePolicy::kLastWriteWins:
    return "last_wins";
  case DuplicateNamePolicy::kReject:
    return "reject";
  }
  return "last_wins";
}

bool ParseDuplicateNamePolicy(std::string_view text, DuplicateNamePolicy& policy) {
  if (text == "last_wins") {
    policy = DuplicateNamePolicy::kLastWriteWins;
    return true;
  }
  if (text == "reject") {
    policy = DuplicateNamePolicy::kReject;
    return true;
  }
  return false;
}

bool IsExcludedName(std::string_view name, std::string& reason) {
  if (name.empty()) {
    reason = "empty name";
    return true;
  }
  if (name.substr(0, kUnknownFunctionPrefix.size()) == kUnknownFunctionPrefix) {
    reason = "placeholder name";
    return true;
  }
  if (name.find(kFailedMarker) != std::string_view::npos) {
    reason = "failed measurement";
    return true;
  }
  reason.clear();
  return false;
}

bool Reconcile(const ResultSet& baseline, const ResultSet& current, DuplicateNamePolicy policy,
               ReconcileResult& result, std::string& error) {
  result = ReconcileResult{};

  std::map<std::string, MetricRecord> baseline_by_name;
  if (!IndexSide(baseline, RunSide::kBaseline, policy, baseline_by_name, result, error)) {
    return false;
  }

  std::map<std::string, MetricRecord> current_by_name;
  if (!IndexSide(current, RunSide::kCurrent, policy, current_by_name, result, error)) {
    return false;
  }

  std::set<std::string> all_names;
  for (const auto& [name, record] : baseline_by_name) {
    (void)record;
    all_names.insert(name);
  }
  for (const auto& [name, record] : current_by_name) {
    (void)record;
    all_names.insert(name);
  }

  result.entries.reserve(all_names.size());
  for (const auto& name : all_names) {
    ComparisonEntry entry;
    entry.name = name;

    const auto baseline_it = baseline_by_name.find(name);
    entry.baseline = baseline_it != baseline_by_name.end() ? baseline_it->second : ZeroRecord(name);

    const auto current_it = current_by_name.find(name);
    entry.current = current_it != current_by_name.end() ? current_it->second : ZeroRecord(name);

    result.entries.push_back(std::move(entry));
  }

  return true;
}

} // namespace benchdiff::compare
