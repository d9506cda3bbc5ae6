#include "capacity_manager.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace projmem::core {

namespace {

double Percent(uint64_t count, uint64_t max) {
  return max == 0 ? 0.0 : static_cast<double>(count) * 100.0 / static_cast<double>(max);
}

std::string FormatWarning(const char* table, double percent) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "%s at %.1f%% capacity", table, percent);
  return buf;
}

} // namespace

CapacityManager::CapacityManager(CapacityLimits limits) : limits_(limits) {
}

uint64_t CapacityManager::MakeRoomForDecision(db::Repository& repo, db::Transaction& tx) const {
  const uint64_t count = repo.CountDecisions(tx);
  if (count < limits_.max_decisions) return 0;

  // normally exactly one row; more only after max_decisions was lowered
  return repo.DeleteOldestDecisions(tx, count - limits_.max_decisions + 1);
}

bool CapacityManager::AdmitPattern(db::Repository& repo, db::Transaction& tx, const std::string& name) const {
  if (repo.PatternExists(tx, name)) return true;

  if (repo.CountPatterns(tx) >= limits_.max_patterns) {
    throw util::CapacityExceeded("pattern limit reached (" + std::to_string(limits_.max_patterns) +
                                 "); update an existing pattern or purge memory");
  }
  return false;
}

bool CapacityManager::AdmitContext(db::Repository& repo, db::Transaction& tx, const std::string& key) const {
  if (repo.ContextExists(tx, key)) return true;

  if (repo.CountContext(tx) >= limits_.max_context_keys) {
    throw util::CapacityExceeded("context key limit reached (" + std::to_string(limits_.max_context_keys) +
                                 "); update an existing key or purge memory");
  }
  return false;
}

projmem::v1::CapacityUsage CapacityManager::Usage(const db::model::TableCounts& counts) const {
  projmem::v1::CapacityUsage usage;
  usage.set_decisions_percent(Percent(counts.decisions, limits_.max_decisions));
  usage.set_patterns_percent(Percent(counts.patterns, limits_.max_patterns));
  usage.set_context_percent(Percent(counts.context_keys, limits_.max_context_keys));
  return usage;
}

std::vector<std::string> CapacityManager::Warnings(const projmem::v1::CapacityUsage& usage) const {
  std::vector<std::string> out;
  if (usage.decisions_percent() > limits_.warning_percent) out.push_back(FormatWarning("decisions", usage.decisions_percent()));
  if (usage.patterns_percent() > limits_.warning_percent) out.push_back(FormatWarning("patterns", usage.patterns_percent()));
  if (usage.context_percent() > limits_.warning_percent) out.push_back(FormatWarning("context", usage.context_percent()));
  return out;
}

projmem::v1::MemoryLimits CapacityManager::ToProto() const {
  projmem::v1::MemoryLimits out;
  out.set_max_decisions(limits_.max_decisions);
  out.set_max_patterns(limits_.max_patterns);
  out.set_max_context_keys(limits_.max_context_keys);
  return out;
}

} // namespace projmem::core
