#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "projmem/v1/memory.pb.h"

namespace projmem::core {

struct CapacityLimits {
  uint64_t max_decisions    = 1000;
  uint64_t max_patterns     = 100;
  uint64_t max_context_keys = 50;

  // utilization above this is reported as a health warning
  double warning_percent = 90.0;
};

/*
  CapacityManager

  Enforces per-table maximums inside the caller's write transaction:

    decisions         -> ring buffer, oldest rows evicted, never rejects
    patterns, context -> new keys rejected at the limit (CapacityExceeded),
                         existing keys always replaced in place

  Every check reads counts through the same transaction that performs the
  write, so two writers cannot both pass a check for the last slot.
*/
class CapacityManager {
 public:
  explicit CapacityManager(CapacityLimits limits);

  const CapacityLimits& Limits() const {
    return limits_;
  }

  // Frees one slot for a new decision; returns the number of rows evicted.
  uint64_t MakeRoomForDecision(db::Repository& repo, db::Transaction& tx) const;

  // Returns true if `name` already exists (replace), false for a new key
  // that fits. Throws util::CapacityExceeded otherwise.
  bool AdmitPattern(db::Repository& repo, db::Transaction& tx, const std::string& name) const;
  bool AdmitContext(db::Repository& repo, db::Transaction& tx, const std::string& key) const;

  projmem::v1::CapacityUsage Usage(const db::model::TableCounts& counts) const;

  // One message per table above warning_percent.
  std::vector<std::string> Warnings(const projmem::v1::CapacityUsage& usage) const;

  projmem::v1::MemoryLimits ToProto() const;

 private:
  CapacityLimits limits_;
};

} // namespace projmem::core
