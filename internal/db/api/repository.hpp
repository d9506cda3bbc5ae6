#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/context_record.hpp"
#include "internal/db/model/decision_record.hpp"
#include "internal/db/model/pattern_record.hpp"
#include "internal/db/model/table_counts.hpp"

namespace projmem::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Write transactions are serialized by the backend
  - Capacity rules (core::CapacityManager) depend on counts read
    inside the same write transaction they guard

  Write methods return Result; read methods throw DbError.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // May block up to the backend's acquire timeout; throws util::PoolExhausted.
  virtual std::unique_ptr<Transaction> Begin(TxMode mode) = 0;

  // Same, with an explicit acquire timeout (health probes).
  virtual std::unique_ptr<Transaction> Begin(TxMode mode, std::chrono::milliseconds acquire_timeout) = 0;

  // ---------------------------------------------------------------------
  // Decisions (append log)
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertDecision(Transaction&, model::DecisionRecord& record) = 0;

  virtual uint64_t CountDecisions(Transaction&) = 0;

  // Deletes the `count` rows with the lowest ids; returns rows deleted.
  virtual uint64_t DeleteOldestDecisions(Transaction&, uint64_t count) = 0;

  // Most recent first. Empty keyword = all rows; limit 0 = no limit.
  virtual std::vector<model::DecisionRecord> ListDecisions(Transaction&, const std::string& keyword, uint64_t limit) = 0;

  // Oldest first (export order).
  virtual std::vector<model::DecisionRecord> ListDecisionsAscending(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Patterns (keyed)
  // ---------------------------------------------------------------------

  virtual Result UpsertPattern(Transaction&, const model::PatternRecord&) = 0;

  virtual bool PatternExists(Transaction&, const std::string& name) = 0;

  virtual uint64_t CountPatterns(Transaction&) = 0;

  // Ordered by name.
  virtual std::vector<model::PatternRecord> ListPatterns(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Context (keyed)
  // ---------------------------------------------------------------------

  virtual Result UpsertContext(Transaction&, const model::ContextRecord&) = 0;

  virtual bool ContextExists(Transaction&, const std::string& key) = 0;

  virtual uint64_t CountContext(Transaction&) = 0;

  // Ordered by key.
  virtual std::vector<model::ContextRecord> ListContext(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Whole store
  // ---------------------------------------------------------------------

  virtual model::TableCounts Counts(Transaction&) = 0;

  // Empties decisions, patterns and context.
  virtual Result DeleteAll(Transaction&) = 0;

  // Lightweight round trip ("SELECT 1").
  virtual Result Ping(Transaction&) = 0;

  // "ok" or the first problem reported by the engine.
  virtual std::string IntegrityCheck(Transaction&) = 0;
};

} // namespace projmem::db
