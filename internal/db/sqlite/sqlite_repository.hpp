#pragma once

#include <chrono>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace projmem::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(std::shared_ptr<SqlitePool> pool, std::chrono::milliseconds acquire_timeout);

  std::unique_ptr<Transaction> Begin(TxMode mode) override;
  std::unique_ptr<Transaction> Begin(TxMode mode, std::chrono::milliseconds acquire_timeout) override;

  Result InsertDecision(Transaction&, model::DecisionRecord&) override;
  uint64_t CountDecisions(Transaction&) override;
  uint64_t DeleteOldestDecisions(Transaction&, uint64_t count) override;
  std::vector<model::DecisionRecord> ListDecisions(Transaction&, const std::string& keyword, uint64_t limit) override;
  std::vector<model::DecisionRecord> ListDecisionsAscending(Transaction&) override;

  Result UpsertPattern(Transaction&, const model::PatternRecord&) override;
  bool PatternExists(Transaction&, const std::string& name) override;
  uint64_t CountPatterns(Transaction&) override;
  std::vector<model::PatternRecord> ListPatterns(Transaction&) override;

  Result UpsertContext(Transaction&, const model::ContextRecord&) override;
  bool ContextExists(Transaction&, const std::string& key) override;
  uint64_t CountContext(Transaction&) override;
  std::vector<model::ContextRecord> ListContext(Transaction&) override;

  model::TableCounts Counts(Transaction&) override;
  Result DeleteAll(Transaction&) override;
  Result Ping(Transaction&) override;
  std::string IntegrityCheck(Transaction&) override;

  const std::shared_ptr<SqlitePool>& Pool() const { return pool_; }

private:
  std::shared_ptr<SqlitePool> pool_;
  std::chrono::milliseconds acquire_timeout_;

  static SqliteTransaction& TX(Transaction& t);
};

}
