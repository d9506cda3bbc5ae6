#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "capacity_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "projmem/v1/memory.pb.h"
#include "projmem/v1/operations.pb.h"

namespace projmem::core {

struct StoreOptions {
  CapacityLimits limits;
  std::size_t    max_text_length = 10000;
  bool           read_only       = false;
};

/*
  MemoryStore

  Domain API over the repository. Each call is:

    guards (integrity latch, read-only) -> validation -> one transaction
    (capacity rules + writes) -> commit

  A call is either fully applied or fully rejected.

  Once the backing file reports corruption the store latches into a failed
  state and every later call throws util::StorageIntegrity.
*/
class MemoryStore {
 public:
  MemoryStore(std::shared_ptr<db::Repository> repository, StoreOptions options);

  projmem::v1::RememberDecisionResult RememberDecision(const std::string& decision, const std::string& rationale, const std::string& context,
                                                       const std::string& alternatives);

  // Most recent first. Empty keyword = everything; limit 0 = no limit.
  projmem::v1::RecallDecisionsResult RecallDecisions(const std::string& keyword, uint64_t limit);

  projmem::v1::StorePatternResult StorePattern(const std::string& name, const std::string& description, const std::string& example,
                                               const std::string& when_to_use);
  projmem::v1::GetPatternsResult  GetPatterns();

  projmem::v1::SetContextResult SetContext(const std::string& key, const std::string& value);
  projmem::v1::GetContextResult GetContext();

  projmem::v1::MemoryStats Stats();

  // Requires confirm == "CONFIRM_PURGE"; empties all three tables at once.
  projmem::v1::PurgeSummary Purge(const std::string& confirm);

  /*
    Runs fn(repository, transaction) as one unit of work and commits.
    Same guards and error mapping as the built-in operations; used by
    the snapshot codec and the health checker.
  */
  template <typename Fn>
  auto RunInTransaction(db::TxMode mode, Fn&& fn) -> std::invoke_result_t<Fn&, db::Repository&, db::Transaction&>;

  void RequireHealthy() const;
  void RequireWritable() const;

  bool ReadOnly() const {
    return options_.read_only;
  }

  bool Failed() const {
    return failed_.load();
  }

  const StoreOptions& Options() const {
    return options_;
  }

  const CapacityManager& Capacity() const {
    return capacity_;
  }

  // Maps a storage error onto the service taxonomy; latches on corruption.
  [[noreturn]] void RaiseStorageError(const db::DbError& error);

  // Latches the failed state; every later call throws util::StorageIntegrity.
  void MarkFailed(const std::string& reason);

 private:
  std::shared_ptr<db::Repository> repository_;
  StoreOptions                    options_;
  CapacityManager                 capacity_;
  std::atomic<bool>               failed_{false};
};

template <typename Fn>
auto MemoryStore::RunInTransaction(db::TxMode mode, Fn&& fn) -> std::invoke_result_t<Fn&, db::Repository&, db::Transaction&> {
  using R = std::invoke_result_t<Fn&, db::Repository&, db::Transaction&>;

  RequireHealthy();
  if (mode == db::TxMode::kWrite) RequireWritable();

  try {
    auto tx = repository_->Begin(mode);
    if constexpr (std::is_void_v<R>) {
      fn(*repository_, *tx);
      tx->Commit();
    } else {
      R out = fn(*repository_, *tx);
      tx->Commit();
      return out;
    }
  } catch (const db::DbError& e) {
    RaiseStorageError(e);
  }
}

// Turns a failed write Result into a DbError for RunInTransaction.
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace projmem::core
