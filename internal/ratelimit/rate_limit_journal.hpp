#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/time.hpp"

namespace projmem::ratelimit {

/*
  Durable record of admitted operations (table rate_limit_ops).

  Uses its own dedicated connection, never a pooled one, so the limiter
  never competes with callers for pool capacity. Not thread-safe; the
  owning RateLimiter serializes access and calls it off the admission path.

  Every method throws db::DbError on storage failure.
*/
class RateLimitJournal {
 public:
  explicit RateLimitJournal(const std::string& path);

  // Timestamps recorded at or after `since`, oldest first.
  std::vector<util::TimePoint> Load(util::TimePoint since);

  // One row per timestamp, in a single transaction.
  void Append(const std::vector<util::TimePoint>& timestamps);

  // Deletes rows older than cutoff; returns rows removed.
  uint64_t Prune(util::TimePoint cutoff);

  void Clear();

 private:
  std::unique_ptr<db::sqlite::SqliteDB> db_;
};

} // namespace projmem::ratelimit
