#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "sqlite_db.hpp"

namespace projmem::db::sqlite {

struct PoolStats {
  std::size_t size    = 0;
  std::size_t open    = 0;
  std::size_t idle    = 0;
  std::size_t in_use  = 0;
  std::size_t waiting = 0;

  uint64_t exhaustion_count = 0;
};

/*
  SqlitePool

  Fixed-capacity set of connections onto one database file.

  Design notes:
  -------------
  - Each transaction holds exactly one connection for its lifetime.
  - sqlite3 handles are opened NOMUTEX -> never share one across threads.
  - Connections open lazily up to size(), or all at once via WarmUp().
  - Acquire() blocks up to the given timeout and then throws
    util::PoolExhausted; there is no unbounded queue.
  - The pool bounds reader fan-out only. Writers are serialized by
    sqlite itself (BEGIN IMMEDIATE + busy timeout).

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction holds shared_ptr<SqliteDB>; its deleter hands the
    connection back (or closes it once the pool is closed or gone).
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, std::size_t size, OpenMode mode = OpenMode::kReadWrite);

  std::shared_ptr<SqliteDB> Acquire(std::chrono::milliseconds timeout);

  // Pre-open every connection. Throws DbError if the file cannot be opened.
  void WarmUp();

  // Close idle connections; in-use ones close on release. Later acquires throw.
  void Close();

  PoolStats Stats() const;

  std::size_t Size() const {
    return size_;
  }

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  void NoteExhaustion(std::chrono::milliseconds timeout);

  std::string path_;
  std::size_t size_;
  OpenMode    mode_;

  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
  std::size_t                            waiting_          = 0;
  uint64_t                               exhaustion_count_ = 0;
  bool                                   closed_           = false;
  util::TimePoint                        last_exhaustion_log_{};
};

} // namespace projmem::db::sqlite
