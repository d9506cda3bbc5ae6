#include "sqlite_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace projmem::db::sqlite {

namespace {

constexpr auto kExhaustionLogInterval = std::chrono::seconds(10);

} // namespace

SqlitePool::SqlitePool(std::string path, std::size_t size, OpenMode mode)
    : path_(std::move(path)), size_(size == 0 ? 1 : size), mode_(mode) {
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::unique_lock lock(mutex_);
  for (;;) {
    if (closed_) {
      throw util::PoolExhausted("connection pool is closed");
    }

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < size_) {
      ++live_connections_;
      lock.unlock();

      try {
        return Wrap(new SqliteDB(path_, mode_));
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    ++waiting_;
    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return closed_ || !idle_.empty() || live_connections_ < size_;
    });
    --waiting_;

    if (!ready) {
      ++exhaustion_count_;
      lock.unlock();
      NoteExhaustion(timeout);
      throw util::PoolExhausted("connection pool exhausted: no connection available within " + std::to_string(timeout.count()) + "ms");
    }
  }
}

void SqlitePool::WarmUp() {
  std::lock_guard lock(mutex_);
  while (!closed_ && live_connections_ < size_) {
    idle_.push_back(std::make_unique<SqliteDB>(path_, mode_));
    ++live_connections_;
  }
  PROJMEM_LOG_INFO("Connection pool warmed up", {observability::StringField("path", path_), observability::IntField("connections", static_cast<int64_t>(live_connections_))});
}

void SqlitePool::Close() {
  std::vector<std::unique_ptr<SqliteDB>> to_close;
  std::size_t                            in_use = 0;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    closed_ = true;
    to_close.swap(idle_);
    live_connections_ -= to_close.size();
    in_use = live_connections_;
  }
  cv_.notify_all();

  PROJMEM_LOG_INFO("Connection pool closed", {observability::IntField("closed", static_cast<int64_t>(to_close.size())), observability::IntField("in_use", static_cast<int64_t>(in_use))});
}

PoolStats SqlitePool::Stats() const {
  std::lock_guard lock(mutex_);
  PoolStats s;
  s.size             = size_;
  s.open             = live_connections_;
  s.idle             = idle_.size();
  s.in_use           = live_connections_ - idle_.size();
  s.waiting          = waiting_;
  s.exhaustion_count = exhaustion_count_;
  return s;
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqlitePool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqlitePool::Release(SqliteDB* conn) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) {
      --live_connections_;
      delete conn;
      return;
    }
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void SqlitePool::NoteExhaustion(std::chrono::milliseconds timeout) {
  const auto now = util::Now();
  {
    std::lock_guard lock(mutex_);
    if (now - last_exhaustion_log_ < kExhaustionLogInterval) return;
    last_exhaustion_log_ = now;
  }
  PROJMEM_LOG_WARN("Connection pool exhausted", {observability::IntField("size", static_cast<int64_t>(size_)), observability::DurationField("timeout", timeout)});
}

} // namespace projmem::db::sqlite
