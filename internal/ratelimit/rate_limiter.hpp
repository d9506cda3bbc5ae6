#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/util/time.hpp"
#include "rate_limit_journal.hpp"

namespace projmem::ratelimit {

struct RateLimitDecision {
  bool     allowed = true;
  uint64_t remaining = 0;
  double   utilization_percent = 0.0;

  // time until enough admitted ops leave the window; zero when allowed
  std::chrono::milliseconds retry_after{0};
};

struct RateLimitSnapshot {
  uint64_t                  max_ops = 0;
  std::chrono::milliseconds window{0};
  uint64_t                  current_usage = 0;
  uint64_t                  remaining = 0;
  double                    utilization_percent = 0.0;
  bool                      persistent = false;
};

/*
  Sliding-window limiter.

  Keeps the timestamp of every admitted op inside the trailing window;
  an op is admitted while fewer than max_ops timestamps remain. Independent
  of the connection pool: callers check it before touching storage.

  With a journal attached, admitted ops survive restarts. Allow() only
  queues them; a background flusher writes the queue to the journal once a
  second, so admission never waits on the database write lock. A failed
  flush keeps the queue (minus ops already out of the window) for the next
  attempt. A journal that cannot be loaded at startup drops the limiter to
  in-memory mode.
*/
class RateLimiter {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  RateLimiter(uint64_t max_ops, std::chrono::milliseconds window, ClockFn clock = &util::Now,
              std::unique_ptr<RateLimitJournal> journal = nullptr);
  ~RateLimiter();

  RateLimiter(const RateLimiter&)            = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  RateLimitDecision Allow(uint64_t cost = 1);

  RateLimitSnapshot Snapshot();

  void Reset();

  // Writes queued ops to the journal now. No-op without a journal.
  void Flush();

  // Stops the flusher, writes what is queued and prunes the journal.
  // The limiter keeps working in memory afterwards.
  void Shutdown();

  bool Persistent() const;

 private:
  void PruneLocked(util::TimePoint now);
  void RunFlusher();
  void StopFlusher();
  void FlushPending(bool force_prune);

  const uint64_t                  max_ops_;
  const std::chrono::milliseconds window_;
  ClockFn                         clock_;

  // lock order: journal_mutex_ before mutex_
  mutable std::mutex           mutex_;
  std::deque<util::TimePoint>  admitted_;
  std::vector<util::TimePoint> pending_;
  util::TimePoint              latest_{};
  bool                         stopping_ = false;
  std::condition_variable      flush_cv_;

  std::mutex                        journal_mutex_;
  std::unique_ptr<RateLimitJournal> journal_;
  util::TimePoint                   last_journal_prune_{};
  bool                              journal_failing_ = false;

  std::atomic<bool> persistent_{false};
  std::thread       flusher_;
};

} // namespace projmem::ratelimit
