#include "rate_limiter.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace projmem::ratelimit {

namespace {

constexpr auto kJournalPruneInterval = std::chrono::minutes(5);
constexpr auto kJournalFlushInterval = std::chrono::seconds(1);

double Utilization(uint64_t used, uint64_t max) {
  return max == 0 ? 100.0 : static_cast<double>(used) * 100.0 / static_cast<double>(max);
}

} // namespace

RateLimiter::RateLimiter(uint64_t max_ops, std::chrono::milliseconds window, ClockFn clock, std::unique_ptr<RateLimitJournal> journal)
    : max_ops_(max_ops), window_(window), clock_(std::move(clock)), journal_(std::move(journal)) {
  if (!journal_) return;

  const auto now = clock_();
  latest_        = now;
  try {
    for (auto ts : journal_->Load(now - window_)) {
      admitted_.push_back(ts);
    }
    last_journal_prune_ = now;
    journal_->Prune(now - window_);
    PROJMEM_LOG_INFO("Rate limiter state restored", {observability::IntField("in_window", static_cast<int64_t>(admitted_.size()))});
  } catch (const db::DbError& e) {
    PROJMEM_LOG_WARN("Rate limit journal disabled; continuing in memory", {observability::StringField("error", e.what())});
    admitted_.clear();
    journal_.reset();
    return;
  }

  persistent_ = true;
  flusher_    = std::thread(&RateLimiter::RunFlusher, this);
}

RateLimiter::~RateLimiter() {
  Shutdown();
}

RateLimitDecision RateLimiter::Allow(uint64_t cost) {
  const auto now = clock_();

  std::lock_guard lock(mutex_);
  latest_ = std::max(latest_, now);
  PruneLocked(now);

  RateLimitDecision out;
  const uint64_t    used = admitted_.size();

  if (used + cost > max_ops_) {
    out.allowed             = false;
    out.remaining           = max_ops_ > used ? max_ops_ - used : 0;
    out.utilization_percent = Utilization(used, max_ops_);

    // the op that must expire before `cost` more fit
    const uint64_t must_expire = used + cost - max_ops_;
    if (must_expire <= admitted_.size()) {
      const auto expires = admitted_[must_expire - 1] + window_;
      out.retry_after    = std::max(std::chrono::milliseconds(1), std::chrono::ceil<std::chrono::milliseconds>(expires - now));
    } else {
      out.retry_after = window_;
    }
    return out;
  }

  for (uint64_t i = 0; i < cost; ++i) {
    admitted_.push_back(now);
    if (persistent_ && !stopping_) pending_.push_back(now);
  }

  out.allowed             = true;
  out.remaining           = max_ops_ - admitted_.size();
  out.utilization_percent = Utilization(admitted_.size(), max_ops_);
  return out;
}

RateLimitSnapshot RateLimiter::Snapshot() {
  const auto now = clock_();

  std::lock_guard lock(mutex_);
  latest_ = std::max(latest_, now);
  PruneLocked(now);

  RateLimitSnapshot s;
  s.max_ops             = max_ops_;
  s.window              = window_;
  s.current_usage       = admitted_.size();
  s.remaining           = max_ops_ > admitted_.size() ? max_ops_ - admitted_.size() : 0;
  s.utilization_percent = Utilization(admitted_.size(), max_ops_);
  s.persistent          = persistent_;
  return s;
}

void RateLimiter::Reset() {
  std::lock_guard journal_lock(journal_mutex_);
  {
    std::lock_guard lock(mutex_);
    admitted_.clear();
    pending_.clear();
  }
  if (!journal_) return;

  try {
    journal_->Clear();
  } catch (const db::DbError& e) {
    PROJMEM_LOG_WARN("Rate limit journal clear failed", {observability::StringField("error", e.what())});
  }
}

void RateLimiter::Flush() {
  FlushPending(false);
}

void RateLimiter::Shutdown() {
  StopFlusher();
  FlushPending(true);
}

bool RateLimiter::Persistent() const {
  return persistent_;
}

void RateLimiter::PruneLocked(util::TimePoint now) {
  const auto cutoff = now - window_;
  while (!admitted_.empty() && admitted_.front() <= cutoff) {
    admitted_.pop_front();
  }
}

void RateLimiter::RunFlusher() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    flush_cv_.wait_for(lock, kJournalFlushInterval, [this] {
      return stopping_;
    });
    if (stopping_) break;

    lock.unlock();
    FlushPending(false);
    lock.lock();
  }
}

void RateLimiter::StopFlusher() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  flush_cv_.notify_all();
  if (flusher_.joinable()) flusher_.join();
}

void RateLimiter::FlushPending(bool force_prune) {
  std::lock_guard journal_lock(journal_mutex_);
  if (!journal_) return;

  std::vector<util::TimePoint> batch;
  util::TimePoint              now;
  {
    std::lock_guard lock(mutex_);
    batch.swap(pending_);
    now = latest_;
  }

  // ops already out of the window no longer matter after a restart
  const auto cutoff = now - window_;
  batch.erase(std::remove_if(batch.begin(), batch.end(),
                             [cutoff](util::TimePoint ts) {
                               return ts <= cutoff;
                             }),
              batch.end());

  if (!batch.empty()) {
    try {
      journal_->Append(batch);
      if (journal_failing_) {
        PROJMEM_LOG_INFO("Rate limit journal writes recovered", {observability::IntField("flushed", static_cast<int64_t>(batch.size()))});
        journal_failing_ = false;
      }
    } catch (const db::DbError& e) {
      if (!journal_failing_) {
        PROJMEM_LOG_WARN("Rate limit journal write failed; retrying on next flush",
                         {observability::StringField("error", e.what()), observability::IntField("queued", static_cast<int64_t>(batch.size()))});
        journal_failing_ = true;
      }
      std::lock_guard lock(mutex_);
      pending_.insert(pending_.begin(), batch.begin(), batch.end());
      return;
    }
  }

  if (!force_prune && now - last_journal_prune_ < kJournalPruneInterval) return;
  last_journal_prune_ = now;
  try {
    journal_->Prune(cutoff);
  } catch (const db::DbError& e) {
    PROJMEM_LOG_WARN("Rate limit journal prune failed", {observability::StringField("error", e.what())});
  }
}

} // namespace projmem::ratelimit
