#include "internal/ratelimit/rate_limiter.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace {

using projmem::ratelimit::RateLimiter;
using projmem::ratelimit::RateLimitJournal;
using projmem::util::TimePoint;

struct FakeClock {
  TimePoint now = projmem::util::FromUnixMillis(1'700'000'000'000);

  RateLimiter::ClockFn Fn() {
    return [this] {
      return now;
    };
  }

  void Advance(std::chrono::milliseconds d) {
    now += d;
  }
};

std::string TempDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "project_memory_rate_limiter_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  return path.string();
}

void TestAdmitsUpToLimit() {
  FakeClock   clock;
  RateLimiter limiter(3, std::chrono::seconds(60), clock.Fn());

  assert(limiter.Allow().allowed);
  assert(limiter.Allow().allowed);

  const auto third = limiter.Allow();
  assert(third.allowed);
  assert(third.remaining == 0);
  assert(third.utilization_percent == 100.0);

  const auto fourth = limiter.Allow();
  assert(!fourth.allowed);
  assert(fourth.remaining == 0);
  assert(fourth.retry_after == std::chrono::seconds(60));
}

void TestWindowSlides() {
  FakeClock   clock;
  RateLimiter limiter(2, std::chrono::seconds(60), clock.Fn());

  assert(limiter.Allow().allowed);
  clock.Advance(std::chrono::seconds(20));
  assert(limiter.Allow().allowed);

  clock.Advance(std::chrono::seconds(10));
  const auto denied = limiter.Allow();
  assert(!denied.allowed);
  // first op was admitted 30s ago
  assert(denied.retry_after == std::chrono::seconds(30));

  clock.Advance(std::chrono::seconds(30));
  assert(limiter.Allow().allowed);

  const auto snap = limiter.Snapshot();
  assert(snap.current_usage == 2);
  assert(snap.remaining == 0);
  assert(!snap.persistent);
}

void TestDeniedOpsAreNotCounted() {
  FakeClock   clock;
  RateLimiter limiter(1, std::chrono::seconds(10), clock.Fn());

  assert(limiter.Allow().allowed);
  for (int i = 0; i < 5; ++i) assert(!limiter.Allow().allowed);

  clock.Advance(std::chrono::seconds(10));
  assert(limiter.Allow().allowed);
  assert(limiter.Snapshot().current_usage == 1);
}

void TestReset() {
  FakeClock   clock;
  RateLimiter limiter(1, std::chrono::seconds(60), clock.Fn());

  assert(limiter.Allow().allowed);
  assert(!limiter.Allow().allowed);

  limiter.Reset();
  assert(limiter.Allow().allowed);
}

void TestJournalSurvivesRestart() {
  const auto path = TempDbPath("journal");
  FakeClock  clock;

  {
    RateLimiter limiter(3, std::chrono::seconds(60), clock.Fn(), std::make_unique<RateLimitJournal>(path));
    assert(limiter.Persistent());
    assert(limiter.Allow().allowed);
    assert(limiter.Allow().allowed);
    limiter.Shutdown();
  }

  clock.Advance(std::chrono::seconds(5));
  {
    RateLimiter limiter(3, std::chrono::seconds(60), clock.Fn(), std::make_unique<RateLimitJournal>(path));
    assert(limiter.Snapshot().current_usage == 2);
    assert(limiter.Allow().allowed);
    assert(!limiter.Allow().allowed);
  }

  // everything recorded so far has left the window
  clock.Advance(std::chrono::seconds(61));
  {
    RateLimiter limiter(3, std::chrono::seconds(60), clock.Fn(), std::make_unique<RateLimitJournal>(path));
    assert(limiter.Snapshot().current_usage == 0);
  }
}

void TestJournalPrune() {
  const auto       path = TempDbPath("prune");
  RateLimitJournal journal(path);

  const auto base = projmem::util::FromUnixMillis(1'700'000'000'000);
  journal.Append({base, base});
  journal.Append({base + std::chrono::seconds(30)});

  assert(journal.Load(base).size() == 3);
  assert(journal.Prune(base + std::chrono::seconds(1)) == 2);
  assert(journal.Load(base).size() == 1);

  journal.Clear();
  assert(journal.Load(base).empty());
}

void TestAdmissionDoesNotWaitForWriters() {
  const auto path = TempDbPath("busy_writer");
  FakeClock  clock;

  RateLimiter limiter(100, std::chrono::seconds(60), clock.Fn(), std::make_unique<RateLimitJournal>(path));

  // another connection holds the write lock for the whole burst
  projmem::db::sqlite::SqliteDB writer(path);
  writer.Exec("BEGIN IMMEDIATE;");

  const auto started = std::chrono::steady_clock::now();
  for (int i = 0; i < 5; ++i) {
    assert(limiter.Allow().allowed);
    clock.Advance(std::chrono::milliseconds(10));
  }
  assert(limiter.Snapshot().current_usage == 5);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(elapsed < std::chrono::milliseconds(500));

  writer.Exec("COMMIT;");
  limiter.Flush();
  assert(limiter.Persistent());

  RateLimitJournal reader(path);
  assert(reader.Load(clock.now - std::chrono::seconds(60)).size() == 5);
}

} // namespace

int main() {
  TestAdmitsUpToLimit();
  TestWindowSlides();
  TestDeniedOpsAreNotCounted();
  TestReset();
  TestJournalSurvivesRestart();
  TestJournalPrune();
  TestAdmissionDoesNotWaitForWriters();

  std::cout << "project_memory_unit_rate_limiter: pass\n";
  return 0;
}
