#include "internal/db/sqlite/sqlite_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"

namespace {

using projmem::db::sqlite::SqlitePool;

std::string TempDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "project_memory_pool_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);
  return path.string();
}

void TestConnectionsAreReused() {
  auto pool = std::make_shared<SqlitePool>(TempDbPath("reuse"), 2);

  {
    auto conn = pool->Acquire(std::chrono::milliseconds(100));
    assert(conn);
    const auto stats = pool->Stats();
    assert(stats.open == 1);
    assert(stats.in_use == 1);
  }

  const auto stats = pool->Stats();
  assert(stats.open == 1);
  assert(stats.idle == 1);
  assert(stats.in_use == 0);
}

void TestWarmUpOpensEveryConnection() {
  auto pool = std::make_shared<SqlitePool>(TempDbPath("warm"), 3);
  pool->WarmUp();

  const auto stats = pool->Stats();
  assert(stats.size == 3);
  assert(stats.open == 3);
  assert(stats.idle == 3);
}

void TestAcquireTimesOutWhenExhausted() {
  auto pool = std::make_shared<SqlitePool>(TempDbPath("exhausted"), 1);
  auto held = pool->Acquire(std::chrono::milliseconds(100));

  const auto start = std::chrono::steady_clock::now();
  bool       threw = false;
  try {
    (void)pool->Acquire(std::chrono::milliseconds(50));
  } catch (const projmem::util::PoolExhausted&) {
    threw = true;
  }
  const auto waited = std::chrono::steady_clock::now() - start;

  assert(threw);
  assert(waited >= std::chrono::milliseconds(40));
  assert(pool->Stats().exhaustion_count == 1);

  held.reset();
  auto again = pool->Acquire(std::chrono::milliseconds(50));
  assert(again);
}

void TestWaiterGetsReleasedConnection() {
  auto pool = std::make_shared<SqlitePool>(TempDbPath("waiter"), 1);
  auto held = pool->Acquire(std::chrono::milliseconds(100));

  std::atomic<bool> acquired{false};
  std::thread       waiter([&] {
    auto conn = pool->Acquire(std::chrono::seconds(5));
    acquired  = conn != nullptr;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!acquired.load());
  held.reset();

  waiter.join();
  assert(acquired.load());
  assert(pool->Stats().exhaustion_count == 0);
}

void TestClosedPoolRejectsAcquire() {
  auto pool = std::make_shared<SqlitePool>(TempDbPath("closed"), 2);
  auto held = pool->Acquire(std::chrono::milliseconds(100));

  pool->Close();

  bool threw = false;
  try {
    (void)pool->Acquire(std::chrono::milliseconds(10));
  } catch (const projmem::util::PoolExhausted&) {
    threw = true;
  }
  assert(threw);

  // in-use connection closes on release instead of returning to the pool
  held.reset();
  assert(pool->Stats().open == 0);
}

void TestConnectionOutlivesPool() {
  auto pool = std::make_shared<SqlitePool>(TempDbPath("outlive"), 1);
  auto conn = pool->Acquire(std::chrono::milliseconds(100));

  pool.reset();
  conn->Exec("SELECT 1;");
  conn.reset();
}

} // namespace

int main() {
  TestConnectionsAreReused();
  TestWarmUpOpensEveryConnection();
  TestAcquireTimesOutWhenExhausted();
  TestWaiterGetsReleasedConnection();
  TestClosedPoolRejectsAcquire();
  TestConnectionOutlivesPool();

  std::cout << "project_memory_unit_connection_pool: pass\n";
  return 0;
}
