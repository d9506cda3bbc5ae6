#pragma once

#include <memory>

#include "internal/config/memory_options.hpp"

namespace projmem::core {
class MemoryStore;
class SnapshotCodec;
class HealthChecker;
}
namespace projmem::db { class Repository; }
namespace projmem::db::sqlite { class SqlitePool; }
namespace projmem::ratelimit { class RateLimiter; }

namespace projmem::service {

class ProtocolHandler;

/*
  Dependency container built once at startup (factory::Build) and shared
  by the transport. Owns every process-wide resource; Shutdown() is the
  explicit teardown.
*/
struct ServiceContext {
  projmem::config::MemoryOptions options;

  std::shared_ptr<projmem::db::sqlite::SqlitePool> pool;
  std::shared_ptr<projmem::db::Repository> repository;
  std::shared_ptr<projmem::ratelimit::RateLimiter> limiter;
  std::shared_ptr<projmem::core::MemoryStore> store;
  std::shared_ptr<projmem::core::SnapshotCodec> codec;
  std::shared_ptr<projmem::core::HealthChecker> health;
  std::shared_ptr<ProtocolHandler> handler;

  // Flushes the limiter journal and closes pooled connections. Idempotent.
  void Shutdown();
};

}
