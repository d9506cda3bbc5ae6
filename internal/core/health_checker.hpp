#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/ratelimit/rate_limiter.hpp"
#include "memory_store.hpp"
#include "projmem/v1/memory.pb.h"

namespace projmem::core {

struct HealthOptions {
  std::string               db_path;
  std::chrono::milliseconds acquire_timeout{std::chrono::seconds(1)};

  // limiter utilization above this degrades health
  double rate_limit_warning_percent = 80.0;
};

/*
  HealthChecker

  Never throws for storage problems; every failure becomes part of the
  report.

    unhealthy: no connection within acquire_timeout, integrity check not
               "ok", write probe failed, or the store latched a failure
    degraded : table above the capacity warning, pool ever exhausted,
               limiter utilization above rate_limit_warning_percent
*/
class HealthChecker {
 public:
  HealthChecker(std::shared_ptr<db::Repository> repository, std::shared_ptr<db::sqlite::SqlitePool> pool,
                std::shared_ptr<ratelimit::RateLimiter> limiter, std::shared_ptr<MemoryStore> store, HealthOptions options);

  projmem::v1::HealthReport Check();

 private:
  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<db::sqlite::SqlitePool> pool_;
  std::shared_ptr<ratelimit::RateLimiter> limiter_;
  std::shared_ptr<MemoryStore>            store_;
  HealthOptions                           options_;
};

} // namespace projmem::core
