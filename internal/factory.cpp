#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "internal/core/health_checker.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/core/snapshot_codec.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ratelimit/rate_limiter.hpp"
#include "internal/service/protocol_handler.hpp"
#include "internal/util/errors.hpp"

namespace projmem::factory {

using namespace projmem;

namespace {

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("cannot create directory " + parent.string() + ": " + ec.message());
  }
}

/*
  Creates the file and schema when missing, migrates older schemas, and
  optionally runs the integrity check. Read-only mode never migrates an
  existing file.
*/
void BootstrapStore(const config::MemoryOptions& options) {
  const bool exists = std::filesystem::exists(options.db_path);

  try {
    if (options.read_only && exists) {
      db::sqlite::SqliteDB probe(options.db_path, db::sqlite::OpenMode::kReadOnly);
      if (options.verify_integrity_on_start) {
        const auto result = probe.IntegrityCheck();
        if (result != "ok") throw util::StorageIntegrity("integrity check failed for " + options.db_path + ": " + result);
      }
      return;
    }

    EnsureParentDirectory(options.db_path);
    db::sqlite::SqliteDB bootstrap(options.db_path, db::sqlite::OpenMode::kReadWrite);
    const int            version = db::sqlite::BootstrapSchema(bootstrap);

    if (options.verify_integrity_on_start) {
      const auto result = bootstrap.IntegrityCheck();
      if (result != "ok") throw util::StorageIntegrity("integrity check failed for " + options.db_path + ": " + result);
    }

    PROJMEM_LOG_INFO("Memory store opened", {observability::StringField("path", options.db_path), observability::StringField("project", options.project_name),
                                             observability::IntField("schema_version", version), observability::BoolField("created", !exists)});
  } catch (const db::DbError& e) {
    if (db::IsIntegrityFailure(e.code())) {
      throw util::StorageIntegrity("cannot open " + options.db_path + ": " + e.what());
    }
    throw;
  }
}

std::shared_ptr<ratelimit::RateLimiter> BuildLimiter(const config::MemoryOptions& options) {
  std::unique_ptr<ratelimit::RateLimitJournal> journal;

  if (options.persist_rate_limit && options.read_only) {
    PROJMEM_LOG_WARN("Rate limit persistence disabled in read-only mode");
  } else if (options.persist_rate_limit) {
    try {
      journal = std::make_unique<ratelimit::RateLimitJournal>(options.db_path);
    } catch (const db::DbError& e) {
      PROJMEM_LOG_WARN("Rate limit journal unavailable; using in-memory limiter", {observability::StringField("error", e.what())});
    }
  }

  return std::make_shared<ratelimit::RateLimiter>(options.operations_per_window, options.rate_window, &util::Now, std::move(journal));
}

} // namespace

std::shared_ptr<service::ServiceContext> Build(const config::MemoryOptions& options) {
  BootstrapStore(options);

  auto ctx     = std::make_shared<service::ServiceContext>();
  ctx->options = options;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  const auto mode = options.read_only ? db::sqlite::OpenMode::kReadOnly : db::sqlite::OpenMode::kReadWrite;
  auto       pool = std::make_shared<db::sqlite::SqlitePool>(options.db_path, options.pool_size, mode);
  if (options.warm_up) {
    pool->WarmUp();
  }
  auto repository = std::make_shared<db::sqlite::SqliteRepository>(pool, options.acquire_timeout);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto limiter = BuildLimiter(options);

  core::StoreOptions store_options;
  store_options.limits.max_decisions    = options.max_decisions;
  store_options.limits.max_patterns     = options.max_patterns;
  store_options.limits.max_context_keys = options.max_context_keys;
  store_options.limits.warning_percent  = options.capacity_warning_percent;
  store_options.max_text_length         = options.max_text_length;
  store_options.read_only               = options.read_only;
  auto store                            = std::make_shared<core::MemoryStore>(repository, store_options);

  core::SnapshotOptions snapshot_options;
  snapshot_options.project          = options.project_name;
  snapshot_options.max_json_bytes   = options.max_import_json_bytes;
  snapshot_options.max_decisions    = options.max_import_decisions;
  snapshot_options.max_patterns     = options.max_import_patterns;
  snapshot_options.max_context_keys = options.max_import_context_keys;
  auto codec                        = std::make_shared<core::SnapshotCodec>(store, snapshot_options);

  core::HealthOptions health_options;
  health_options.db_path         = options.db_path;
  health_options.acquire_timeout = options.health_acquire_timeout;
  auto health                    = std::make_shared<core::HealthChecker>(repository, pool, limiter, store, health_options);

  // ------------------------------------------------------------------
  // Protocol
  // ------------------------------------------------------------------
  ctx->pool       = pool;
  ctx->repository = repository;
  ctx->limiter    = limiter;
  ctx->store      = store;
  ctx->codec      = codec;
  ctx->health     = health;
  ctx->handler    = std::make_shared<service::ProtocolHandler>(store, codec, health, limiter);

  return ctx;
}

} // namespace projmem::factory
