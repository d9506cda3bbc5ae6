#include "health_checker.hpp"

#include <filesystem>
#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/version.hpp"

namespace projmem::core {

using namespace projmem::v1;

namespace {

// never visible: the probe transaction is always rolled back
constexpr const char* kProbeKey = "__health_probe__";

void MarkUnhealthy(HealthReport& report) {
  report.set_status(HEALTH_STATUS_UNHEALTHY);
}

void MarkDegraded(HealthReport& report, std::string warning) {
  if (report.status() == HEALTH_STATUS_HEALTHY) report.set_status(HEALTH_STATUS_DEGRADED);
  report.mutable_checks()->add_warnings(std::move(warning));
}

} // namespace

HealthChecker::HealthChecker(std::shared_ptr<db::Repository> repository, std::shared_ptr<db::sqlite::SqlitePool> pool,
                             std::shared_ptr<ratelimit::RateLimiter> limiter, std::shared_ptr<MemoryStore> store, HealthOptions options)
    : repository_(std::move(repository)),
      pool_(std::move(pool)),
      limiter_(std::move(limiter)),
      store_(std::move(store)),
      options_(std::move(options)) {
}

HealthReport HealthChecker::Check() {
  HealthReport report;
  report.set_status(HEALTH_STATUS_HEALTHY);
  report.set_version(util::kServiceVersion);
  report.set_db_path(options_.db_path);

  std::error_code ec;
  const auto      file_bytes = std::filesystem::file_size(options_.db_path, ec);
  report.set_db_file_bytes(ec ? 0 : file_bytes);

  auto* checks = report.mutable_checks();

  if (store_->Failed()) {
    MarkUnhealthy(report);
    checks->add_warnings("store disabled after a storage integrity failure");
  }

  // ------------------------------------------------------------
  // connection + integrity + capacity (one read transaction)
  // ------------------------------------------------------------
  bool connected = false;
  try {
    auto tx = repository_->Begin(db::TxMode::kRead, options_.acquire_timeout);
    auto ping = repository_->Ping(*tx);
    if (!ping) throw db::DbError(std::move(ping));
    checks->set_connection("ok");
    connected = true;

    checks->set_integrity(repository_->IntegrityCheck(*tx));
    if (checks->integrity() != "ok") {
      store_->MarkFailed("integrity check: " + checks->integrity());
      MarkUnhealthy(report);
    }

    const auto counts = repository_->Counts(*tx);
    tx->Commit();

    *checks->mutable_capacity() = store_->Capacity().Usage(counts);
    for (auto& warning : store_->Capacity().Warnings(checks->capacity())) {
      MarkDegraded(report, std::move(warning));
    }
  } catch (const util::PoolExhausted& e) {
    checks->set_connection(std::string("failed: ") + e.what());
    MarkUnhealthy(report);
  } catch (const db::DbError& e) {
    if (db::IsIntegrityFailure(e.code())) store_->MarkFailed(e.what());
    (connected ? checks->mutable_integrity() : checks->mutable_connection())->assign(std::string("failed: ") + e.what());
    MarkUnhealthy(report);
  } catch (const std::exception& e) {
    (connected ? checks->mutable_integrity() : checks->mutable_connection())->assign(std::string("failed: ") + e.what());
    MarkUnhealthy(report);
  }

  // ------------------------------------------------------------
  // write capability (always rolled back)
  // ------------------------------------------------------------
  if (store_->ReadOnly()) {
    checks->set_write_capability("skipped: read-only");
  } else if (store_->Failed()) {
    checks->set_write_capability("skipped: store failed");
  } else if (!connected) {
    checks->set_write_capability("skipped: no connection");
  } else {
    try {
      auto tx = repository_->Begin(db::TxMode::kWrite, options_.acquire_timeout);

      db::model::ContextRecord probe;
      probe.key   = kProbeKey;
      probe.value = "probe";
      auto r      = repository_->UpsertContext(*tx, probe);
      tx->Rollback();
      if (!r) throw db::DbError(std::move(r));

      checks->set_write_capability("ok");
    } catch (const db::DbError& e) {
      if (db::IsIntegrityFailure(e.code())) store_->MarkFailed(e.what());
      checks->set_write_capability(std::string("failed: ") + e.what());
      MarkUnhealthy(report);
    } catch (const std::exception& e) {
      checks->set_write_capability(std::string("failed: ") + e.what());
      MarkUnhealthy(report);
    }
  }

  // ------------------------------------------------------------
  // pool + limiter
  // ------------------------------------------------------------
  const auto pool  = pool_->Stats();
  auto*      ps    = checks->mutable_pool();
  ps->set_size(pool.size);
  ps->set_open(pool.open);
  ps->set_idle(pool.idle);
  ps->set_in_use(pool.in_use);
  ps->set_waiting(pool.waiting);
  ps->set_exhaustion_count(pool.exhaustion_count);
  if (pool.exhaustion_count > 0) {
    MarkDegraded(report, "connection pool exhausted " + std::to_string(pool.exhaustion_count) + " times; consider a larger pool.size");
  }

  const auto limiter = limiter_->Snapshot();
  auto*      rs      = checks->mutable_rate_limiter();
  rs->set_max_ops(limiter.max_ops);
  rs->set_window_ms(static_cast<uint64_t>(limiter.window.count()));
  rs->set_current_usage(limiter.current_usage);
  rs->set_remaining(limiter.remaining);
  rs->set_utilization_percent(limiter.utilization_percent);
  rs->set_persistent(limiter.persistent);
  if (limiter.utilization_percent > options_.rate_limit_warning_percent) {
    MarkDegraded(report, "rate limit " + std::to_string(static_cast<int>(limiter.utilization_percent)) + "% utilized");
  }

  return report;
}

} // namespace projmem::core
