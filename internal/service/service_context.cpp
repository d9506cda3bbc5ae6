#include "service_context.hpp"

#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ratelimit/rate_limiter.hpp"

namespace projmem::service {

void ServiceContext::Shutdown() {
  if (limiter) limiter->Shutdown();
  if (pool) pool->Close();
  PROJMEM_LOG_INFO("Service context shut down", {observability::StringField("db_path", options.db_path)});
}

} // namespace projmem::service
