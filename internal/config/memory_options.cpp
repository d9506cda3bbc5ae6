#include "memory_options.hpp"

#include <google/protobuf/util/time_util.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace projmem::config {

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(d));
}

void RequirePositive(uint64_t value, const char* name) {
  if (value == 0) {
    throw std::invalid_argument(std::string(name) + " must be greater than zero");
  }
}

} // namespace

std::string SanitizeProjectName(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    out.push_back(std::isalnum(c) || c == '_' || c == '-' ? static_cast<char>(c) : '_');
  }
  return out.empty() ? "default" : out;
}

std::string DefaultDatabasePath(const std::string& project_name) {
  if (const char* custom = std::getenv("PROJECT_MEMORY_DB"); custom && *custom) {
    return custom;
  }

  std::filesystem::path home;
  if (const char* env_home = std::getenv("HOME"); env_home && *env_home) {
    home = env_home;
  } else {
    home = std::filesystem::temp_directory_path();
  }

  return (home / ".claude" / "project-memories" / (SanitizeProjectName(project_name) + ".db")).string();
}

MemoryOptions ResolveOptions(const projmem::runtime::config::RuntimeConfig& config) {
  MemoryOptions opts;

  if (!config.server().bind_address().empty()) {
    opts.bind_address = config.server().bind_address();
  }

  // ------------------------------------------------------------
  // store
  // ------------------------------------------------------------
  const auto& store = config.store();
  opts.project_name = store.project_name().empty() ? std::filesystem::current_path().filename().string() : store.project_name();
  opts.project_name = SanitizeProjectName(opts.project_name);
  opts.db_path      = store.path().empty() ? DefaultDatabasePath(opts.project_name) : store.path();
  if (store.has_read_only()) opts.read_only = store.read_only();
  if (store.has_verify_integrity_on_start()) opts.verify_integrity_on_start = store.verify_integrity_on_start();

  // ------------------------------------------------------------
  // limits
  // ------------------------------------------------------------
  const auto& limits = config.limits();
  if (limits.has_max_decisions()) opts.max_decisions = limits.max_decisions();
  if (limits.has_max_patterns()) opts.max_patterns = limits.max_patterns();
  if (limits.has_max_context_keys()) opts.max_context_keys = limits.max_context_keys();
  if (limits.has_max_text_length()) opts.max_text_length = limits.max_text_length();
  if (limits.has_capacity_warning_percent()) opts.capacity_warning_percent = limits.capacity_warning_percent();

  RequirePositive(opts.max_decisions, "limits.max_decisions");
  RequirePositive(opts.max_patterns, "limits.max_patterns");
  RequirePositive(opts.max_context_keys, "limits.max_context_keys");
  RequirePositive(opts.max_text_length, "limits.max_text_length");
  if (opts.capacity_warning_percent <= 0.0 || opts.capacity_warning_percent > 100.0) {
    throw std::invalid_argument("limits.capacity_warning_percent must be in (0, 100]");
  }

  // ------------------------------------------------------------
  // pool
  // ------------------------------------------------------------
  const auto& pool = config.pool();
  if (pool.has_size()) opts.pool_size = pool.size();
  if (pool.has_acquire_timeout()) opts.acquire_timeout = ToMillis(pool.acquire_timeout());
  if (pool.has_warm_up()) opts.warm_up = pool.warm_up();
  if (pool.has_health_acquire_timeout()) opts.health_acquire_timeout = ToMillis(pool.health_acquire_timeout());

  RequirePositive(opts.pool_size, "pool.size");
  if (opts.acquire_timeout.count() < 0 || opts.health_acquire_timeout.count() < 0) {
    throw std::invalid_argument("pool timeouts must not be negative");
  }

  // ------------------------------------------------------------
  // rate limit
  // ------------------------------------------------------------
  const auto& rate = config.rate_limit();
  if (rate.has_operations_per_minute()) opts.operations_per_window = rate.operations_per_minute();
  if (rate.has_window()) opts.rate_window = ToMillis(rate.window());
  if (rate.has_persist()) opts.persist_rate_limit = rate.persist();

  RequirePositive(opts.operations_per_window, "rate_limit.operations_per_minute");
  if (opts.rate_window.count() <= 0) {
    throw std::invalid_argument("rate_limit.window must be positive");
  }

  // ------------------------------------------------------------
  // import guards
  // ------------------------------------------------------------
  const auto& imports = config.import_limits();
  if (imports.has_max_json_bytes()) opts.max_import_json_bytes = imports.max_json_bytes();
  if (imports.has_max_decisions()) opts.max_import_decisions = imports.max_decisions();
  if (imports.has_max_patterns()) opts.max_import_patterns = imports.max_patterns();
  if (imports.has_max_context_keys()) opts.max_import_context_keys = imports.max_context_keys();

  RequirePositive(opts.max_import_json_bytes, "import_limits.max_json_bytes");

  return opts;
}

} // namespace projmem::config
