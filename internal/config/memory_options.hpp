#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace projmem::config {

/*
  MemoryOptions

  Resolved, typed view of RuntimeConfig. Built once at startup by
  ResolveOptions() and never mutated afterwards; every component receives
  the fields it needs by value.
*/
struct MemoryOptions {
  // server
  std::string bind_address{"127.0.0.1:50061"};

  // store
  std::string db_path;
  std::string project_name;
  bool        read_only{false};
  bool        verify_integrity_on_start{true};

  // capacity
  uint64_t max_decisions{1000};
  uint64_t max_patterns{100};
  uint64_t max_context_keys{50};
  size_t   max_text_length{10000};
  double   capacity_warning_percent{90.0};

  // connection pool
  size_t                    pool_size{5};
  std::chrono::milliseconds acquire_timeout{std::chrono::seconds(5)};
  bool                      warm_up{true};
  std::chrono::milliseconds health_acquire_timeout{std::chrono::seconds(1)};

  // rate limiting
  uint32_t                  operations_per_window{100};
  std::chrono::milliseconds rate_window{std::chrono::seconds(60)};
  bool                      persist_rate_limit{false};

  // import guards
  uint64_t max_import_json_bytes{10 * 1024 * 1024};
  uint64_t max_import_decisions{10000};
  uint64_t max_import_patterns{1000};
  uint64_t max_import_context_keys{500};
};

/*
  Applies defaults, environment fallbacks for the store path and basic
  sanity checks. Throws std::invalid_argument on nonsensical values.
*/
MemoryOptions ResolveOptions(const projmem::runtime::config::RuntimeConfig& config);

// ~/.claude/project-memories/<project>.db, honouring $PROJECT_MEMORY_DB.
std::string DefaultDatabasePath(const std::string& project_name);

// Current directory name with everything outside [A-Za-z0-9_-] replaced by '_'.
std::string SanitizeProjectName(const std::string& raw);

} // namespace projmem::config
