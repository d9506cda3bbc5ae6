#include "internal/config/config_loader.hpp"
#include "internal/config/memory_options.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "project_memory_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigResolves() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50070"
store:
  path: "/tmp/project-memory/full.db"
  project_name: "demo project"
  read_only: false
  verify_integrity_on_start: false
limits:
  max_decisions: 250
  max_patterns: 20
  max_context_keys: 10
  max_text_length: 2000
  capacity_warning_percent: 75
pool:
  size: 3
  acquire_timeout: 2s
  warm_up: false
  health_acquire_timeout: 0.5s
rate_limit:
  operations_per_minute: 40
  window: 30s
  persist: true
import_limits:
  max_json_bytes: 1048576
  max_decisions: 500
logging:
  level: debug
)");

  const auto config = projmem::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50070");
  assert(config.logging().level() == "debug");

  const auto opts = projmem::config::ResolveOptions(config);
  assert(opts.bind_address == "0.0.0.0:50070");
  assert(opts.db_path == "/tmp/project-memory/full.db");
  assert(opts.project_name == "demo_project");
  assert(!opts.read_only);
  assert(!opts.verify_integrity_on_start);

  assert(opts.max_decisions == 250);
  assert(opts.max_patterns == 20);
  assert(opts.max_context_keys == 10);
  assert(opts.max_text_length == 2000);
  assert(opts.capacity_warning_percent == 75.0);

  assert(opts.pool_size == 3);
  assert(opts.acquire_timeout == std::chrono::seconds(2));
  assert(!opts.warm_up);
  assert(opts.health_acquire_timeout == std::chrono::milliseconds(500));

  assert(opts.operations_per_window == 40);
  assert(opts.rate_window == std::chrono::seconds(30));
  assert(opts.persist_rate_limit);

  assert(opts.max_import_json_bytes == 1048576);
  assert(opts.max_import_decisions == 500);
  assert(opts.max_import_patterns == 1000);
}

void TestEmptyDocumentUsesDefaults() {
  const auto config = projmem::config::ConfigLoader::LoadFromYamlString("");

  const auto opts = projmem::config::ResolveOptions(config);
  assert(opts.bind_address == "127.0.0.1:50061");
  assert(opts.max_decisions == 1000);
  assert(opts.max_patterns == 100);
  assert(opts.max_context_keys == 50);
  assert(opts.max_text_length == 10000);
  assert(opts.pool_size == 5);
  assert(opts.operations_per_window == 100);
  assert(opts.rate_window == std::chrono::seconds(60));
  assert(!opts.read_only);
  assert(!opts.project_name.empty());
  assert(!opts.db_path.empty());
}

void TestDefaultPathHonoursEnvironment() {
  setenv("PROJECT_MEMORY_DB", "/tmp/project-memory/from-env.db", 1);
  assert(projmem::config::DefaultDatabasePath("anything") == "/tmp/project-memory/from-env.db");

  unsetenv("PROJECT_MEMORY_DB");
  setenv("HOME", "/home/tester", 1);
  assert(projmem::config::DefaultDatabasePath("my/app") == "/home/tester/.claude/project-memories/my_app.db");
}

void TestProjectNameSanitized() {
  assert(projmem::config::SanitizeProjectName("web-app_2") == "web-app_2");
  assert(projmem::config::SanitizeProjectName("../etc") == "___etc");
  assert(projmem::config::SanitizeProjectName("") == "default");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)projmem::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestNonsensicalLimitsAreRejected() {
  const auto config = projmem::config::ConfigLoader::LoadFromYamlString(R"(limits:
  max_decisions: 0
)");

  bool threw = false;
  try {
    (void)projmem::config::ResolveOptions(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  const auto bad_percent = projmem::config::ConfigLoader::LoadFromYamlString(R"(limits:
  capacity_warning_percent: 150
)");

  threw = false;
  try {
    (void)projmem::config::ResolveOptions(bad_percent);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    (void)projmem::config::ConfigLoader::LoadFromYaml("/nonexistent/project-memory.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestLogLevelFromConfig() {
  unsetenv("PROJMEM_LOG_LEVEL");

  projmem::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  projmem::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  // a typo must not silence the log
  config.mutable_logging()->set_level("verbose");
  projmem::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  config.mutable_logging()->set_level("off");
  projmem::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::off);

  setenv("PROJMEM_LOG_LEVEL", "warn", 1);
  projmem::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::warn);
  unsetenv("PROJMEM_LOG_LEVEL");
}

} // namespace

int main() {
  TestFullConfigResolves();
  TestEmptyDocumentUsesDefaults();
  TestDefaultPathHonoursEnvironment();
  TestProjectNameSanitized();
  TestUnknownFieldsAreRejected();
  TestNonsensicalLimitsAreRejected();
  TestMissingFileFails();
  TestLogLevelFromConfig();

  std::cout << "project_memory_unit_config_loader: pass\n";
  return 0;
}
