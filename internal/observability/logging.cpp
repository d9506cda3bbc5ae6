#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace projmem::observability {
namespace {

constexpr const char* kLoggerName = "project-memory";

std::string ResolveLevelName(const projmem::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("PROJMEM_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

// spdlog maps unknown names to "off"; only an explicit "off" silences the log
bool ParseLevel(const std::string& name, spdlog::level::level_enum& out) {
  out = spdlog::level::from_str(name);
  return out != spdlog::level::off || name == "off";
}

std::string ResolvePattern(const projmem::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("PROJMEM_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DurationField(std::string_view key, std::chrono::milliseconds value) {
  return {std::string(key), std::to_string(value.count()) + "ms"};
}

void InitializeLogging(const projmem::runtime::config::RuntimeConfig& config) {
  // tests and repeated initialization reuse the registered logger
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(ResolvePattern(config));

  const auto                name = ResolveLevelName(config);
  spdlog::level::level_enum level;
  const bool                known = ParseLevel(name, level);
  logger->set_level(known ? level : spdlog::level::info);

  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (!known) {
    PROJMEM_LOG_WARN("Unknown log level; using info", {StringField("level", name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace projmem::observability
