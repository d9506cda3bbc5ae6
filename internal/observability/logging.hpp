#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace projmem::runtime::config {
class RuntimeConfig;
}

namespace projmem::observability {

// Rendered as key=value after the message.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DurationField(std::string_view key, std::chrono::milliseconds value);

/*
  Registers the "project-memory" logger as spdlog's default.

  PROJMEM_LOG_LEVEL / PROJMEM_LOG_PATTERN override logging.level /
  logging.pattern. An unrecognised level falls back to info.
*/
void InitializeLogging(const projmem::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace projmem::observability

#define PROJMEM_LOG_INFO(message, ...) ::projmem::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define PROJMEM_LOG_WARN(message, ...) ::projmem::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define PROJMEM_LOG_ERROR(message, ...) ::projmem::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
