#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace reaper::runtime::config {
class RuntimeConfig;
}

namespace reaper::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the process logger. REAPER_LOG_LEVEL and REAPER_LOG_PATTERN
  in the environment win over the `logging` section of the config.
*/
void InitializeLogging(const reaper::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace reaper::observability

#define REAPER_LOG_DEBUG(message, ...) ::reaper::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define REAPER_LOG_INFO(message, ...) ::reaper::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define REAPER_LOG_WARN(message, ...) ::reaper::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define REAPER_LOG_ERROR(message, ...) ::reaper::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
