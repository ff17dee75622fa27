#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace reaper::observability {
namespace {

constexpr const char* kLoggerName     = "replica-reaper";
constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [t%t] %v";

std::string FirstSet(const char* env_var, const std::string& configured, const char* fallback) {
  if (const char* from_env = std::getenv(env_var); from_env && *from_env) return from_env;
  if (!configured.empty()) return configured;
  return fallback;
}

// Values with blanks are quoted so `key=value` pairs stay splittable.
void AppendField(fmt::memory_buffer& out, const LogField& field) {
  const bool quote = field.value.empty() || field.value.find(' ') != std::string::npos;
  if (quote) {
    fmt::format_to(std::back_inserter(out), " {}=\"{}\"", field.key, field.value);
  } else {
    fmt::format_to(std::back_inserter(out), " {}={}", field.key, field.value);
  }
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

void InitializeLogging(const reaper::runtime::config::RuntimeConfig& config) {
  const auto level_name = FirstSet("REAPER_LOG_LEVEL", config.logging().level(), kDefaultLevel);
  const auto pattern    = FirstSet("REAPER_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto level = spdlog::level::from_str(level_name);
  // from_str maps unknown names to off; a typo must not silence the daemon
  const bool unknown_level = level == spdlog::level::off && level_name != "off";
  if (unknown_level) level = spdlog::level::info;

  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (unknown_level) {
    Log(spdlog::level::warn, "unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  for (const auto& field : fields) AppendField(line, field);

  spdlog::log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace reaper::observability
