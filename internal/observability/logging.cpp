#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_set>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace ledger::observability {
namespace {

constexpr const char* kLoggerName     = "ledger";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct Settings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
  bool                      to_stdout = false;
  // set when the configured level name was not recognised
  std::string rejected_level;
};

// environment first, then the config file
std::string Pick(const char* env_name, const std::string& configured) {
  if (const char* value = std::getenv(env_name); value != nullptr && *value != '\0') return value;
  return configured;
}

Settings Resolve(const ledger::runtime::config::LoggingConfig& logging) {
  Settings settings;

  const std::string level = Pick("LEDGER_LOG_LEVEL", logging.level());
  if (!level.empty()) {
    // from_str maps unknown names to off, which would silence the daemon
    const auto parsed = spdlog::level::from_str(level);
    if (parsed != spdlog::level::off || level == "off") {
      settings.level = parsed;
    } else {
      settings.rejected_level = level;
    }
  }

  settings.pattern = Pick("LEDGER_LOG_PATTERN", logging.pattern());
  if (settings.pattern.empty()) settings.pattern = kDefaultPattern;

  settings.to_stdout = Pick("LEDGER_LOG_SINK", logging.sink()) == "stdout";
  return settings;
}

bool NeedsQuotes(const std::string& value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t' || c == '\n') return true;
  }
  return false;
}

// key=value pairs; values with blanks, '=' or quotes are double-quoted
void AppendFields(std::string* line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line->push_back(' ');
    line->append(field.key);
    line->push_back('=');
    if (!NeedsQuotes(field.value)) {
      line->append(field.value);
      continue;
    }
    line->push_back('"');
    for (char c : field.value) {
      if (c == '"' || c == '\\') line->push_back('\\');
      if (c == '\n') {
        line->append("\\n");
        continue;
      }
      line->push_back(c);
    }
    line->push_back('"');
  }
}

std::mutex                      g_once_mutex;
std::unordered_set<std::string> g_once_keys;

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

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  AppendFields(&line, fields);
  return line;
}

void InitializeLogging(const ledger::runtime::config::RuntimeConfig& config) {
  const Settings settings = Resolve(config.logging());

  // a second call (tests, reload) replaces the sink choice
  spdlog::drop(kLoggerName);
  auto logger = settings.to_stdout ? spdlog::stdout_color_mt(kLoggerName) : spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  if (!settings.rejected_level.empty()) {
    LogWarn("unknown log level, using info", {StringField("level", settings.rejected_level)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  // after ShutdownLogging there is no default logger
  if (logger == nullptr || !logger->should_log(level)) return;
  logger->log(level, "{}", FormatLine(message, fields));
}

bool LogOnce(spdlog::level::level_enum level, std::string_view key, std::string_view message,
             std::initializer_list<LogField> fields) {
  {
    std::lock_guard lock(g_once_mutex);
    if (!g_once_keys.emplace(key).second) return false;
  }
  Log(level, message, fields);
  return true;
}

} // namespace ledger::observability
