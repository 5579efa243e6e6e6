#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace berth::config {
class EngineConfig;
}

namespace berth::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

/*
  Installs the default logger, named after the engine mode
  ("berth-direct", "berth-remote"), so lines from a client and its daemon
  can be told apart when they share a terminal.

  BERTH_LOG_LEVEL and BERTH_LOG_PATTERN override the config. An unknown
  level name throws util::Internal.
*/
void InitializeLogging(const berth::config::EngineConfig& config);
void ShutdownLogging();

// key=value pairs; values with spaces, quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace berth::observability

#define BERTH_LOG_DEBUG(message, ...) ::berth::observability::LogDebug((message), ##__VA_ARGS__)
#define BERTH_LOG_INFO(message, ...) ::berth::observability::LogInfo((message), ##__VA_ARGS__)
#define BERTH_LOG_WARN(message, ...) ::berth::observability::LogWarn((message), ##__VA_ARGS__)
#define BERTH_LOG_ERROR(message, ...) ::berth::observability::LogError((message), ##__VA_ARGS__)
