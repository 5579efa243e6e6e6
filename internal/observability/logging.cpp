#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace berth::observability {
namespace {

constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z %n [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

std::string FromEnvOr(const char* variable, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(variable)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps every unknown name to off.
  if (level == spdlog::level::off && name != "off") {
    throw util::Internal("unknown log level \"" + name + "\"");
  }
  return level;
}

bool NeedsQuotes(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuotes(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out.append("\\n");
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
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

void InitializeLogging(const berth::config::EngineConfig& config) {
  const auto level   = ParseLevel(FromEnvOr("BERTH_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = FromEnvOr("BERTH_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);
  const auto name    = config.mode() == berth::config::ENGINE_MODE_REMOTE ? "berth-remote" : "berth-direct";

  auto logger = spdlog::get(name);
  if (!logger) {
    logger = spdlog::stderr_color_mt(name);
  }
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_trace_context.store(config.logging().include_trace_context());
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  const auto  formatted = FormatFields(fields);
  if (!formatted.empty()) {
    line.push_back(' ');
    line.append(formatted);
  }
  if (g_trace_context.load()) {
    const auto trace = ActiveTraceContext();
    if (!trace.empty()) {
      line.push_back(' ');
      line.append(trace);
    }
  }
  logger->log(level, "{}", line);
}

} // namespace berth::observability
