#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace {

using berth::observability::BoolField;
using berth::observability::IntField;
using berth::observability::StringField;

void TestFieldsAreQuotedWhenNeeded() {
  assert(berth::observability::FormatFields({}) == "");
  assert(berth::observability::FormatFields({StringField("name", "web"), IntField("pid", 42), BoolField("force", true)}) ==
         "name=web pid=42 force=true");
  assert(berth::observability::FormatFields({StringField("path", "/tmp/a b"), StringField("empty", "")}) == "path=\"/tmp/a b\" empty=\"\"");
  assert(berth::observability::FormatFields({StringField("error", "tag \"x\" not known")}) == "error=\"tag \\\"x\\\" not known\"");
  assert(berth::observability::FormatFields({StringField("filter", "event=start")}) == "filter=\"event=start\"");
}

void TestLoggerIsNamedAfterMode() {
  unsetenv("BERTH_LOG_LEVEL");
  unsetenv("BERTH_LOG_PATTERN");

  berth::config::EngineConfig config;
  config.set_mode(berth::config::ENGINE_MODE_REMOTE);
  config.mutable_logging()->set_level("debug");
  berth::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->name() == "berth-remote");
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  config.set_mode(berth::config::ENGINE_MODE_DIRECT);
  config.mutable_logging()->clear_level();
  berth::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->name() == "berth-direct");
  assert(spdlog::default_logger()->level() == spdlog::level::info);

  setenv("BERTH_LOG_LEVEL", "warn", 1);
  config.mutable_logging()->set_level("debug");
  berth::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::warn);
  unsetenv("BERTH_LOG_LEVEL");
}

void TestUnknownLevelIsRejected() {
  unsetenv("BERTH_LOG_LEVEL");

  berth::config::EngineConfig config;
  config.mutable_logging()->set_level("loud");
  std::string message;
  try {
    berth::observability::InitializeLogging(config);
  } catch (const berth::util::Internal& e) {
    message = e.what();
  }
  assert(message == "unknown log level \"loud\"");

  // "off" is a real level, not a parse failure.
  config.mutable_logging()->set_level("off");
  berth::observability::InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::off);
}

void TestLinesCarryFieldsAndRespectLevel() {
  std::ostringstream out;
  auto logger = std::make_shared<spdlog::logger>("capture", std::make_shared<spdlog::sinks::ostream_sink_mt>(out));
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  spdlog::set_default_logger(logger);

  BERTH_LOG_DEBUG("hidden", {StringField("k", "v")});
  BERTH_LOG_INFO("pulled artifact", {StringField("name", "quay.io/acme/model:v1"), StringField("note", "two words")});
  BERTH_LOG_WARN("plain");
  assert(out.str() == "pulled artifact name=quay.io/acme/model:v1 note=\"two words\"\nplain\n");
}

void TestNoTraceContextOutsideSpans() {
  assert(berth::observability::ActiveTraceContext().empty());

  berth::config::EngineConfig config;
  assert(!berth::observability::InitializeTelemetry(config));

  {
    berth::observability::CallSpan span("Engine.Info", "direct");
    span.Fail("not found", "no such container");
  }
  berth::observability::Metrics::Instance().RecordRequest("Engine.Info", "direct", true);
  berth::observability::ShutdownTelemetry();
}

} // namespace

int main() {
  TestFieldsAreQuotedWhenNeeded();
  TestLoggerIsNamedAfterMode();
  TestUnknownLevelIsRejected();
  TestLinesCarryFieldsAndRespectLevel();
  TestNoTraceContextOutsideSpans();

  std::cout << "berth_unit_logging: pass\n";
  return 0;
}
