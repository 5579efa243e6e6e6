#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/util/errors.hpp"

namespace berth::engine {

// Span, request metrics and a failure log line around one facade call.
template <typename Fn>
auto ObserveCall(std::string_view route, std::string_view backend, Fn&& fn) {
  observability::CallSpan span(route, backend);

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, backend, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, backend, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    const char* kind = util::KindName(util::Classify(ex));
    span.Fail(kind, ex.what());
    BERTH_LOG_DEBUG("engine call failed", {observability::StringField("route", route), observability::StringField("backend", backend),
                                           observability::StringField("kind", kind), observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace berth::engine
