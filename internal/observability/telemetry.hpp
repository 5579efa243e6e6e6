#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace berth::config {
class EngineConfig;
}

namespace berth::observability {

/*
  Process-wide OTLP export, driven by EngineConfig.observability.

  Traces and metrics share one resource whose service.name is
  "berth-direct" or "berth-remote", so spans of the two backends land in
  separate services. Returns true when at least one signal is exported.
  Without ENABLE_OTEL everything here is a no-op.
*/
bool InitializeTelemetry(const berth::config::EngineConfig& config);
void ShutdownTelemetry();

// "trace_id=<hex> span_id=<hex>" for the active span, empty without one.
std::string ActiveTraceContext();

// Active span around one facade call, tagged with route and backend.
// Remote calls are client spans, direct calls internal ones.
class CallSpan {
 public:
  CallSpan(std::string_view route, std::string_view backend);
  ~CallSpan();

  CallSpan(const CallSpan&)            = delete;
  CallSpan& operator=(const CallSpan&) = delete;

  void Fail(std::string_view kind, std::string_view message);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, std::string_view backend, bool success);
  void ObserveRequestLatencyMs(std::string_view route, std::string_view backend, double latency_ms);
  void ObserveEventStreamDurationMs(std::string_view backend, double duration_ms);
  void AddActiveSubscriptions(std::string_view backend, std::int64_t delta);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTelemetry(const berth::config::EngineConfig&) {
  return false;
}

inline void ShutdownTelemetry() {
}

inline std::string ActiveTraceContext() {
  return {};
}

inline CallSpan::CallSpan(std::string_view, std::string_view) {
}

inline CallSpan::~CallSpan() {
}

inline void CallSpan::Fail(std::string_view, std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, std::string_view, double) {
}

inline void Metrics::ObserveEventStreamDurationMs(std::string_view, double) {
}

inline void Metrics::AddActiveSubscriptions(std::string_view, std::int64_t) {
}
#endif

} // namespace berth::observability
