#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace berth::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace trace_api   = opentelemetry::trace;
namespace metrics_api = opentelemetry::metrics;
namespace sdktrace    = opentelemetry::sdk::trace;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

constexpr char kScope[] = "berth.engine";

std::mutex                                 g_mutex;
std::shared_ptr<sdktrace::TracerProvider>  g_tracer_provider;
std::shared_ptr<sdkmetrics::MeterProvider> g_meter_provider;

// Where one signal goes. The per-signal OTEL_* variable is used verbatim;
// a base endpoint gets the signal path appended for OTLP/HTTP.
struct Destination {
  bool        http{false};
  std::string endpoint;
};

Destination Resolve(const berth::config::ObservabilityConfig& config, const char* signal_variable, const char* http_path) {
  Destination out;
  out.http = config.transport() == berth::config::OTLP_TRANSPORT_HTTP;

  if (const char* exact = std::getenv(signal_variable); exact != nullptr && config.otlp_endpoint().empty()) {
    out.endpoint = exact;
    return out;
  }

  std::string base = config.otlp_endpoint();
  if (base.empty()) {
    const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT");
    base               = shared != nullptr ? shared : (out.http ? "http://localhost:4318" : "localhost:4317");
  }
  if (out.http) {
    while (!base.empty() && base.back() == '/') {
      base.pop_back();
    }
    base += http_path;
  }
  out.endpoint = std::move(base);
  return out;
}

resource::Resource BuildResource(const berth::config::EngineConfig& config) {
  const bool remote = config.mode() == berth::config::ENGINE_MODE_REMOTE;
  const resource::ResourceAttributes attributes = {
      {"service.name", remote ? "berth-remote" : "berth-direct"},
      {"service.version", BERTH_VERSION},
      {"berth.mode", remote ? "remote" : "direct"},
  };
  return resource::Resource::Create(attributes);
}

std::shared_ptr<sdktrace::TracerProvider> StartTracing(const berth::config::EngineConfig& config, const resource::Resource& res) {
  const auto destination = Resolve(config.observability(), "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "/v1/traces");

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (destination.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = destination.endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint = destination.endpoint;
    exporter         = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = std::make_shared<sdktrace::TracerProvider>(std::move(processor), res);
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));
  return provider;
}

std::shared_ptr<sdkmetrics::MeterProvider> StartMetrics(const berth::config::EngineConfig& config, const resource::Resource& res) {
  const auto destination = Resolve(config.observability(), "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (destination.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = destination.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = destination.endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto interval_ms = config.observability().collection_interval_ms();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms > 0 ? interval_ms : 1000);
  reader_options.export_timeout_millis  = std::min(reader_options.export_interval_millis, std::chrono::milliseconds(500));

  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), res);
  provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(provider));
  return provider;
}

std::string Hex(const trace_api::TraceId& id) {
  char buffer[2 * trace_api::TraceId::kSize];
  id.ToLowerBase16(buffer);
  return std::string(buffer, sizeof(buffer));
}

std::string Hex(const trace_api::SpanId& id) {
  char buffer[2 * trace_api::SpanId::kSize];
  id.ToLowerBase16(buffer);
  return std::string(buffer, sizeof(buffer));
}

} // namespace

bool InitializeTelemetry(const berth::config::EngineConfig& config) {
  ShutdownTelemetry();

  const auto& observability = config.observability();
  if (!observability.tracing_enabled() && !observability.metrics_enabled()) {
    return false;
  }

  const auto                  res = BuildResource(config);
  std::lock_guard<std::mutex> lock(g_mutex);
  if (observability.tracing_enabled()) {
    g_tracer_provider = StartTracing(config, res);
  }
  if (observability.metrics_enabled()) {
    g_meter_provider = StartMetrics(config, res);
  }
  return true;
}

void ShutdownTelemetry() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_tracer_provider) {
    g_tracer_provider->ForceFlush();
    g_tracer_provider->Shutdown();
    g_tracer_provider.reset();
  }
  if (g_meter_provider) {
    g_meter_provider->ForceFlush();
    g_meter_provider->Shutdown();
    g_meter_provider.reset();
  }
}

std::string ActiveTraceContext() {
  const auto context = trace_api::Tracer::GetCurrentSpan()->GetContext();
  if (!context.IsValid()) {
    return {};
  }
  return "trace_id=" + Hex(context.trace_id()) + " span_id=" + Hex(context.span_id());
}

struct CallSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

CallSpan::CallSpan(std::string_view route, std::string_view backend) : impl_(std::make_unique<Impl>()) {
  auto tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kScope, BERTH_VERSION);

  trace_api::StartSpanOptions options;
  options.kind = backend == "remote" ? trace_api::SpanKind::kClient : trace_api::SpanKind::kInternal;

  const std::string route_name(route);
  const std::string backend_name(backend);
  impl_->span  = tracer->StartSpan(route_name, {{"berth.route", route_name}, {"berth.backend", backend_name}}, options);
  impl_->scope = std::make_unique<trace_api::Scope>(impl_->span);
}

CallSpan::~CallSpan() {
  impl_->scope.reset();
  impl_->span->End();
}

void CallSpan::Fail(std::string_view kind, std::string_view message) {
  const std::string text(message);
  impl_->span->SetAttribute("berth.error_kind", std::string(kind));
  impl_->span->AddEvent("exception", {{"exception.message", text}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, text);
}

} // namespace berth::observability

#endif
