#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/metrics/provider.h>

#include <initializer_list>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace berth::observability {
namespace metrics_api = opentelemetry::metrics;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

} // namespace

/*
  Facade instruments. Every series carries the backend ("direct" or
  "remote") so the same route can be compared across modes.

    berth.request.count                 counter    route, backend, success
    berth.request.latency_ms            histogram  route, backend
    berth.events.duration_ms            histogram  backend
    berth.events.active_subscriptions   gauge      backend
*/
struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter>                  meter;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      stream_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   subscriptions;

  std::mutex                          mutex;
  std::map<std::string, std::int64_t> open_by_backend;

  static void ObserveSubscriptions(metrics_api::ObserverResult result, void* state) {
    auto* impl     = static_cast<Impl*>(state);
    auto  observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);

    std::lock_guard<std::mutex> lock(impl->mutex);
    for (const auto& [backend, open] : impl->open_by_backend) {
      observer->Observe(open, Attributes{{"backend", backend}});
    }
  }
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter      = metrics_api::Provider::GetMeterProvider()->GetMeter("berth.engine", BERTH_VERSION);
  impl_->requests   = impl_->meter->CreateUInt64Counter("berth.request.count", "Facade operations by route and backend", "1");
  impl_->latency_ms = impl_->meter->CreateDoubleHistogram("berth.request.latency_ms", "Facade operation latency", "ms");
  impl_->stream_ms  = impl_->meter->CreateDoubleHistogram("berth.events.duration_ms", "Lifetime of event subscriptions", "ms");
  impl_->subscriptions =
      impl_->meter->CreateInt64ObservableGauge("berth.events.active_subscriptions", "Open event subscriptions", "1");
  impl_->subscriptions->AddCallback(&Impl::ObserveSubscriptions, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, std::string_view backend, bool success) {
  const std::string r(route);
  const std::string b(backend);
  impl_->requests->Add(1, Attributes{{"route", r}, {"backend", b}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, std::string_view backend, double latency_ms) {
  const std::string r(route);
  const std::string b(backend);
  impl_->latency_ms->Record(latency_ms, Attributes{{"route", r}, {"backend", b}}, opentelemetry::context::Context{});
}

void Metrics::ObserveEventStreamDurationMs(std::string_view backend, double duration_ms) {
  const std::string b(backend);
  impl_->stream_ms->Record(duration_ms, Attributes{{"backend", b}}, opentelemetry::context::Context{});
}

void Metrics::AddActiveSubscriptions(std::string_view backend, std::int64_t delta) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->open_by_backend[std::string(backend)] += delta;
}

} // namespace berth::observability

#endif
