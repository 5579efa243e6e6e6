#include "direct_engine.hpp"

#include <chrono>

#include "internal/auth/registry_auth.hpp"
#include "internal/engine/observe_call.hpp"
#include "internal/util/errors.hpp"

namespace berth::direct {

using namespace berth::engine::v1;

namespace {

constexpr std::string_view kBackend = "direct";

} // namespace

DirectEngine::DirectEngine(RuntimeHandle handle) : handle_(std::move(handle)) {
  if (!handle_.runtime || !handle_.store) {
    throw util::Internal("direct engine requires a runtime and a store");
  }
}

runtime::Runtime& DirectEngine::Runtime() {
  if (shut_down_.load()) {
    throw util::Internal("engine has been shut down");
  }
  return *handle_.runtime;
}

HealthCheckResults DirectEngine::HealthCheckRun(const std::string& name_or_id, const HealthCheckOptions&) {
  return engine::ObserveCall("Engine.HealthCheckRun", kBackend, [&] {
    const auto outcome = Runtime().HealthCheck(name_or_id);
    if (outcome.error) {
      switch (outcome.status) {
        case runtime::HealthCheckStatus::kContainerNotFound:
          throw util::NotFound(*outcome.error);
        case runtime::HealthCheckStatus::kNotDefined:
        case runtime::HealthCheckStatus::kContainerStopped:
          throw util::Conflict(*outcome.error);
        default:
          throw util::Internal(*outcome.error);
      }
    }

    HealthCheckResults results;
    results.set_status(runtime::HealthCheckStatusString(outcome.status));
    return results;
  });
}

AutoUpdateResponse DirectEngine::AutoUpdate(const AutoUpdateOptions& options) {
  return engine::ObserveCall("Engine.AutoUpdate", kBackend, [&] {
    auth::RegistryCredentials credentials;
    try {
      credentials = auth::ResolveCredentials(auth::SystemContext{options.authfile()}, {}, {});
    } catch (const std::exception& e) {
      AutoUpdateResponse response;
      *response.add_errors() = util::ToUnitError("auto-update", e);
      return response;
    }
    return Runtime().AutoUpdate(options, credentials);
  });
}

void DirectEngine::Events(const EventsOptions& options, const engine::EventSink& sink, std::stop_token stop) {
  engine::ObserveCall("Engine.Events", kBackend, [&] {
    auto& metrics = observability::Metrics::Instance();
    metrics.AddActiveSubscriptions(kBackend, 1);
    const auto started_at = std::chrono::steady_clock::now();

    runtime::EventStreamEnd end;
    try {
      end = Runtime().Events(options, sink, std::move(stop));
    } catch (...) {
      metrics.AddActiveSubscriptions(kBackend, -1);
      throw;
    }
    metrics.AddActiveSubscriptions(kBackend, -1);
    metrics.ObserveEventStreamDurationMs(kBackend,
                                         std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

    if (end == runtime::EventStreamEnd::kClosed) {
      throw util::StreamClosed("event stream closed by the runtime");
    }
  });
}

SystemInfo DirectEngine::Info() {
  return engine::ObserveCall("Engine.Info", kBackend, [&] { return Runtime().Info(); });
}

void DirectEngine::NetworkUpdate(const std::string& name, const NetworkUpdateOptions& options) {
  engine::ObserveCall("Engine.NetworkUpdate", kBackend, [&] { Runtime().NetworkUpdate(name, options); });
}

void DirectEngine::ImageUntag(const std::string& name_or_id, const std::vector<std::string>& tags) {
  engine::ObserveCall("Engine.ImageUntag", kBackend, [&] { Runtime().ImageUntag(name_or_id, tags); });
}

ImageInspectResponse DirectEngine::ImageInspect(const std::vector<std::string>& names) {
  return engine::ObserveCall("Engine.ImageInspect", kBackend, [&] { return Runtime().ImageInspect(names); });
}

ArtifactPullReport DirectEngine::ArtifactPull(const std::string& name, const ArtifactPullOptions& options) {
  return engine::ObserveCall("Engine.ArtifactPull", kBackend, [&] {
    const auto credentials = auth::ResolveCredentials(auth::SystemContext{options.authfile()}, options.username(), options.password());
    return Runtime().ArtifactPull(name, options, credentials);
  });
}

ShowTrustReport DirectEngine::ShowTrust(const ShowTrustOptions& options) {
  return engine::ObserveCall("Engine.ShowTrust", kBackend, [&] { return Runtime().ShowTrust(options); });
}

void DirectEngine::SetTrust(const std::string& scope, const SetTrustOptions& options) {
  engine::ObserveCall("Engine.SetTrust", kBackend, [&] { Runtime().SetTrust(scope, options); });
}

void DirectEngine::Shutdown() {
  shut_down_.store(true);
}

} // namespace berth::direct
