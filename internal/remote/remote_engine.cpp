#include "remote_engine.hpp"

#include <chrono>

#include "internal/engine/observe_call.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/protocol.hpp"
#include "internal/util/errors.hpp"

namespace berth::remote {

using namespace berth::engine::v1;
using engine::Operation;

namespace {

constexpr std::string_view kBackend = "remote";

// Operations with no RPC in this protocol version.
constexpr Operation kNoProcedure[] = {Operation::kAutoUpdate, Operation::kShowTrust, Operation::kSetTrust};

std::string ReasonFor(const engine::CapabilityTable& capabilities, Operation op) {
  return capabilities.UnsupportedReason(op).value_or(engine::CapabilityTable::kNotImplemented);
}

} // namespace

RemoteEngine::RemoteEngine(std::shared_ptr<ClientContext> context, engine::CapabilityTable capabilities)
    : context_(std::move(context)), capabilities_(std::move(capabilities)) {
  if (!context_) {
    throw util::Internal("remote engine requires a client context");
  }
  for (const auto op : kNoProcedure) {
    if (capabilities_.Supports(op)) {
      throw util::Internal(std::string(engine::OperationName(op)) + " has no remote procedure and cannot be declared supported");
    }
  }
  stub_ = EngineService::NewStub(context_->Channel());
}

template <typename Request, typename Response>
Response RemoteEngine::Unary(UnaryMethod<Request, Response> method, const Request& request, const auth::Headers& headers) {
  BERTH_LOG_DEBUG("remote call", {observability::StringField("target", context_->Target()),
                                  observability::StringField("params", DescribeParams(ToParams(request)))});

  auto scope = context_->NewCall();
  for (const auto& [key, value] : headers) {
    scope->Context().AddMetadata(key, value);
  }

  Response   response;
  const auto status = (stub_.get()->*method)(&scope->Context(), request, &response);
  if (!status.ok()) {
    if (scope->CancelledByClose()) {
      throw util::TransportFailure("connection to " + context_->Target() + " closed during call");
    }
    RaiseStatus(status);
  }
  return response;
}

HealthCheckResults RemoteEngine::HealthCheckRun(const std::string& name_or_id, const HealthCheckOptions& options) {
  return engine::ObserveCall("Engine.HealthCheckRun", kBackend, [&] {
    capabilities_.Require(Operation::kHealthCheckRun);
    HealthCheckRequest request;
    request.set_name_or_id(name_or_id);
    *request.mutable_options() = options;
    return Unary(&EngineService::StubInterface::HealthCheckRun, request);
  });
}

AutoUpdateResponse RemoteEngine::AutoUpdate(const AutoUpdateOptions&) {
  return engine::ObserveCall("Engine.AutoUpdate", kBackend, [&] {
    AutoUpdateResponse response;
    auto*              error = response.add_errors();
    error->set_unit("auto-update");
    error->set_kind(ERROR_KIND_UNSUPPORTED);
    error->set_message(ReasonFor(capabilities_, Operation::kAutoUpdate));
    return response;
  });
}

void RemoteEngine::Events(const EventsOptions& options, const engine::EventSink& sink, std::stop_token stop) {
  engine::ObserveCall("Engine.Events", kBackend, [&] {
    capabilities_.Require(Operation::kEvents);

    auto scope = context_->NewCall(std::move(stop));
    if (scope->CancelledByCaller()) {
      return;
    }

    auto& metrics = observability::Metrics::Instance();
    metrics.AddActiveSubscriptions(kBackend, 1);
    const auto started_at = std::chrono::steady_clock::now();
    auto       finish     = [&] {
      metrics.AddActiveSubscriptions(kBackend, -1);
      metrics.ObserveEventStreamDurationMs(kBackend,
                                           std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    };

    auto  reader = stub_->Events(&scope->Context(), options);
    Event event;
    try {
      while (reader->Read(&event)) {
        sink(event);
      }
    } catch (...) {
      scope->Context().TryCancel();
      (void)reader->Finish();
      finish();
      throw;
    }
    const auto status = reader->Finish();
    finish();

    if (status.ok() || scope->CancelledByCaller()) {
      return;
    }
    if (scope->CancelledByClose()) {
      throw util::TransportFailure("connection to " + context_->Target() + " closed during event stream");
    }
    RaiseStatus(status);
  });
}

SystemInfo RemoteEngine::Info() {
  return engine::ObserveCall("Engine.Info", kBackend, [&] {
    capabilities_.Require(Operation::kInfo);
    return Unary(&EngineService::StubInterface::Info, InfoRequest{});
  });
}

void RemoteEngine::NetworkUpdate(const std::string& name, const NetworkUpdateOptions& options) {
  engine::ObserveCall("Engine.NetworkUpdate", kBackend, [&] {
    capabilities_.Require(Operation::kNetworkUpdate);
    NetworkUpdateRequest request;
    request.set_name(name);
    *request.mutable_options() = options;
    (void)Unary(&EngineService::StubInterface::NetworkUpdate, request);
  });
}

void RemoteEngine::ImageUntag(const std::string& name_or_id, const std::vector<std::string>& tags) {
  engine::ObserveCall("Engine.ImageUntag", kBackend, [&] {
    capabilities_.Require(Operation::kImageUntag);
    ImageUntagRequest request;
    request.set_name_or_id(name_or_id);
    for (const auto& tag : tags) {
      request.add_tags(tag);
    }
    (void)Unary(&EngineService::StubInterface::ImageUntag, request);
  });
}

ImageInspectResponse RemoteEngine::ImageInspect(const std::vector<std::string>& names) {
  return engine::ObserveCall("Engine.ImageInspect", kBackend, [&] {
    capabilities_.Require(Operation::kImageInspect);
    ImageInspectRequest request;
    for (const auto& name : names) {
      request.add_names(name);
    }
    return Unary(&EngineService::StubInterface::ImageInspect, request);
  });
}

ArtifactPullReport RemoteEngine::ArtifactPull(const std::string& name, const ArtifactPullOptions& options) {
  return engine::ObserveCall("Engine.ArtifactPull", kBackend, [&] {
    capabilities_.Require(Operation::kArtifactPull);
    auth::Headers headers;
    const auto    request = EncodeArtifactPull(name, options, &headers);
    return Unary(&EngineService::StubInterface::ArtifactPull, request, headers);
  });
}

ShowTrustReport RemoteEngine::ShowTrust(const ShowTrustOptions&) {
  return engine::ObserveCall("Engine.ShowTrust", kBackend, [&]() -> ShowTrustReport {
    throw util::Unsupported(ReasonFor(capabilities_, Operation::kShowTrust));
  });
}

void RemoteEngine::SetTrust(const std::string&, const SetTrustOptions&) {
  engine::ObserveCall("Engine.SetTrust", kBackend, [&] {
    throw util::Unsupported(ReasonFor(capabilities_, Operation::kSetTrust));
  });
}

void RemoteEngine::Shutdown() {
  context_->Close();
}

} // namespace berth::remote
