#pragma once

#include <memory>

#include "berth/engine/v1/engine_service.grpc.pb.h"
#include "internal/auth/registry_auth.hpp"
#include "internal/engine/capability_table.hpp"
#include "internal/engine/engine.hpp"
#include "internal/remote/client_context.hpp"

namespace berth::remote {

/*
  Facade bound to a remote engine over EngineService.

  The capability table is consulted before any transport work: an
  unsupported operation never reaches the wire. Concurrent calls share
  the channel; each call carries its own cancellation scope.

  AutoUpdate, ShowTrust and SetTrust have no RPC in this protocol
  version: the constructor throws util::Internal for a table that
  declares any of them supported. Their declared reason is what callers
  see.
*/
class RemoteEngine final : public engine::Engine {
 public:
  explicit RemoteEngine(std::shared_ptr<ClientContext> context,
                        engine::CapabilityTable        capabilities = engine::CapabilityTable::RemoteProtocol());

  engine::EngineMode Mode() const override {
    return engine::EngineMode::kRemote;
  }

  engine::v1::HealthCheckResults HealthCheckRun(const std::string& name_or_id, const engine::v1::HealthCheckOptions& options) override;
  engine::v1::AutoUpdateResponse AutoUpdate(const engine::v1::AutoUpdateOptions& options) override;
  void Events(const engine::v1::EventsOptions& options, const engine::EventSink& sink, std::stop_token stop) override;
  engine::v1::SystemInfo Info() override;
  void NetworkUpdate(const std::string& name, const engine::v1::NetworkUpdateOptions& options) override;
  void ImageUntag(const std::string& name_or_id, const std::vector<std::string>& tags) override;
  engine::v1::ImageInspectResponse ImageInspect(const std::vector<std::string>& names) override;
  engine::v1::ArtifactPullReport ArtifactPull(const std::string& name, const engine::v1::ArtifactPullOptions& options) override;
  engine::v1::ShowTrustReport ShowTrust(const engine::v1::ShowTrustOptions& options) override;
  void SetTrust(const std::string& scope, const engine::v1::SetTrustOptions& options) override;
  void Shutdown() override;

  const engine::CapabilityTable& Capabilities() const {
    return capabilities_;
  }

 private:
  template <typename Request, typename Response>
  using UnaryMethod = ::grpc::Status (engine::v1::EngineService::StubInterface::*)(::grpc::ClientContext*, const Request&, Response*);

  template <typename Request, typename Response>
  Response Unary(UnaryMethod<Request, Response> method, const Request& request, const auth::Headers& headers = {});

  std::shared_ptr<ClientContext>                                  context_;
  std::unique_ptr<engine::v1::EngineService::StubInterface>       stub_;
  engine::CapabilityTable                                         capabilities_;
};

} // namespace berth::remote
