#pragma once

#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>

#include "berth/engine/v1/engine_service.grpc.pb.h"
#include "internal/engine/engine.hpp"

namespace berth::grpc {

/*
  EngineService adapter over a facade instance.

  When an identity token is configured every call must carry it in the
  x-berth-identity metadata.
*/
class EngineServer final : public berth::engine::v1::EngineService::Service {
public:
  EngineServer(std::shared_ptr<berth::engine::Engine> engine, std::string identity_token = {});

  ::grpc::Status HealthCheckRun(::grpc::ServerContext* ctx,
                                const berth::engine::v1::HealthCheckRequest* req,
                                berth::engine::v1::HealthCheckResults* resp) override;

  ::grpc::Status Events(::grpc::ServerContext* ctx,
                        const berth::engine::v1::EventsOptions* req,
                        ::grpc::ServerWriter<berth::engine::v1::Event>* writer) override;

  ::grpc::Status Info(::grpc::ServerContext* ctx,
                      const berth::engine::v1::InfoRequest* req,
                      berth::engine::v1::SystemInfo* resp) override;

  ::grpc::Status NetworkUpdate(::grpc::ServerContext* ctx,
                               const berth::engine::v1::NetworkUpdateRequest* req,
                               berth::engine::v1::NetworkUpdateResponse* resp) override;

  ::grpc::Status ImageUntag(::grpc::ServerContext* ctx,
                            const berth::engine::v1::ImageUntagRequest* req,
                            berth::engine::v1::ImageUntagResponse* resp) override;

  ::grpc::Status ImageInspect(::grpc::ServerContext* ctx,
                              const berth::engine::v1::ImageInspectRequest* req,
                              berth::engine::v1::ImageInspectResponse* resp) override;

  ::grpc::Status ArtifactPull(::grpc::ServerContext* ctx,
                              const berth::engine::v1::ArtifactPullRequest* req,
                              berth::engine::v1::ArtifactPullReport* resp) override;

private:
  ::grpc::Status Authenticate(const ::grpc::ServerContext* ctx) const;

  std::shared_ptr<berth::engine::Engine> engine_;
  std::string identity_token_;
};

}
