#include "engine_server.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "grpc_error.hpp"
#include "internal/auth/registry_auth.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/client_context.hpp"

namespace berth::grpc {

using namespace berth::engine::v1;

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(50);

std::string Metadata(const ::grpc::ServerContext* ctx, const char* key) {
  const auto& metadata = ctx->client_metadata();
  auto it = metadata.find(key);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

}

EngineServer::EngineServer(std::shared_ptr<berth::engine::Engine> engine, std::string identity_token)
    : engine_(std::move(engine)), identity_token_(std::move(identity_token)) {}

::grpc::Status EngineServer::Authenticate(const ::grpc::ServerContext* ctx) const {
  if (identity_token_.empty() || Metadata(ctx, berth::remote::kIdentityMetadata) == identity_token_) {
    return ::grpc::Status::OK;
  }
  BERTH_LOG_WARN("rejected call with invalid identity", {observability::StringField("peer", ctx->peer())});
  return {::grpc::StatusCode::UNAUTHENTICATED, "invalid identity"};
}

::grpc::Status EngineServer::HealthCheckRun(::grpc::ServerContext* ctx,
                                            const HealthCheckRequest* req,
                                            HealthCheckResults* resp) {
  if (auto status = Authenticate(ctx); !status.ok()) return status;
  try {
    *resp = engine_->HealthCheckRun(req->name_or_id(), req->options());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EngineServer::Events(::grpc::ServerContext* ctx,
                                    const EventsOptions* req,
                                    ::grpc::ServerWriter<Event>* writer) {
  if (auto status = Authenticate(ctx); !status.ok()) return status;

  std::stop_source stop;

  // The sync API has no cancellation callback; watch the context instead.
  std::mutex mu;
  std::condition_variable_any cv;
  std::jthread watcher([&](std::stop_token own) {
    std::unique_lock lock(mu);
    while (!own.stop_requested()) {
      if (ctx->IsCancelled()) {
        stop.request_stop();
        return;
      }
      cv.wait_for(lock, own, kCancelPollInterval, [] { return false; });
    }
  });

  try {
    engine_->Events(*req, [&](const Event& event) {
      if (!writer->Write(event)) {
        stop.request_stop();
      }
    }, stop.get_token());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EngineServer::Info(::grpc::ServerContext* ctx,
                                  const InfoRequest*,
                                  SystemInfo* resp) {
  if (auto status = Authenticate(ctx); !status.ok()) return status;
  try {
    *resp = engine_->Info();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EngineServer::NetworkUpdate(::grpc::ServerContext* ctx,
                                           const NetworkUpdateRequest* req,
                                           NetworkUpdateResponse* resp) {
  if (auto status = Authenticate(ctx); !status.ok()) return status;
  try {
    engine_->NetworkUpdate(req->name(), req->options());
    resp->set_name(req->name());
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EngineServer::ImageUntag(::grpc::ServerContext* ctx,
                                        const ImageUntagRequest* req,
                                        ImageUntagResponse*) {
  if (auto status = Authenticate(ctx); !status.ok()) return status;
  try {
    engine_->ImageUntag(req->name_or_id(), std::vector<std::string>(req->tags().begin(), req->tags().end()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EngineServer::ImageInspect(::grpc::ServerContext* ctx,
                                          const ImageInspectRequest* req,
                                          ImageInspectResponse* resp) {
  if (auto status = Authenticate(ctx); !status.ok()) return status;
  try {
    *resp = engine_->ImageInspect(std::vector<std::string>(req->names().begin(), req->names().end()));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status EngineServer::ArtifactPull(::grpc::ServerContext* ctx,
                                          const ArtifactPullRequest* req,
                                          ArtifactPullReport* resp) {
  if (auto status = Authenticate(ctx); !status.ok()) return status;
  try {
    const auto credentials = berth::auth::DecodeRegistryAuthHeaders(Metadata(ctx, berth::auth::kRegistryAuthHeader),
                                                                    Metadata(ctx, berth::auth::kRegistryConfigHeader));

    ArtifactPullOptions options = req->options();
    options.clear_authfile();
    options.clear_username();
    options.clear_password();

    std::optional<berth::auth::TemporaryAuthFile> authfile;
    if (credentials.explicit_credentials) {
      options.set_username(credentials.explicit_credentials->username);
      options.set_password(credentials.explicit_credentials->password);
    } else if (!credentials.per_registry.empty()) {
      authfile.emplace(credentials.per_registry);
      options.set_authfile(authfile->Path());
    }

    *resp = engine_->ArtifactPull(req->name(), options);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
