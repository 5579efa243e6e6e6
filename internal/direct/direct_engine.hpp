#pragma once

#include <atomic>
#include <memory>

#include "internal/engine/engine.hpp"
#include "internal/runtime/runtime.hpp"
#include "internal/storage/api/store.hpp"

namespace berth::direct {

// Local execution context shared by every direct call.
struct RuntimeHandle {
  std::shared_ptr<runtime::Runtime> runtime;
  std::shared_ptr<storage::Store>   store;
};

/*
  Facade bound to in-process collaborators.

  Calls are synchronous and add no locking; the runtime and store
  serialise conflicting mutations themselves.
*/
class DirectEngine final : public engine::Engine {
 public:
  explicit DirectEngine(RuntimeHandle handle);

  engine::EngineMode Mode() const override {
    return engine::EngineMode::kDirect;
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

  const RuntimeHandle& Handle() const {
    return handle_;
  }

 private:
  runtime::Runtime& Runtime();

  RuntimeHandle     handle_;
  std::atomic<bool> shut_down_{false};
};

} // namespace berth::direct
