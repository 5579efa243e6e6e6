#pragma once

#include <functional>
#include <stop_token>
#include <string>
#include <vector>

#include "berth/engine/v1.hpp"
#include "internal/engine/engine_mode.hpp"

namespace berth::engine {

using EventSink = std::function<void(const v1::Event&)>;

/*
  Engine facade.

  One instance per process, bound to exactly one backend for its whole
  lifetime. Both backends report failures through the util:: error
  types so callers cannot tell them apart by error shape.
*/
class Engine {
 public:
  virtual ~Engine() = default;

  virtual EngineMode Mode() const = 0;

  virtual v1::HealthCheckResults HealthCheckRun(const std::string& name_or_id, const v1::HealthCheckOptions& options) = 0;

  // Partial by design: one report or one error per unit.
  virtual v1::AutoUpdateResponse AutoUpdate(const v1::AutoUpdateOptions& options) = 0;

  /*
    Blocks the calling thread until the read ends. A stop request or
    reaching `until` returns normally; a producer-side close of a
    streaming read throws util::StreamClosed.
  */
  virtual void Events(const v1::EventsOptions& options, const EventSink& sink, std::stop_token stop) = 0;

  virtual v1::SystemInfo Info() = 0;

  virtual void NetworkUpdate(const std::string& name, const v1::NetworkUpdateOptions& options) = 0;

  virtual void ImageUntag(const std::string& name_or_id, const std::vector<std::string>& tags) = 0;

  virtual v1::ImageInspectResponse ImageInspect(const std::vector<std::string>& names) = 0;

  virtual v1::ArtifactPullReport ArtifactPull(const std::string& name, const v1::ArtifactPullOptions& options) = 0;

  virtual v1::ShowTrustReport ShowTrust(const v1::ShowTrustOptions& options) = 0;

  virtual void SetTrust(const std::string& scope, const v1::SetTrustOptions& options) = 0;

  // Releases the backend; later calls fail.
  virtual void Shutdown() = 0;
};

} // namespace berth::engine
