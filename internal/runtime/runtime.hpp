#pragma once

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "berth/engine/v1/types.pb.h"
#include "internal/auth/registry_auth.hpp"

namespace berth::runtime {

/*
  Health check outcome codes of the runtime.

  The first three are probe results; the rest describe why no probe
  result is available.
*/
enum class HealthCheckStatus {
  kHealthy,
  kUnhealthy,
  kStarting,
  kContainerStopped,
  kContainerNotFound,
  kNotDefined,
  kInternalError,
  kDefined,
};

// Wire strings: "healthy", "container not running", ...
const char* HealthCheckStatusString(HealthCheckStatus status);

struct HealthCheckOutcome {
  HealthCheckStatus          status = HealthCheckStatus::kInternalError;
  std::optional<std::string> error;
};

// How an event read ended.
enum class EventStreamEnd {
  kDrained,      // non-streaming read consumed the journal
  kUntilReached, // `until` passed
  kCancelled,    // caller stop request
  kClosed,       // producer closed the journal
};

using EventSink = std::function<void(const engine::v1::Event&)>;

/*
  Runtime collaborator of the direct backend.

  Owns container/image/network state through the record store and the
  event journal. Errors are thrown as util:: exception types; the health
  check alone reports through its status code.
*/
class Runtime {
 public:
  virtual ~Runtime() = default;

  virtual HealthCheckOutcome HealthCheck(const std::string& name_or_id) = 0;

  // Per unit reports and errors; never throws for a single unit.
  virtual engine::v1::AutoUpdateResponse AutoUpdate(const engine::v1::AutoUpdateOptions& options,
                                                    const auth::RegistryCredentials& credentials) = 0;

  // Blocks until the read ends; see EventStreamEnd.
  virtual EventStreamEnd Events(const engine::v1::EventsOptions& options, const EventSink& sink, std::stop_token stop) = 0;

  virtual engine::v1::SystemInfo Info() = 0;

  virtual void NetworkUpdate(const std::string& name, const engine::v1::NetworkUpdateOptions& options) = 0;

  virtual void ImageUntag(const std::string& name_or_id, const std::vector<std::string>& tags) = 0;

  virtual engine::v1::ImageInspectResponse ImageInspect(const std::vector<std::string>& names) = 0;

  // Credentials are resolved by the caller; options carry none.
  virtual engine::v1::ArtifactPullReport ArtifactPull(const std::string& name, const engine::v1::ArtifactPullOptions& options,
                                                      const auth::RegistryCredentials& credentials) = 0;

  virtual engine::v1::ShowTrustReport ShowTrust(const engine::v1::ShowTrustOptions& options) = 0;

  virtual void SetTrust(const std::string& scope, const engine::v1::SetTrustOptions& options) = 0;
};

} // namespace berth::runtime
