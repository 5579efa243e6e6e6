#pragma once

#include <memory>

#include "internal/auth/registry_auth.hpp"
#include "internal/runtime/event_bus.hpp"
#include "internal/runtime/registry_client.hpp"
#include "internal/storage/api/store.hpp"

namespace berth::runtime {

inline constexpr char kAutoUpdateLabel[]  = "io.containers.autoupdate";
inline constexpr char kSystemdUnitLabel[] = "io.berth.systemd-unit";

/*
  Auto-update over running containers carrying kAutoUpdateLabel.

  Policies:
    registry  compare the image digest against the registry
    local     compare against the image currently stored under the
              container's image name

  Each container is one unit. A failing unit adds a UnitError (named by
  its systemd unit, or the container name when it has none) and the run
  moves on. Reports carry updated = "true", "false" or "pending" (dry run).
*/
class AutoUpdater {
 public:
  AutoUpdater(std::shared_ptr<storage::Store> store, std::shared_ptr<RegistryClient> registry, EventBus& events);

  engine::v1::AutoUpdateResponse Run(const engine::v1::AutoUpdateOptions& options, const auth::RegistryCredentials& credentials);

 private:
  engine::v1::AutoUpdateReport UpdateUnit(const storage::model::ContainerRecord& container, const std::string& policy, bool dry_run,
                                          const auth::RegistryCredentials& credentials);

  std::shared_ptr<storage::Store> store_;
  std::shared_ptr<RegistryClient> registry_;
  EventBus&                       events_;
};

} // namespace berth::runtime
