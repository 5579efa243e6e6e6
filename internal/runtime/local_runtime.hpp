#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/runtime/auto_updater.hpp"
#include "internal/runtime/event_bus.hpp"
#include "internal/runtime/registry_client.hpp"
#include "internal/runtime/runtime.hpp"
#include "internal/storage/api/store.hpp"

namespace berth::runtime {

struct LocalRuntimeOptions {
  std::filesystem::path trust_policy_path = "/etc/berth/policy.json";
  std::filesystem::path registries_dir    = "/etc/berth/registries.d";
  std::size_t           event_journal_size = 4096;
};

/*
  Reference runtime over the record store.

  Keeps container, image, network and artifact state and an event
  journal; it never starts processes or touches layers. Containers are
  resolved by id, name or unique id prefix, images by id, name,
  normalized name or unique id prefix.
*/
class LocalRuntime final : public Runtime {
 public:
  LocalRuntime(std::shared_ptr<storage::Store> store, std::shared_ptr<RegistryClient> registry, LocalRuntimeOptions options = {});

  HealthCheckOutcome HealthCheck(const std::string& name_or_id) override;

  engine::v1::AutoUpdateResponse AutoUpdate(const engine::v1::AutoUpdateOptions& options,
                                            const auth::RegistryCredentials& credentials) override;

  EventStreamEnd Events(const engine::v1::EventsOptions& options, const EventSink& sink, std::stop_token stop) override;

  engine::v1::SystemInfo Info() override;

  void NetworkUpdate(const std::string& name, const engine::v1::NetworkUpdateOptions& options) override;

  void ImageUntag(const std::string& name_or_id, const std::vector<std::string>& tags) override;

  engine::v1::ImageInspectResponse ImageInspect(const std::vector<std::string>& names) override;

  engine::v1::ArtifactPullReport ArtifactPull(const std::string& name, const engine::v1::ArtifactPullOptions& options,
                                              const auth::RegistryCredentials& credentials) override;

  engine::v1::ShowTrustReport ShowTrust(const engine::v1::ShowTrustOptions& options) override;

  void SetTrust(const std::string& scope, const engine::v1::SetTrustOptions& options) override;

  // Producer side of the event journal.
  void Publish(engine::v1::Event event);

  // Ends every streaming subscription with a stream-closed condition.
  void CloseEvents();

  std::shared_ptr<storage::Store> Store() const {
    return store_;
  }

 private:
  std::optional<storage::model::ContainerRecord> LookupContainer(storage::Transaction& tx, const std::string& name_or_id);
  std::optional<storage::model::ImageRecord>     LookupImage(storage::Transaction& tx, const std::string& name_or_id);

  std::shared_ptr<storage::Store> store_;
  std::shared_ptr<RegistryClient> registry_;
  LocalRuntimeOptions             options_;
  EventBus                        events_;
  AutoUpdater                     updater_;
};

} // namespace berth::runtime
