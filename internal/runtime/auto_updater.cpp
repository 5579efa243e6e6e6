#include "auto_updater.hpp"

#include <algorithm>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace berth::runtime {

namespace {

using storage::model::ContainerRecord;
using storage::model::ContainerState;
using storage::model::ImageRecord;

std::string UnitName(const ContainerRecord& container) {
  auto it = container.labels.find(kSystemdUnitLabel);
  return it == container.labels.end() ? container.name : it->second;
}

std::string ImageIdFromDigest(const std::string& digest) {
  const auto colon = digest.find(':');
  return colon == std::string::npos ? digest : digest.substr(colon + 1);
}

void Check(const storage::Result& result, const std::string& what) {
  if (!result) {
    throw util::Internal(what + ": " + result.message);
  }
}

} // namespace

AutoUpdater::AutoUpdater(std::shared_ptr<storage::Store> store, std::shared_ptr<RegistryClient> registry, EventBus& events)
    : store_(std::move(store)), registry_(std::move(registry)), events_(events) {
}

engine::v1::AutoUpdateResponse AutoUpdater::Run(const engine::v1::AutoUpdateOptions& options, const auth::RegistryCredentials& credentials) {
  engine::v1::AutoUpdateResponse response;

  std::vector<ContainerRecord> containers;
  {
    auto tx    = store_->Begin();
    containers = store_->ListContainers(*tx);
    tx->Commit();
  }

  for (const auto& container : containers) {
    auto policy = container.labels.find(kAutoUpdateLabel);
    if (policy == container.labels.end() || container.state != ContainerState::kRunning) {
      continue;
    }

    const auto unit = UnitName(container);
    try {
      if (policy->second != "registry" && policy->second != "local") {
        throw util::Internal("auto-updating container " + container.id + ": invalid auto-update policy \"" + policy->second + "\"");
      }
      if (!container.labels.contains(kSystemdUnitLabel)) {
        throw util::Internal("auto-updating container " + container.id + ": no " + kSystemdUnitLabel + " label found");
      }
      *response.add_reports() = UpdateUnit(container, policy->second, options.dry_run(), credentials);
    } catch (const std::exception& e) {
      BERTH_LOG_WARN("auto-update unit failed", {observability::StringField("unit", unit), observability::StringField("error", e.what())});
      *response.add_errors() = util::ToUnitError(unit, e);
    }
  }
  return response;
}

engine::v1::AutoUpdateReport AutoUpdater::UpdateUnit(const ContainerRecord& container, const std::string& policy, bool dry_run,
                                                     const auth::RegistryCredentials& credentials) {
  engine::v1::AutoUpdateReport report;
  report.set_container_id(container.id);
  report.set_container_name(container.name);
  report.set_image_name(container.image_name);
  report.set_policy(policy);
  report.set_systemd_unit(UnitName(container));

  const auto reference = ParseReference(container.image_name);

  // Resolve outside the store transaction; the registry may be slow.
  std::string remote_digest;
  if (policy == "registry") {
    remote_digest = registry_->ResolveDigest(reference, credentials);
  }

  auto tx = store_->Begin();

  auto current = store_->GetImage(*tx, container.image_id);
  if (!current) {
    throw util::NotFound("auto-updating container " + container.id + ": image " + container.image_id + " not known");
  }

  std::optional<ImageRecord> target;
  if (policy == "registry") {
    if (remote_digest != current->digest) {
      target = store_->GetImage(*tx, ImageIdFromDigest(remote_digest));
      if (!target) {
        ImageRecord pulled;
        pulled.id            = ImageIdFromDigest(remote_digest);
        pulled.digest        = remote_digest;
        pulled.created_at_ms = util::ToUnixMillis(util::Now());
        target               = pulled;
      }
    }
  } else {
    auto local = store_->GetImage(*tx, reference.String());
    if (!local) {
      throw util::NotFound("auto-updating container " + container.id + ": image " + container.image_name + " not known");
    }
    if (local->id != container.image_id) {
      target = local;
    }
  }

  if (!target) {
    report.set_updated("false");
    return report;
  }
  if (dry_run) {
    report.set_updated("pending");
    return report;
  }

  if (policy == "registry") {
    // The name moves from the outdated image to the pulled one.
    const auto name = reference.String();
    std::erase(current->names, name);
    Check(store_->UpdateImage(*tx, *current), "untag outdated image");

    const bool exists = store_->GetImage(*tx, target->id).has_value();
    if (std::find(target->names.begin(), target->names.end(), name) == target->names.end()) {
      target->names.push_back(name);
    }
    Check(exists ? store_->UpdateImage(*tx, *target) : store_->InsertImage(*tx, *target), "store pulled image");
  }

  auto updated     = container;
  updated.image_id = target->id;
  Check(store_->UpdateContainer(*tx, updated), "update container");
  tx->Commit();

  engine::v1::Event event;
  event.set_type("container");
  event.set_action("auto-update");
  event.set_id(container.id);
  event.set_name(container.name);
  event.set_image(container.image_name);
  events_.Publish(std::move(event));

  BERTH_LOG_INFO("auto-updated container", {observability::StringField("container", container.name), observability::StringField("image", target->id)});
  report.set_updated("true");
  return report;
}

} // namespace berth::runtime
