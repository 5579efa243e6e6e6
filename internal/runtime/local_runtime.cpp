#include "local_runtime.hpp"

#include <arpa/inet.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/runtime/trust_policy.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#ifndef BERTH_VERSION
#define BERTH_VERSION "0.0.0"
#endif

namespace berth::runtime {

namespace {

using storage::model::ContainerRecord;
using storage::model::ContainerState;
using storage::model::ImageRecord;

constexpr char kApiVersion[] = "1";

void Check(const storage::Result& result, const std::string& what) {
  if (!result) {
    throw util::Internal(what + ": " + result.message);
  }
}

bool IsIpAddress(const std::string& value) {
  in6_addr buffer{};
  return inet_pton(AF_INET, value.c_str(), &buffer) == 1 || inet_pton(AF_INET6, value.c_str(), &buffer) == 1;
}

std::string GoArch(const std::string& machine) {
  if (machine == "x86_64") return "amd64";
  if (machine == "aarch64") return "arm64";
  return machine;
}

engine::v1::Event MakeEvent(const char* type, const char* action, const std::string& id, const std::string& name) {
  engine::v1::Event event;
  event.set_type(type);
  event.set_action(action);
  event.set_id(id);
  event.set_name(name);
  return event;
}

engine::v1::ImageData ToImageData(const ImageRecord& image) {
  engine::v1::ImageData data;
  data.set_id(image.id);
  for (const auto& name : image.names) {
    data.add_names(name);
  }
  data.set_digest(image.digest);
  data.set_size(image.size_bytes);
  *data.mutable_created() = util::ToProto(util::TimePoint(std::chrono::milliseconds(image.created_at_ms)));
  for (const auto& [key, value] : image.labels) {
    (*data.mutable_labels())[key] = value;
  }
  return data;
}

} // namespace

const char* HealthCheckStatusString(HealthCheckStatus status) {
  switch (status) {
    case HealthCheckStatus::kHealthy:
      return "healthy";
    case HealthCheckStatus::kUnhealthy:
      return "unhealthy";
    case HealthCheckStatus::kStarting:
      return "starting";
    case HealthCheckStatus::kContainerStopped:
      return "container not running";
    case HealthCheckStatus::kContainerNotFound:
      return "container not found";
    case HealthCheckStatus::kNotDefined:
      return "not defined";
    case HealthCheckStatus::kDefined:
      return "defined";
    case HealthCheckStatus::kInternalError:
      break;
  }
  return "internal error";
}

LocalRuntime::LocalRuntime(std::shared_ptr<storage::Store> store, std::shared_ptr<RegistryClient> registry, LocalRuntimeOptions options)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      options_(std::move(options)),
      events_(options_.event_journal_size),
      updater_(store_, registry_, events_) {
  if (!store_) {
    throw util::Internal("runtime requires a record store");
  }
  if (!registry_) {
    throw util::Internal("runtime requires a registry client");
  }
}

std::optional<ContainerRecord> LocalRuntime::LookupContainer(storage::Transaction& tx, const std::string& name_or_id) {
  if (auto exact = store_->GetContainer(tx, name_or_id)) {
    return exact;
  }
  if (name_or_id.empty()) {
    return std::nullopt;
  }

  std::optional<ContainerRecord> match;
  for (auto& container : store_->ListContainers(tx)) {
    if (container.id.rfind(name_or_id, 0) != 0) continue;
    if (match) return std::nullopt; // ambiguous prefix
    match = std::move(container);
  }
  return match;
}

std::optional<ImageRecord> LocalRuntime::LookupImage(storage::Transaction& tx, const std::string& name_or_id) {
  if (auto exact = store_->GetImage(tx, name_or_id)) {
    return exact;
  }
  if (name_or_id.empty()) {
    return std::nullopt;
  }

  try {
    if (auto normalized = store_->GetImage(tx, NormalizeReference(name_or_id))) {
      return normalized;
    }
  } catch (const util::Internal&) {
    // not a reference; may still be an id prefix
  }

  std::optional<ImageRecord> match;
  for (auto& image : store_->ListImages(tx)) {
    if (image.id.rfind(name_or_id, 0) != 0) continue;
    if (match) return std::nullopt;
    match = std::move(image);
  }
  return match;
}

HealthCheckOutcome LocalRuntime::HealthCheck(const std::string& name_or_id) {
  std::optional<ContainerRecord> container;
  try {
    auto tx   = store_->Begin();
    container = LookupContainer(*tx, name_or_id);
    tx->Commit();
  } catch (const std::exception& e) {
    return {HealthCheckStatus::kInternalError, std::string("health check of ") + name_or_id + ": " + e.what()};
  }

  if (!container) {
    return {HealthCheckStatus::kContainerNotFound, "no container with name or ID \"" + name_or_id + "\" found: no such container"};
  }
  if (container->healthcheck_command.empty()) {
    return {HealthCheckStatus::kNotDefined, "container " + container->name + " has no defined healthcheck"};
  }
  if (container->state != ContainerState::kRunning) {
    return {HealthCheckStatus::kContainerStopped, "container " + container->name + " is not running"};
  }

  HealthCheckStatus status;
  if (container->health_status == "healthy") {
    status = HealthCheckStatus::kHealthy;
  } else if (container->health_status == "unhealthy") {
    status = HealthCheckStatus::kUnhealthy;
  } else if (container->health_status.empty() || container->health_status == "starting") {
    status = HealthCheckStatus::kStarting;
  } else {
    return {HealthCheckStatus::kInternalError, "container " + container->name + " has unknown health status \"" + container->health_status + "\""};
  }

  auto event = MakeEvent("container", "health_status", container->id, container->name);
  event.set_image(container->image_name);
  event.set_health_status(HealthCheckStatusString(status));
  events_.Publish(std::move(event));

  return {status, std::nullopt};
}

engine::v1::AutoUpdateResponse LocalRuntime::AutoUpdate(const engine::v1::AutoUpdateOptions& options,
                                                        const auth::RegistryCredentials& credentials) {
  return updater_.Run(options, credentials);
}

EventStreamEnd LocalRuntime::Events(const engine::v1::EventsOptions& options, const EventSink& sink, std::stop_token stop) {
  EventReadPlan plan;
  plan.filter     = EventFilter::Parse(std::vector<std::string>(options.filter().begin(), options.filter().end()));
  plan.stream     = options.stream();
  plan.from_start = options.from_start();

  const auto now = util::Now();
  if (options.has_since()) {
    plan.since = util::ParseTimeFilter(options.since(), now);
  }
  if (options.has_until()) {
    plan.until = util::ParseTimeFilter(options.until(), now);
  }

  return events_.Read(plan, sink, std::move(stop));
}

engine::v1::SystemInfo LocalRuntime::Info() {
  engine::v1::SystemInfo info;

  auto* host = info.mutable_host();
  char  hostname[256] = {};
  if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
    host->set_hostname(hostname);
  }
  utsname uts{};
  std::string arch = "unknown";
  if (uname(&uts) == 0) {
    std::string os = uts.sysname;
    std::transform(os.begin(), os.end(), os.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    host->set_os(os);
    host->set_kernel(uts.release);
    arch = GoArch(uts.machine);
  }
  host->set_arch(arch);

  auto* store = info.mutable_store();
  store->set_backend(store_->Backend());
  {
    auto       tx         = store_->Begin();
    const auto containers = store_->ListContainers(*tx);
    store->set_containers(containers.size());
    store->set_containers_running(static_cast<uint64_t>(
        std::count_if(containers.begin(), containers.end(), [](const ContainerRecord& c) { return c.state == ContainerState::kRunning; })));
    store->set_images(store_->ListImages(*tx).size());
    store->set_networks(store_->ListNetworks(*tx).size());
    tx->Commit();
  }

  auto* version = info.mutable_version();
  version->set_version(BERTH_VERSION);
  version->set_api_version(kApiVersion);
  version->set_os_arch(host->os() + "/" + arch);
  return info;
}

void LocalRuntime::NetworkUpdate(const std::string& name, const engine::v1::NetworkUpdateOptions& options) {
  for (const auto& server : options.add_dns_servers()) {
    if (!IsIpAddress(server)) {
      throw util::Internal("invalid dns server \"" + server + "\": not an ip address");
    }
  }

  auto tx      = store_->Begin();
  auto network = store_->GetNetwork(*tx, name);
  if (!network) {
    throw util::NotFound("unable to find network with name or ID " + name + ": network not found");
  }

  for (const auto& server : options.remove_dns_servers()) {
    auto it = std::find(network->dns_servers.begin(), network->dns_servers.end(), server);
    if (it == network->dns_servers.end()) {
      throw util::Internal("dns server " + server + " is not configured on network " + network->name);
    }
    network->dns_servers.erase(it);
  }
  for (const auto& server : options.add_dns_servers()) {
    if (std::find(network->dns_servers.begin(), network->dns_servers.end(), server) == network->dns_servers.end()) {
      network->dns_servers.push_back(server);
    }
  }

  Check(store_->UpdateNetwork(*tx, *network), "update network " + network->name);
  tx->Commit();

  events_.Publish(MakeEvent("network", "update", network->id, network->name));
}

void LocalRuntime::ImageUntag(const std::string& name_or_id, const std::vector<std::string>& tags) {
  auto tx    = store_->Begin();
  auto image = LookupImage(*tx, name_or_id);
  if (!image) {
    throw util::NotFound(name_or_id + ": image not known");
  }

  std::vector<std::string> removed;
  if (tags.empty()) {
    removed = std::move(image->names);
    image->names.clear();
  } else {
    for (const auto& tag : tags) {
      const auto normalized = NormalizeReference(tag);
      auto       it         = std::find(image->names.begin(), image->names.end(), normalized);
      if (it == image->names.end()) {
        throw util::NotFound(tag + ": tag not known");
      }
      removed.push_back(*it);
      image->names.erase(it);
    }
  }

  Check(store_->UpdateImage(*tx, *image), "untag image " + image->id);
  tx->Commit();

  for (const auto& name : removed) {
    events_.Publish(MakeEvent("image", "untag", image->id, name));
  }
}

engine::v1::ImageInspectResponse LocalRuntime::ImageInspect(const std::vector<std::string>& names) {
  engine::v1::ImageInspectResponse response;

  auto tx = store_->Begin();
  for (const auto& name : names) {
    auto image = LookupImage(*tx, name);
    if (!image) {
      *response.add_errors() = util::ToUnitError(name, util::NotFound(name + ": image not known"));
      continue;
    }
    *response.add_images() = ToImageData(*image);
  }
  tx->Commit();
  return response;
}

engine::v1::ArtifactPullReport LocalRuntime::ArtifactPull(const std::string& name, const engine::v1::ArtifactPullOptions& options,
                                                          const auth::RegistryCredentials& credentials) {
  const auto reference = ParseReference(name);
  const auto digest    = registry_->ResolveDigest(reference, credentials);

  storage::model::ArtifactRecord record;
  record.name         = reference.String();
  record.digest       = digest;
  record.pulled_at_ms = util::ToUnixMillis(util::Now());

  auto tx = store_->Begin();
  Check(store_->UpsertArtifact(*tx, record), "store artifact " + record.name);
  tx->Commit();

  events_.Publish(MakeEvent("artifact", "pull", digest, record.name));
  if (!options.quiet()) {
    BERTH_LOG_INFO("pulled artifact", {observability::StringField("name", record.name), observability::StringField("digest", digest)});
  }

  engine::v1::ArtifactPullReport report;
  report.set_artifact_digest(digest);
  return report;
}

engine::v1::ShowTrustReport LocalRuntime::ShowTrust(const engine::v1::ShowTrustOptions& options) {
  const auto policy     = options.has_policy_path() ? std::filesystem::path(options.policy_path()) : options_.trust_policy_path;
  const auto registries = options.has_registry_path() ? std::filesystem::path(options.registry_path()) : options_.registries_dir;
  return ShowTrustPolicy(policy, registries, options.raw());
}

void LocalRuntime::SetTrust(const std::string& scope, const engine::v1::SetTrustOptions& options) {
  const auto policy = options.has_policy_path() ? std::filesystem::path(options.policy_path()) : options_.trust_policy_path;
  SetTrustPolicy(policy, scope, options);
  BERTH_LOG_INFO("trust policy updated", {observability::StringField("scope", scope), observability::StringField("type", options.type())});
}

void LocalRuntime::Publish(engine::v1::Event event) {
  events_.Publish(std::move(event));
}

void LocalRuntime::CloseEvents() {
  events_.Close();
}

} // namespace berth::runtime
