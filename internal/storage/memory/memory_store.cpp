#include "memory_store.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace berth::storage::memory {

namespace {

MemoryTransaction& TX(storage::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

template <typename Rows, typename Pred>
auto FindIf(Rows& rows, Pred pred) {
  return std::find_if(rows.begin(), rows.end(), pred);
}

bool HasName(const model::ImageRecord& image, const std::string& name) {
  return std::find(image.names.begin(), image.names.end(), name) != image.names.end();
}

} // namespace

MemoryStore::MemoryStore() = default;

std::unique_ptr<storage::Transaction> MemoryStore::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

// ------------------------------------------------------------------
// Containers
// ------------------------------------------------------------------

Result MemoryStore::InsertContainer(Transaction& t, const model::ContainerRecord& r) {
  auto& s = TX(t).Mutable();
  auto  it =
      FindIf(s.containers, [&](const model::ContainerRecord& c) { return c.id == r.id || (!r.name.empty() && c.name == r.name); });
  if (it != s.containers.end()) return Result::Err(ErrorCode::AlreadyExists, "container " + r.name + " already exists");
  s.containers.push_back(r);
  return Result::Ok();
}

std::optional<model::ContainerRecord> MemoryStore::GetContainer(Transaction& t, const std::string& name_or_id) {
  const auto& s  = TX(t).View();
  auto        it = std::find_if(s.containers.begin(), s.containers.end(),
                                [&](const model::ContainerRecord& c) { return c.id == name_or_id || c.name == name_or_id; });
  if (it == s.containers.end()) return std::nullopt;
  return *it;
}

std::vector<model::ContainerRecord> MemoryStore::ListContainers(Transaction& t) {
  return TX(t).View().containers;
}

Result MemoryStore::UpdateContainer(Transaction& t, const model::ContainerRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = FindIf(s.containers, [&](const model::ContainerRecord& c) { return c.id == r.id; });
  if (it == s.containers.end()) return Result::Err(ErrorCode::NotFound);
  *it = r;
  return Result::Ok();
}

Result MemoryStore::DeleteContainer(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.containers, [&](const model::ContainerRecord& c) { return c.id == id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result MemoryStore::InsertImage(Transaction& t, const model::ImageRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = FindIf(s.images, [&](const model::ImageRecord& i) { return i.id == r.id; });
  if (it != s.images.end()) return Result::Err(ErrorCode::AlreadyExists, "image " + r.id + " already exists");
  s.images.push_back(r);
  return Result::Ok();
}

std::optional<model::ImageRecord> MemoryStore::GetImage(Transaction& t, const std::string& name_or_id) {
  const auto& s  = TX(t).View();
  auto        it = std::find_if(s.images.begin(), s.images.end(),
                                [&](const model::ImageRecord& i) { return i.id == name_or_id || HasName(i, name_or_id); });
  if (it == s.images.end()) return std::nullopt;
  return *it;
}

std::vector<model::ImageRecord> MemoryStore::ListImages(Transaction& t) {
  return TX(t).View().images;
}

Result MemoryStore::UpdateImage(Transaction& t, const model::ImageRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = FindIf(s.images, [&](const model::ImageRecord& i) { return i.id == r.id; });
  if (it == s.images.end()) return Result::Err(ErrorCode::NotFound);
  *it = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Networks
// ------------------------------------------------------------------

Result MemoryStore::InsertNetwork(Transaction& t, const model::NetworkRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = FindIf(s.networks, [&](const model::NetworkRecord& n) { return n.name == r.name; });
  if (it != s.networks.end()) return Result::Err(ErrorCode::AlreadyExists, "network " + r.name + " already exists");
  s.networks.push_back(r);
  return Result::Ok();
}

std::optional<model::NetworkRecord> MemoryStore::GetNetwork(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = std::find_if(s.networks.begin(), s.networks.end(),
                                [&](const model::NetworkRecord& n) { return n.name == name || n.id == name; });
  if (it == s.networks.end()) return std::nullopt;
  return *it;
}

std::vector<model::NetworkRecord> MemoryStore::ListNetworks(Transaction& t) {
  return TX(t).View().networks;
}

Result MemoryStore::UpdateNetwork(Transaction& t, const model::NetworkRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = FindIf(s.networks, [&](const model::NetworkRecord& n) { return n.name == r.name; });
  if (it == s.networks.end()) return Result::Err(ErrorCode::NotFound);
  *it = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result MemoryStore::UpsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = FindIf(s.artifacts, [&](const model::ArtifactRecord& a) { return a.name == r.name; });
  if (it == s.artifacts.end()) {
    s.artifacts.push_back(r);
  } else {
    *it = r;
  }
  return Result::Ok();
}

std::optional<model::ArtifactRecord> MemoryStore::GetArtifact(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = std::find_if(s.artifacts.begin(), s.artifacts.end(), [&](const model::ArtifactRecord& a) { return a.name == name; });
  if (it == s.artifacts.end()) return std::nullopt;
  return *it;
}

} // namespace berth::storage::memory
