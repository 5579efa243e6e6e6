#pragma once

#include <mutex>
#include <vector>

#include "internal/storage/api/store.hpp"

namespace berth::storage::memory {

class MemoryTransaction;

class MemoryStore final : public storage::Store {
 public:
  MemoryStore();

  std::unique_ptr<Transaction> Begin() override;
  std::string                  Backend() const override {
    return "memory";
  }

  Result                                 InsertContainer(Transaction&, const model::ContainerRecord&) override;
  std::optional<model::ContainerRecord>  GetContainer(Transaction&, const std::string&) override;
  std::vector<model::ContainerRecord>    ListContainers(Transaction&) override;
  Result                                 UpdateContainer(Transaction&, const model::ContainerRecord&) override;
  Result                                 DeleteContainer(Transaction&, const std::string&) override;

  Result                             InsertImage(Transaction&, const model::ImageRecord&) override;
  std::optional<model::ImageRecord>  GetImage(Transaction&, const std::string&) override;
  std::vector<model::ImageRecord>    ListImages(Transaction&) override;
  Result                             UpdateImage(Transaction&, const model::ImageRecord&) override;

  Result                               InsertNetwork(Transaction&, const model::NetworkRecord&) override;
  std::optional<model::NetworkRecord>  GetNetwork(Transaction&, const std::string&) override;
  std::vector<model::NetworkRecord>    ListNetworks(Transaction&) override;
  Result                               UpdateNetwork(Transaction&, const model::NetworkRecord&) override;

  Result                                UpsertArtifact(Transaction&, const model::ArtifactRecord&) override;
  std::optional<model::ArtifactRecord>  GetArtifact(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  // Vectors keep insertion order for List*.
  struct State {
    std::vector<model::ContainerRecord> containers;
    std::vector<model::ImageRecord>     images;
    std::vector<model::NetworkRecord>   networks;
    std::vector<model::ArtifactRecord>  artifacts;
  };

  // Held by the open transaction.
  std::mutex mutex_;
  State      committed_;
};

} // namespace berth::storage::memory
