#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/storage/api/result.hpp"
#include "internal/storage/api/transaction.hpp"
#include "internal/storage/model/records.hpp"

namespace berth::storage {

/*
  Record store abstraction.

  GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - List* returns rows in insertion order

  Lookups are exact: containers by id or name, images by id or any of
  their names, networks and artifacts by name. Prefix and short-name
  resolution is the runtime's job.
*/

class Store {
 public:
  virtual ~Store() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Short backend tag reported by Info ("memory", "sqlite").
  virtual std::string Backend() const = 0;

  // ---------------------------------------------------------------------
  // Containers
  // ---------------------------------------------------------------------

  virtual Result InsertContainer(Transaction&, const model::ContainerRecord&) = 0;

  virtual std::optional<model::ContainerRecord> GetContainer(Transaction&, const std::string& name_or_id) = 0;

  virtual std::vector<model::ContainerRecord> ListContainers(Transaction&) = 0;

  virtual Result UpdateContainer(Transaction&, const model::ContainerRecord&) = 0;

  virtual Result DeleteContainer(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Images
  // ---------------------------------------------------------------------

  virtual Result InsertImage(Transaction&, const model::ImageRecord&) = 0;

  virtual std::optional<model::ImageRecord> GetImage(Transaction&, const std::string& name_or_id) = 0;

  virtual std::vector<model::ImageRecord> ListImages(Transaction&) = 0;

  virtual Result UpdateImage(Transaction&, const model::ImageRecord&) = 0;

  // ---------------------------------------------------------------------
  // Networks
  // ---------------------------------------------------------------------

  virtual Result InsertNetwork(Transaction&, const model::NetworkRecord&) = 0;

  virtual std::optional<model::NetworkRecord> GetNetwork(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::NetworkRecord> ListNetworks(Transaction&) = 0;

  virtual Result UpdateNetwork(Transaction&, const model::NetworkRecord&) = 0;

  // ---------------------------------------------------------------------
  // Artifacts
  // ---------------------------------------------------------------------

  virtual Result UpsertArtifact(Transaction&, const model::ArtifactRecord&) = 0;

  virtual std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string& name) = 0;
};

} // namespace berth::storage
