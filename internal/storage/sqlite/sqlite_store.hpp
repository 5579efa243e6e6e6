#pragma once

#include <memory>

#include "internal/storage/api/store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace berth::storage::sqlite {

class SqliteStore final : public storage::Store {
 public:
  // Creates the schema if it does not exist yet.
  explicit SqliteStore(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::string                  Backend() const override {
    return "sqlite";
  }

  Result                                InsertContainer(Transaction&, const model::ContainerRecord&) override;
  std::optional<model::ContainerRecord> GetContainer(Transaction&, const std::string&) override;
  std::vector<model::ContainerRecord>   ListContainers(Transaction&) override;
  Result                                UpdateContainer(Transaction&, const model::ContainerRecord&) override;
  Result                                DeleteContainer(Transaction&, const std::string&) override;

  Result                            InsertImage(Transaction&, const model::ImageRecord&) override;
  std::optional<model::ImageRecord> GetImage(Transaction&, const std::string&) override;
  std::vector<model::ImageRecord>   ListImages(Transaction&) override;
  Result                            UpdateImage(Transaction&, const model::ImageRecord&) override;

  Result                              InsertNetwork(Transaction&, const model::NetworkRecord&) override;
  std::optional<model::NetworkRecord> GetNetwork(Transaction&, const std::string&) override;
  std::vector<model::NetworkRecord>   ListNetworks(Transaction&) override;
  Result                              UpdateNetwork(Transaction&, const model::NetworkRecord&) override;

  Result                               UpsertArtifact(Transaction&, const model::ArtifactRecord&) override;
  std::optional<model::ArtifactRecord> GetArtifact(Transaction&, const std::string&) override;

 private:
  void BootstrapSchema();

  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace berth::storage::sqlite
