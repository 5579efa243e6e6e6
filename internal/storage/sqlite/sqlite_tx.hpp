#pragma once

#include <memory>
#include <mutex>

#include "internal/storage/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace berth::storage::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction lock for its whole life, then
  BEGIN IMMEDIATE takes the database write lock up front so two
  read-modify-write transactions cannot both pass their reads.
*/
class SqliteTransaction final : public storage::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace berth::storage::sqlite
