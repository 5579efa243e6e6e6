#include "sqlite_store.hpp"

#include <sqlite3.h>

#include <map>
#include <string>
#include <vector>

namespace berth::storage::sqlite {

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return stmt_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

Result PrepareError(sqlite3* db) {
  return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
}

const char* kSchema[] = {
    "CREATE TABLE IF NOT EXISTS containers (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, name TEXT NOT NULL UNIQUE, image_name TEXT, image_id TEXT, state INTEGER NOT NULL, healthcheck_command TEXT, health_status TEXT, created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS container_labels (container_id TEXT NOT NULL REFERENCES containers(id) ON DELETE CASCADE, key TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (container_id, key));",
    "CREATE TABLE IF NOT EXISTS images (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, digest TEXT, size_bytes INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS image_names (image_id TEXT NOT NULL REFERENCES images(id) ON DELETE CASCADE, position INTEGER NOT NULL, name TEXT NOT NULL, PRIMARY KEY (image_id, position));",
    "CREATE TABLE IF NOT EXISTS image_labels (image_id TEXT NOT NULL REFERENCES images(id) ON DELETE CASCADE, key TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (image_id, key));",
    "CREATE TABLE IF NOT EXISTS networks (seq INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, id TEXT, driver TEXT);",
    "CREATE TABLE IF NOT EXISTS network_dns (network TEXT NOT NULL REFERENCES networks(name) ON DELETE CASCADE, position INTEGER NOT NULL, server TEXT NOT NULL, PRIMARY KEY (network, position));",
    "CREATE TABLE IF NOT EXISTS artifacts (seq INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, digest TEXT NOT NULL, pulled_at_ms INTEGER NOT NULL);",
};

// Replaces the key/value rows owned by `owner` in a label table.
Result WriteLabels(sqlite3* db, const char* delete_sql, const char* insert_sql, const std::string& owner,
                   const std::map<std::string, std::string>& labels) {
  {
    Statement del(db, delete_sql);
    if (!del) return PrepareError(db);
    BindText(del.get(), 1, owner);
    if (sqlite3_step(del.get()) != SQLITE_DONE) return PrepareError(db);
  }
  for (const auto& [key, value] : labels) {
    Statement ins(db, insert_sql);
    if (!ins) return PrepareError(db);
    BindText(ins.get(), 1, owner);
    BindText(ins.get(), 2, key);
    BindText(ins.get(), 3, value);
    if (sqlite3_step(ins.get()) != SQLITE_DONE) return PrepareError(db);
  }
  return Result::Ok();
}

std::map<std::string, std::string> ReadLabels(sqlite3* db, const char* sql, const std::string& owner) {
  std::map<std::string, std::string> labels;
  Statement                          st(db, sql);
  if (!st) return labels;
  BindText(st.get(), 1, owner);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    labels[ColText(st.get(), 0)] = ColText(st.get(), 1);
  }
  return labels;
}

// Replaces an ordered list of strings owned by `owner`.
Result WriteList(sqlite3* db, const char* delete_sql, const char* insert_sql, const std::string& owner,
                 const std::vector<std::string>& values) {
  {
    Statement del(db, delete_sql);
    if (!del) return PrepareError(db);
    BindText(del.get(), 1, owner);
    if (sqlite3_step(del.get()) != SQLITE_DONE) return PrepareError(db);
  }
  for (size_t i = 0; i < values.size(); ++i) {
    Statement ins(db, insert_sql);
    if (!ins) return PrepareError(db);
    BindText(ins.get(), 1, owner);
    BindI32(ins.get(), 2, static_cast<int>(i));
    BindText(ins.get(), 3, values[i]);
    if (sqlite3_step(ins.get()) != SQLITE_DONE) return PrepareError(db);
  }
  return Result::Ok();
}

std::vector<std::string> ReadList(sqlite3* db, const char* sql, const std::string& owner) {
  std::vector<std::string> values;
  Statement                st(db, sql);
  if (!st) return values;
  BindText(st.get(), 1, owner);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    values.push_back(ColText(st.get(), 0));
  }
  return values;
}

constexpr const char* kContainerColumns =
    "SELECT id,name,image_name,image_id,state,healthcheck_command,health_status,created_at_ms FROM containers ";

model::ContainerRecord ReadContainerRow(sqlite3* db, sqlite3_stmt* st) {
  model::ContainerRecord r;
  r.id                  = ColText(st, 0);
  r.name                = ColText(st, 1);
  r.image_name          = ColText(st, 2);
  r.image_id            = ColText(st, 3);
  r.state               = static_cast<model::ContainerState>(ColI32(st, 4));
  r.healthcheck_command = ColText(st, 5);
  r.health_status       = ColText(st, 6);
  r.created_at_ms       = ColU64(st, 7);
  r.labels              = ReadLabels(db, "SELECT key,value FROM container_labels WHERE container_id=? ORDER BY key;", r.id);
  return r;
}

constexpr const char* kImageColumns = "SELECT id,digest,size_bytes,created_at_ms FROM images ";

model::ImageRecord ReadImageRow(sqlite3* db, sqlite3_stmt* st) {
  model::ImageRecord r;
  r.id            = ColText(st, 0);
  r.digest        = ColText(st, 1);
  r.size_bytes    = ColU64(st, 2);
  r.created_at_ms = ColU64(st, 3);
  r.names         = ReadList(db, "SELECT name FROM image_names WHERE image_id=? ORDER BY position;", r.id);
  r.labels        = ReadLabels(db, "SELECT key,value FROM image_labels WHERE image_id=? ORDER BY key;", r.id);
  return r;
}

model::NetworkRecord ReadNetworkRow(sqlite3* db, sqlite3_stmt* st) {
  model::NetworkRecord r;
  r.name        = ColText(st, 0);
  r.id          = ColText(st, 1);
  r.driver      = ColText(st, 2);
  r.dns_servers = ReadList(db, "SELECT server FROM network_dns WHERE network=? ORDER BY position;", r.name);
  return r;
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  BootstrapSchema();
}

void SqliteStore::BootstrapSchema() {
  for (const char* sql : kSchema) {
    db_->Exec(sql);
  }
}

std::unique_ptr<storage::Transaction> SqliteStore::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteStore::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Containers
// ------------------------------------------------------------------

Result SqliteStore::InsertContainer(Transaction& t, const model::ContainerRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO containers(id,name,image_name,image_id,state,healthcheck_command,health_status,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.image_name);
  BindText(st.get(), 4, r.image_id);
  BindI32(st.get(), 5, static_cast<int>(r.state));
  BindText(st.get(), 6, r.healthcheck_command);
  BindText(st.get(), 7, r.health_status);
  BindU64(st.get(), 8, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  return WriteLabels(db, "DELETE FROM container_labels WHERE container_id=?;",
                     "INSERT INTO container_labels(container_id,key,value) VALUES(?,?,?);", r.id, r.labels);
}

std::optional<model::ContainerRecord> SqliteStore::GetContainer(Transaction& t, const std::string& name_or_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kContainerColumns) + "WHERE id=? OR name=? ORDER BY seq LIMIT 1;";
  Statement         st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, name_or_id);
  BindText(st.get(), 2, name_or_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadContainerRow(db, st.get());
}

std::vector<model::ContainerRecord> SqliteStore::ListContainers(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::ContainerRecord> out;
  const std::string                   sql = std::string(kContainerColumns) + "ORDER BY seq;";
  Statement                           st(db, sql.c_str());
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadContainerRow(db, st.get()));
  }
  return out;
}

Result SqliteStore::UpdateContainer(Transaction& t, const model::ContainerRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE containers SET name=?,image_name=?,image_id=?,state=?,healthcheck_command=?,health_status=?,created_at_ms=? "
               "WHERE id=?;");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.image_name);
  BindText(st.get(), 3, r.image_id);
  BindI32(st.get(), 4, static_cast<int>(r.state));
  BindText(st.get(), 5, r.healthcheck_command);
  BindText(st.get(), 6, r.health_status);
  BindU64(st.get(), 7, r.created_at_ms);
  BindText(st.get(), 8, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);

  return WriteLabels(db, "DELETE FROM container_labels WHERE container_id=?;",
                     "INSERT INTO container_labels(container_id,key,value) VALUES(?,?,?);", r.id, r.labels);
}

Result SqliteStore::DeleteContainer(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM containers WHERE id=?;");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result SqliteStore::InsertImage(Transaction& t, const model::ImageRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO images(id,digest,size_bytes,created_at_ms) VALUES(?,?,?,?);");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.digest);
  BindU64(st.get(), 3, r.size_bytes);
  BindU64(st.get(), 4, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  result = WriteList(db, "DELETE FROM image_names WHERE image_id=?;", "INSERT INTO image_names(image_id,position,name) VALUES(?,?,?);",
                     r.id, r.names);
  if (!result) return result;

  return WriteLabels(db, "DELETE FROM image_labels WHERE image_id=?;", "INSERT INTO image_labels(image_id,key,value) VALUES(?,?,?);",
                     r.id, r.labels);
}

std::optional<model::ImageRecord> SqliteStore::GetImage(Transaction& t, const std::string& name_or_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string(kImageColumns) +
                          "WHERE id=? OR id IN (SELECT image_id FROM image_names WHERE name=?) ORDER BY seq LIMIT 1;";
  Statement st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, name_or_id);
  BindText(st.get(), 2, name_or_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadImageRow(db, st.get());
}

std::vector<model::ImageRecord> SqliteStore::ListImages(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::ImageRecord> out;
  const std::string               sql = std::string(kImageColumns) + "ORDER BY seq;";
  Statement                       st(db, sql.c_str());
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadImageRow(db, st.get()));
  }
  return out;
}

Result SqliteStore::UpdateImage(Transaction& t, const model::ImageRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE images SET digest=?,size_bytes=?,created_at_ms=? WHERE id=?;");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.digest);
  BindU64(st.get(), 2, r.size_bytes);
  BindU64(st.get(), 3, r.created_at_ms);
  BindText(st.get(), 4, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);

  result = WriteList(db, "DELETE FROM image_names WHERE image_id=?;", "INSERT INTO image_names(image_id,position,name) VALUES(?,?,?);",
                     r.id, r.names);
  if (!result) return result;

  return WriteLabels(db, "DELETE FROM image_labels WHERE image_id=?;", "INSERT INTO image_labels(image_id,key,value) VALUES(?,?,?);",
                     r.id, r.labels);
}

// ------------------------------------------------------------------
// Networks
// ------------------------------------------------------------------

Result SqliteStore::InsertNetwork(Transaction& t, const model::NetworkRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO networks(name,id,driver) VALUES(?,?,?);");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.id);
  BindText(st.get(), 3, r.driver);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;

  return WriteList(db, "DELETE FROM network_dns WHERE network=?;", "INSERT INTO network_dns(network,position,server) VALUES(?,?,?);",
                   r.name, r.dns_servers);
}

std::optional<model::NetworkRecord> SqliteStore::GetNetwork(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT name,id,driver FROM networks WHERE name=? OR id=? ORDER BY seq LIMIT 1;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, name);
  BindText(st.get(), 2, name);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadNetworkRow(db, st.get());
}

std::vector<model::NetworkRecord> SqliteStore::ListNetworks(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::NetworkRecord> out;
  Statement                         st(db, "SELECT name,id,driver FROM networks ORDER BY seq;");
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadNetworkRow(db, st.get()));
  }
  return out;
}

Result SqliteStore::UpdateNetwork(Transaction& t, const model::NetworkRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE networks SET id=?,driver=? WHERE name=?;");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.driver);
  BindText(st.get(), 3, r.name);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);

  return WriteList(db, "DELETE FROM network_dns WHERE network=?;", "INSERT INTO network_dns(network,position,server) VALUES(?,?,?);",
                   r.name, r.dns_servers);
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

Result SqliteStore::UpsertArtifact(Transaction& t, const model::ArtifactRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO artifacts(name,digest,pulled_at_ms) VALUES(?,?,?) "
               "ON CONFLICT(name) DO UPDATE SET digest=excluded.digest, pulled_at_ms=excluded.pulled_at_ms;");
  if (!st) return PrepareError(db);

  BindText(st.get(), 1, r.name);
  BindText(st.get(), 2, r.digest);
  BindU64(st.get(), 3, r.pulled_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ArtifactRecord> SqliteStore::GetArtifact(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT name,digest,pulled_at_ms FROM artifacts WHERE name=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, name);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ArtifactRecord r;
  r.name         = ColText(st.get(), 0);
  r.digest       = ColText(st.get(), 1);
  r.pulled_at_ms = ColU64(st.get(), 2);
  return r;
}

} // namespace berth::storage::sqlite
