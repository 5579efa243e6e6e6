#include "storage_factory.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#if BERTH_DB_SQLITE
#include "internal/storage/sqlite/sqlite_db.hpp"
#include "internal/storage/sqlite/sqlite_store.hpp"
#endif

namespace berth::storage {

std::shared_ptr<Store> OpenStore(const berth::config::StorageConfig& cfg) {
  switch (cfg.backend_case()) {
    case berth::config::StorageConfig::kSqlite: {
#if BERTH_DB_SQLITE
      if (cfg.sqlite().path().empty()) {
        throw util::Internal("storage.sqlite.path is required");
      }
      auto db = std::make_shared<sqlite::SqliteDB>(cfg.sqlite().path());
      BERTH_LOG_INFO("opened record store", {observability::StringField("backend", "sqlite"), observability::StringField("path", cfg.sqlite().path())});
      return std::make_shared<sqlite::SqliteStore>(std::move(db));
#else
      throw util::Unsupported("sqlite record store is not available in this build");
#endif
    }
    case berth::config::StorageConfig::kMemory:
    case berth::config::StorageConfig::BACKEND_NOT_SET:
      break;
  }

  BERTH_LOG_INFO("opened record store", {observability::StringField("backend", "memory")});
  return std::make_shared<memory::MemoryStore>();
}

} // namespace berth::storage
