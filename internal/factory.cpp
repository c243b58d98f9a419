#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hex.hpp"

namespace chunkstore::factory {

using observability::StringField;

std::shared_ptr<db::KVStore> BuildKVStore(const chunkstore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteKVStore::Bootstrap(*sqlite_db);
    CHUNKSTORE_LOG_INFO("opened sqlite engine", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteKVStore>(std::move(sqlite_db));
  }

  CHUNKSTORE_LOG_INFO("using in-memory engine");
  return std::make_shared<db::memory::MemoryKVStore>();
}

Application Build(const chunkstore::runtime::config::RuntimeConfig& config) {
  Application app;
  app.kv_store = BuildKVStore(config);

  core::ChunkStoreOptions options;
  options.base_address  = util::FromHex(config.store().base_address());
  options.capacity      = config.store().capacity();
  options.gc_batch_size = config.store().gc_batch_size();

  app.store             = std::make_shared<core::ChunkStore>(app.kv_store, std::move(options));
  app.garbage_collector = std::make_shared<core::GarbageCollector>(app.store);
  return app;
}

} // namespace chunkstore::factory
