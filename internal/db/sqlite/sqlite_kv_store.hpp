#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/kv_store.hpp"
#include "sqlite_db.hpp"

namespace chunkstore::db::sqlite {

/*
  Engine stored in one sqlite table:

    kv(key BLOB PRIMARY KEY, value BLOB NOT NULL) WITHOUT ROWID

  BLOB comparison is memcmp, which gives the bytewise order KVStore
  promises. Every Write runs in its own BEGIN IMMEDIATE transaction.
  Statements share one connection and are serialized by mutex_.
*/
class SqliteKVStore final : public db::KVStore {
 public:
  explicit SqliteKVStore(std::shared_ptr<SqliteDB> db);

  // Creates the kv table when missing.
  static void Bootstrap(SqliteDB& db);

  bool IsHealthy() const override;

  Result Get(const std::string& key, std::string* value) override;
  Result Has(const std::string& key, bool* found) override;
  Result Write(const WriteBatch& batch) override;
  Result Iterate(const IterateOptions& options, const IterateFn& fn) override;
  Result Last(const std::string& prefix, std::string* key, std::string* value) override;

 private:
  std::shared_ptr<SqliteDB> db_;
  mutable std::mutex        mutex_;

  static Result Translate(sqlite3* db, int rc);
};

} // namespace chunkstore::db::sqlite
