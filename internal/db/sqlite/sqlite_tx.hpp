#pragma once

#include <memory>
#include <utility>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace chunkstore::db::sqlite {

/*
  SQLite transaction one SqliteKVStore::Write runs in.

  Uses BEGIN IMMEDIATE so the write lock is taken before the first
  statement of the batch. Rolls back on destruction unless committed;
  a failed rollback is logged.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_  = false;
};

} // namespace chunkstore::db::sqlite
