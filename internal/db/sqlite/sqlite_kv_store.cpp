#include "sqlite_kv_store.hpp"

#include <sqlite3.h>

#include <exception>
#include <utility>
#include <vector>

#include "sqlite_tx.hpp"

namespace chunkstore::db::sqlite {

namespace {

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

/*
  Finalizes the statement when leaving scope.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  int PrepareCode() const {
    return rc_;
  }
  sqlite3_stmt* Get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

} // namespace

SqliteKVStore::SqliteKVStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteKVStore::Bootstrap(SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS kv (key BLOB PRIMARY KEY, value BLOB NOT NULL) WITHOUT ROWID;");
  db.Exec("SELECT key,value FROM kv LIMIT 1;");
}

Result SqliteKVStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

bool SqliteKVStore::IsHealthy() const {
  std::lock_guard lock(mutex_);
  Statement       st(db_->Handle(), "SELECT 1;");
  return st.Ok() && sqlite3_step(st.Get()) == SQLITE_ROW;
}

Result SqliteKVStore::Get(const std::string& key, std::string* value) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "SELECT value FROM kv WHERE key=?;");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindBlob(st.Get(), 1, key);
  int rc = sqlite3_step(st.Get());
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
  if (rc != SQLITE_ROW) return Translate(db, rc);

  if (value) *value = ColBlob(st.Get(), 0);
  return Result::Ok();
}

Result SqliteKVStore::Has(const std::string& key, bool* found) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  Statement st(db, "SELECT 1 FROM kv WHERE key=?;");
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindBlob(st.Get(), 1, key);
  int rc = sqlite3_step(st.Get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) return Translate(db, rc);

  *found = rc == SQLITE_ROW;
  return Result::Ok();
}

Result SqliteKVStore::Write(const WriteBatch& batch) {
  if (batch.Empty()) return Result::Ok();

  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  try {
    SqliteTransaction tx(db_);

    Statement put(db, "INSERT INTO kv(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
    if (!put.Ok()) return Translate(db, put.PrepareCode());
    Statement del(db, "DELETE FROM kv WHERE key=?;");
    if (!del.Ok()) return Translate(db, del.PrepareCode());

    for (const auto& op : batch.Ops()) {
      sqlite3_stmt* st = op.type == WriteBatch::OpType::kPut ? put.Get() : del.Get();
      sqlite3_reset(st);
      sqlite3_clear_bindings(st);
      BindBlob(st, 1, op.key);
      if (op.type == WriteBatch::OpType::kPut) BindBlob(st, 2, op.value);

      int rc = sqlite3_step(st);
      if (rc != SQLITE_DONE) {
        // tx rolls back on scope exit
        return Translate(db, rc);
      }
    }

    sqlite3_reset(put.Get());
    sqlite3_reset(del.Get());
    tx.Commit();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Ok();
}

Result SqliteKVStore::Iterate(const IterateOptions& options, const IterateFn& fn) {
  // Rows are read out before callbacks run so they can call back into the store.
  std::vector<std::pair<std::string, std::string>> rows;
  {
    std::lock_guard lock(mutex_);
    auto*           db = db_->Handle();

    const auto  start = options.start_from.empty() ? options.prefix : options.start_from;
    const auto  upper = PrefixUpperBound(options.prefix);
    const char* sql   = upper.empty() ? "SELECT key,value FROM kv WHERE key>=? ORDER BY key;"
                                      : "SELECT key,value FROM kv WHERE key>=? AND key<? ORDER BY key;";

    Statement st(db, sql);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindBlob(st.Get(), 1, start);
    if (!upper.empty()) BindBlob(st.Get(), 2, upper);

    int rc;
    while ((rc = sqlite3_step(st.Get())) == SQLITE_ROW) {
      auto key = ColBlob(st.Get(), 0);
      if (options.skip_start_from && key == options.start_from) continue;
      rows.emplace_back(std::move(key), ColBlob(st.Get(), 1));
    }
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  for (const auto& [key, value] : rows) {
    if (fn(key, value)) break;
  }
  return Result::Ok();
}

Result SqliteKVStore::Last(const std::string& prefix, std::string* key, std::string* value) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const auto  upper = PrefixUpperBound(prefix);
  const char* sql   = upper.empty() ? "SELECT key,value FROM kv WHERE key>=? ORDER BY key DESC LIMIT 1;"
                                    : "SELECT key,value FROM kv WHERE key>=? AND key<? ORDER BY key DESC LIMIT 1;";

  Statement st(db, sql);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindBlob(st.Get(), 1, prefix);
  if (!upper.empty()) BindBlob(st.Get(), 2, upper);

  int rc = sqlite3_step(st.Get());
  if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound);
  if (rc != SQLITE_ROW) return Translate(db, rc);

  if (key) *key = ColBlob(st.Get(), 0);
  if (value) *value = ColBlob(st.Get(), 1);
  return Result::Ok();
}

} // namespace chunkstore::db::sqlite
