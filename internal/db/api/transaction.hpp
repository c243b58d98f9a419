#pragma once

namespace chunkstore::db {

/*
  Engine transaction a backend applies one WriteBatch in.

  Semantics guaranteed for ALL backends:

  - Staged puts/deletes are invisible until Commit()
  - After Commit() every op of the batch is durable, also across a crash
  - Rollback() discards all staged ops
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace chunkstore::db
