#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "db/schema.pb.h"
#include "index.hpp"
#include "internal/db/api/kv_store.hpp"
#include "uint64_field.hpp"
#include "uint64_vector.hpp"

namespace chunkstore::index {

/*
  Mounts named indexes and counters on one engine.

  Each name gets a one byte key prefix. The name -> prefix assignment is
  persisted as a schema record under prefix 0, so reopening an existing
  engine mounts every name at the same prefix again. Mounting a known
  name under a different kind throws.
*/
class Shed {
 public:
  explicit Shed(std::shared_ptr<db::KVStore> store);

  Index        NewIndex(const std::string& name, IndexFuncs funcs);
  Uint64Field  NewUint64Field(const std::string& name);
  Uint64Vector NewUint64Vector(const std::string& name);

  db::KVStore& Store() {
    return *store_;
  }

  std::shared_ptr<db::KVStore> StorePtr() const {
    return store_;
  }

  // Applies the batch atomically; nothing is visible before it returns OK.
  db::Result WriteBatch(const db::WriteBatch& batch);

 private:
  char Mount(const std::string& name, const std::string& kind);

  std::shared_ptr<db::KVStore> store_;
  std::mutex                   mutex_;
  chunkstore::db::schema::Schema schema_;
};

} // namespace chunkstore::index
