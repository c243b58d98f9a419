#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/kv_store.hpp"

namespace chunkstore::index {

/*
  Single persisted counter. A missing key reads as zero.
*/
class Uint64Field {
 public:
  Uint64Field(std::shared_ptr<db::KVStore> store, std::string name, char prefix);

  const std::string& Name() const {
    return name_;
  }

  db::Result Get(std::uint64_t* value) const;
  db::Result Put(std::uint64_t value) const;
  void       PutInBatch(db::WriteBatch& batch, std::uint64_t value) const;

  // Reads the committed value and stages value + delta into batch.
  // Fails without staging if the result would be negative.
  db::Result AddInBatch(db::WriteBatch& batch, std::int64_t delta, std::uint64_t* result = nullptr) const;

 private:
  std::shared_ptr<db::KVStore> store_;
  std::string                  name_;
  std::string                  key_;
};

} // namespace chunkstore::index
