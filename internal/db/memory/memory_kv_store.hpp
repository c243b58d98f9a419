#pragma once

#include <map>
#include <shared_mutex>
#include <string>

#include "internal/db/api/kv_store.hpp"

namespace chunkstore::db::memory {

/*
  In-process engine backed by an ordered map.

  Batches are applied under the exclusive lock, so readers see either
  none or all of a batch. Nothing survives the process.
*/
class MemoryKVStore final : public db::KVStore {
 public:
  MemoryKVStore();

  bool IsHealthy() const override {
    return true;
  }

  Result Get(const std::string& key, std::string* value) override;
  Result Has(const std::string& key, bool* found) override;
  Result Write(const WriteBatch& batch) override;
  Result Iterate(const IterateOptions& options, const IterateFn& fn) override;
  Result Last(const std::string& prefix, std::string* key, std::string* value) override;

 private:
  mutable std::shared_mutex          mutex_;
  std::map<std::string, std::string> data_;
};

} // namespace chunkstore::db::memory
