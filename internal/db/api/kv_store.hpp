#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/db/api/write_batch.hpp"

namespace chunkstore::db {

struct IterateOptions {
  // only keys starting with prefix are visited
  std::string prefix;
  // first key to visit (inclusive); empty starts at prefix
  std::string start_from;
  // skip start_from itself when it exists
  bool skip_start_from = false;
};

// Smallest key greater than every key starting with prefix; empty when
// no such key exists (prefix is empty or all 0xff).
std::string PrefixUpperBound(const std::string& prefix);

// Return true to stop iteration.
using IterateFn = std::function<bool(std::string_view key, std::string_view value)>;

/*
  Ordered key-value engine.

  CRITICAL GUARANTEES:

  - Keys are ordered bytewise (memcmp order)
  - Write() applies the whole batch or nothing, also across a crash
  - Get/Has/Iterate never observe a partially applied batch
  - Get reports a missing key as ErrorCode::NotFound, never as an empty value

  Many named indexes share one engine under distinct key prefixes.
*/
class KVStore {
 public:
  virtual ~KVStore() = default;

  virtual bool IsHealthy() const = 0;

  virtual Result Get(const std::string& key, std::string* value) = 0;
  virtual Result Has(const std::string& key, bool* found)         = 0;

  virtual Result Write(const WriteBatch& batch) = 0;

  virtual Result Iterate(const IterateOptions& options, const IterateFn& fn) = 0;

  // Greatest key with the given prefix; NotFound if there is none.
  virtual Result Last(const std::string& prefix, std::string* key, std::string* value) = 0;

  Result Put(const std::string& key, const std::string& value) {
    WriteBatch batch;
    batch.Put(key, value);
    return Write(batch);
  }
};

} // namespace chunkstore::db
