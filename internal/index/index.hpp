#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/kv_store.hpp"
#include "item.hpp"

namespace chunkstore::index {

/*
  Encoding of one index.

  encode_key/decode_key map the key projection of an Item to bytes and
  back. encode_value/decode_value do the same for the stored value;
  decode_value receives the item decoded from the key. Decoders return
  nullopt on malformed input.
*/
struct IndexFuncs {
  std::function<std::string(const Item&)>                                 encode_key;
  std::function<std::optional<Item>(std::string_view key)>                 decode_key;
  std::function<std::string(const Item&)>                                  encode_value;
  std::function<std::optional<Item>(const Item& key, std::string_view value)> decode_value;
};

struct IndexIterateOptions {
  // raw key bytes (after the index prefix) every visited key must start with
  std::string prefix;
  // raw key bytes (after the index prefix) of the first key to visit
  std::string start_key;
  bool        skip_start_key = false;
};

// Return true to stop iteration.
using IndexIterateFn = std::function<bool(const Item&)>;

/*
  Named index mounted on a shared engine under a one byte key prefix.

  Reads go straight to the engine. Writes are staged into a
  db::WriteBatch so several indexes can change in one atomic commit.
*/
class Index {
 public:
  Index(std::shared_ptr<db::KVStore> store, std::string name, char prefix, IndexFuncs funcs);

  const std::string& Name() const {
    return name_;
  }

  // Key bytes of item without the index prefix.
  std::string EncodeKey(const Item& item) const {
    return funcs_.encode_key(item);
  }

  // NotFound when absent, Corruption when the stored bytes do not decode.
  db::Result Get(const Item& key, Item* out) const;
  db::Result Has(const Item& key, bool* found) const;

  void PutInBatch(db::WriteBatch& batch, const Item& item) const;
  void DeleteInBatch(db::WriteBatch& batch, const Item& item) const;

  db::Result Put(const Item& item) const;

  db::Result Iterate(const IndexIterateFn& fn, const IndexIterateOptions& options = {}) const;

  // Last item whose key starts with prefix (raw bytes after the index prefix).
  db::Result Last(const std::string& prefix, Item* out) const;

  db::Result Count(std::uint64_t* count) const;

 private:
  std::string FullKey(const Item& item) const;
  db::Result  Decode(std::string_view full_key, std::string_view value, Item* out) const;

  std::shared_ptr<db::KVStore> store_;
  std::string                  name_;
  std::string                  prefix_;
  IndexFuncs                   funcs_;
};

} // namespace chunkstore::index
