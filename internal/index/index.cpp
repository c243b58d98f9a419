#include "index.hpp"

#include <utility>

namespace chunkstore::index {

using db::ErrorCode;
using db::Result;

Index::Index(std::shared_ptr<db::KVStore> store, std::string name, char prefix, IndexFuncs funcs)
    : store_(std::move(store)), name_(std::move(name)), prefix_(1, prefix), funcs_(std::move(funcs)) {
}

std::string Index::FullKey(const Item& item) const {
  return prefix_ + funcs_.encode_key(item);
}

Result Index::Decode(std::string_view full_key, std::string_view value, Item* out) const {
  auto key_item = funcs_.decode_key(full_key.substr(prefix_.size()));
  if (!key_item) {
    return Result::Err(ErrorCode::Corruption, name_ + ": malformed key");
  }
  auto item = funcs_.decode_value(*key_item, value);
  if (!item) {
    return Result::Err(ErrorCode::Corruption, name_ + ": malformed value");
  }
  *out = item->Merge(*key_item);
  return Result::Ok();
}

Result Index::Get(const Item& key, Item* out) const {
  const auto  full_key = FullKey(key);
  std::string value;
  auto        result = store_->Get(full_key, &value);
  if (!result) return result;
  return Decode(full_key, value, out);
}

Result Index::Has(const Item& key, bool* found) const {
  return store_->Has(FullKey(key), found);
}

void Index::PutInBatch(db::WriteBatch& batch, const Item& item) const {
  batch.Put(FullKey(item), funcs_.encode_value(item));
}

void Index::DeleteInBatch(db::WriteBatch& batch, const Item& item) const {
  batch.Delete(FullKey(item));
}

Result Index::Put(const Item& item) const {
  return store_->Put(FullKey(item), funcs_.encode_value(item));
}

Result Index::Iterate(const IndexIterateFn& fn, const IndexIterateOptions& options) const {
  db::IterateOptions kv_options;
  kv_options.prefix = prefix_ + options.prefix;
  if (!options.start_key.empty()) {
    kv_options.start_from      = prefix_ + options.start_key;
    kv_options.skip_start_from = options.skip_start_key;
  }

  Result decode_error = Result::Ok();
  auto   result       = store_->Iterate(kv_options, [&](std::string_view key, std::string_view value) {
    Item item;
    decode_error = Decode(key, value, &item);
    if (!decode_error) return true;
    return fn(item);
  });
  if (!result) return result;
  return decode_error;
}

Result Index::Last(const std::string& prefix, Item* out) const {
  std::string key;
  std::string value;
  auto        result = store_->Last(prefix_ + prefix, &key, &value);
  if (!result) return result;
  return Decode(key, value, out);
}

Result Index::Count(std::uint64_t* count) const {
  std::uint64_t n = 0;
  db::IterateOptions kv_options;
  kv_options.prefix = prefix_;
  auto result       = store_->Iterate(kv_options, [&](std::string_view, std::string_view) {
    ++n;
    return false;
  });
  if (!result) return result;
  *count = n;
  return Result::Ok();
}

} // namespace chunkstore::index
