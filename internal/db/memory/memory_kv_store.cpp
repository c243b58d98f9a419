#include "memory_kv_store.hpp"

#include <mutex>
#include <utility>
#include <vector>

namespace chunkstore::db::memory {

namespace {

bool HasPrefix(const std::string& key, const std::string& prefix) {
  return key.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

MemoryKVStore::MemoryKVStore() = default;

Result MemoryKVStore::Get(const std::string& key, std::string* value) {
  std::shared_lock lock(mutex_);
  auto             it = data_.find(key);
  if (it == data_.end()) return Result::Err(ErrorCode::NotFound);
  if (value) *value = it->second;
  return Result::Ok();
}

Result MemoryKVStore::Has(const std::string& key, bool* found) {
  std::shared_lock lock(mutex_);
  *found = data_.contains(key);
  return Result::Ok();
}

Result MemoryKVStore::Write(const WriteBatch& batch) {
  std::unique_lock lock(mutex_);
  for (const auto& op : batch.Ops()) {
    if (op.type == WriteBatch::OpType::kPut) {
      data_[op.key] = op.value;
    } else {
      data_.erase(op.key);
    }
  }
  return Result::Ok();
}

Result MemoryKVStore::Iterate(const IterateOptions& options, const IterateFn& fn) {
  // Copy the range out so callbacks may read the store again.
  std::vector<std::pair<std::string, std::string>> range;
  {
    std::shared_lock lock(mutex_);
    const auto&      start = options.start_from.empty() ? options.prefix : options.start_from;
    for (auto it = data_.lower_bound(start); it != data_.end() && HasPrefix(it->first, options.prefix); ++it) {
      if (options.skip_start_from && it->first == options.start_from) continue;
      range.emplace_back(it->first, it->second);
    }
  }

  for (const auto& [key, value] : range) {
    if (fn(key, value)) break;
  }
  return Result::Ok();
}

Result MemoryKVStore::Last(const std::string& prefix, std::string* key, std::string* value) {
  std::shared_lock lock(mutex_);
  const auto upper = PrefixUpperBound(prefix);
  auto       it    = upper.empty() ? data_.end() : data_.lower_bound(upper);
  if (it == data_.begin()) return Result::Err(ErrorCode::NotFound);
  --it;
  if (!HasPrefix(it->first, prefix)) return Result::Err(ErrorCode::NotFound);
  if (key) *key = it->first;
  if (value) *value = it->second;
  return Result::Ok();
}

} // namespace chunkstore::db::memory
