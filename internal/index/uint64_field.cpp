#include "uint64_field.hpp"

#include <utility>

#include "encoding.hpp"

namespace chunkstore::index {

using db::ErrorCode;
using db::Result;

Uint64Field::Uint64Field(std::shared_ptr<db::KVStore> store, std::string name, char prefix)
    : store_(std::move(store)), name_(std::move(name)), key_(1, prefix) {
}

Result Uint64Field::Get(std::uint64_t* value) const {
  std::string raw;
  auto        result = store_->Get(key_, &raw);
  if (result.IsNotFound()) {
    *value = 0;
    return Result::Ok();
  }
  if (!result) return result;
  if (raw.size() != 8) {
    return Result::Err(ErrorCode::Corruption, name_ + ": malformed counter");
  }
  *value = ReadUint64(raw);
  return Result::Ok();
}

Result Uint64Field::Put(std::uint64_t value) const {
  return store_->Put(key_, EncodeUint64(value));
}

void Uint64Field::PutInBatch(db::WriteBatch& batch, std::uint64_t value) const {
  batch.Put(key_, EncodeUint64(value));
}

Result Uint64Field::AddInBatch(db::WriteBatch& batch, std::int64_t delta, std::uint64_t* result) const {
  std::uint64_t current = 0;
  auto          read    = Get(&current);
  if (!read) return read;

  std::uint64_t next = current;
  if (delta < 0) {
    const auto decrement = static_cast<std::uint64_t>(-delta);
    if (decrement > current) {
      return Result::Err(ErrorCode::InternalError, name_ + ": counter would drop below zero");
    }
    next = current - decrement;
  } else {
    next = current + static_cast<std::uint64_t>(delta);
  }

  PutInBatch(batch, next);
  if (result) *result = next;
  return Result::Ok();
}

} // namespace chunkstore::index
