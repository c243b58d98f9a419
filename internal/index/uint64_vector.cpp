#include "uint64_vector.hpp"

#include <utility>

#include "encoding.hpp"

namespace chunkstore::index {

using db::ErrorCode;
using db::Result;

Uint64Vector::Uint64Vector(std::shared_ptr<db::KVStore> store, std::string name, char prefix)
    : store_(std::move(store)), name_(std::move(name)), prefix_(1, prefix) {
}

std::string Uint64Vector::Key(std::uint64_t i) const {
  std::string key = prefix_;
  AppendUint64(key, i);
  return key;
}

Result Uint64Vector::Get(std::uint64_t i, std::uint64_t* value) const {
  std::string raw;
  auto        result = store_->Get(Key(i), &raw);
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

Result Uint64Vector::Put(std::uint64_t i, std::uint64_t value) const {
  return store_->Put(Key(i), EncodeUint64(value));
}

Result Uint64Vector::Inc(std::uint64_t i, std::uint64_t* value) const {
  std::uint64_t current = 0;
  auto          result  = Get(i, &current);
  if (!result) return result;

  result = Put(i, current + 1);
  if (!result) return result;

  *value = current + 1;
  return Result::Ok();
}

} // namespace chunkstore::index
