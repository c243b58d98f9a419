#include "gc_size.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace chunkstore::core {

GcSizeCounter::GcSizeCounter(index::Uint64Field field) : field_(std::move(field)) {
}

std::uint64_t GcSizeCounter::Get() const {
  std::uint64_t value  = 0;
  auto          result = field_.Get(&value);
  if (!result) {
    throw util::StorageError("read gc size: " + result.message);
  }
  return value;
}

std::uint64_t GcSizeCounter::ApplyDelta(db::WriteBatch& batch, std::int64_t delta) const {
  std::uint64_t value  = 0;
  auto          result = field_.AddInBatch(batch, delta, &value);
  if (!result) {
    throw util::StorageError("update gc size: " + result.message);
  }
  return value;
}

} // namespace chunkstore::core
