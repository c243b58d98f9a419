#pragma once

#include <cstdint>

#include "internal/db/api/write_batch.hpp"
#include "internal/index/uint64_field.hpp"

namespace chunkstore::core {

/*
  Persisted number of chunks in the gc index.

  Only ever changed by a delta staged into the same batch as the index
  writes that justify it.
*/
class GcSizeCounter {
 public:
  explicit GcSizeCounter(index::Uint64Field field);

  std::uint64_t Get() const;

  // Stages committed value + delta into batch and returns the staged value.
  // Throws util::StorageError on read failure or underflow.
  std::uint64_t ApplyDelta(db::WriteBatch& batch, std::int64_t delta) const;

 private:
  index::Uint64Field field_;
};

} // namespace chunkstore::core
