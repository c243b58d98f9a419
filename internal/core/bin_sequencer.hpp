#pragma once

#include <cstdint>

#include "internal/index/uint64_vector.hpp"

namespace chunkstore::core {

/*
  Issues bin ids: strictly increasing per bin, never reused.

  NextBinID throws util::SequencerError when the next id cannot be
  persisted. Ids are committed before the index batch that uses them,
  so an aborted mutation leaves a gap, never a duplicate.
*/
class BinSequencer {
 public:
  virtual ~BinSequencer() = default;

  virtual std::uint64_t NextBinID(std::uint8_t bin) = 0;
};

/*
  BinSequencer persisted in a Uint64Vector slot per bin.

  Not internally synchronized; ChunkStore calls it under its batch mutex.
*/
class PersistentBinSequencer final : public BinSequencer {
 public:
  explicit PersistentBinSequencer(index::Uint64Vector counters);

  std::uint64_t NextBinID(std::uint8_t bin) override;

 private:
  index::Uint64Vector counters_;
};

} // namespace chunkstore::core
