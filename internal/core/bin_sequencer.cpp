#include "bin_sequencer.hpp"

#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace chunkstore::core {

PersistentBinSequencer::PersistentBinSequencer(index::Uint64Vector counters) : counters_(std::move(counters)) {
}

std::uint64_t PersistentBinSequencer::NextBinID(std::uint8_t bin) {
  std::uint64_t id     = 0;
  auto          result = counters_.Inc(bin, &id);
  if (!result) {
    throw util::SequencerError("next bin id for bin " + std::to_string(bin) + ": " + result.message);
  }
  return id;
}

} // namespace chunkstore::core
