#pragma once

#include <cstdint>
#include <string_view>

namespace chunkstore::model {

// Highest bin; addresses sharing more leading bits land here too.
inline constexpr std::uint8_t kMaxPO = 16;

/*
  Proximity order of two addresses: the number of leading bits they
  share, capped at kMaxPO. Used as the bin of a chunk relative to the
  node's base address.
*/
std::uint8_t Proximity(std::string_view one, std::string_view other);

// Parses a decimal bin number; false unless it is within [0, kMaxPO].
bool ParseBin(std::string_view text, std::uint8_t* bin);

} // namespace chunkstore::model
