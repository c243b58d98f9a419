#pragma once

#include <cstdint>
#include <string>

namespace chunkstore::index {

/*
  Cross-index record of one chunk.

  Every index stores a projection of these fields. Only address is
  required; zero means "unset" for the numeric fields.
*/
struct Item {
  std::string address;
  std::string data;

  std::int64_t  store_timestamp  = 0;
  std::int64_t  access_timestamp = 0;
  std::uint64_t bin_id           = 0;
  std::uint64_t pin_counter      = 0;

  // Copies every field set in other that is unset here.
  Item Merge(const Item& other) const;
};

inline Item Item::Merge(const Item& other) const {
  Item merged = *this;
  if (merged.address.empty()) merged.address = other.address;
  if (merged.data.empty()) merged.data = other.data;
  if (merged.store_timestamp == 0) merged.store_timestamp = other.store_timestamp;
  if (merged.access_timestamp == 0) merged.access_timestamp = other.access_timestamp;
  if (merged.bin_id == 0) merged.bin_id = other.bin_id;
  if (merged.pin_counter == 0) merged.pin_counter = other.pin_counter;
  return merged;
}

} // namespace chunkstore::index
