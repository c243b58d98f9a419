#include "proximity.hpp"

#include <algorithm>
#include <charconv>

namespace chunkstore::model {

std::uint8_t Proximity(std::string_view one, std::string_view other) {
  const std::size_t bytes = std::min<std::size_t>((kMaxPO + 7) / 8, std::min(one.size(), other.size()));

  for (std::size_t i = 0; i < bytes; ++i) {
    const auto oxo = static_cast<unsigned char>(one[i]) ^ static_cast<unsigned char>(other[i]);
    if (oxo == 0) continue;
    for (std::size_t j = 0; j < 8; ++j) {
      if (((oxo >> (7 - j)) & 0x01) != 0) {
        return static_cast<std::uint8_t>(std::min<std::size_t>(i * 8 + j, kMaxPO));
      }
    }
  }
  return kMaxPO;
}

bool ParseBin(std::string_view text, std::uint8_t* bin) {
  unsigned long value = 0;
  const auto    end   = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc() || ptr != end || value > kMaxPO) {
    return false;
  }
  *bin = static_cast<std::uint8_t>(value);
  return true;
}

} // namespace chunkstore::model
