#include "kv_store.hpp"

namespace chunkstore::db {

std::string PrefixUpperBound(const std::string& prefix) {
  std::string upper = prefix;
  while (!upper.empty()) {
    auto& last = upper.back();
    if (static_cast<unsigned char>(last) != 0xff) {
      last = static_cast<char>(static_cast<unsigned char>(last) + 1);
      return upper;
    }
    upper.pop_back();
  }
  return upper;
}

} // namespace chunkstore::db
