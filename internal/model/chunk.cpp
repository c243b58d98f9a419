#include "chunk.hpp"

namespace chunkstore::model {

bool ParseModeSet(std::string_view name, ModeSet* mode) {
  for (auto candidate : {ModeSet::kAccess, ModeSet::kSync, ModeSet::kRemove, ModeSet::kPin, ModeSet::kUnpin}) {
    if (ToString(candidate) == name) {
      *mode = candidate;
      return true;
    }
  }
  return false;
}

bool ParseModePut(std::string_view name, ModePut* mode) {
  for (auto candidate : {ModePut::kUpload, ModePut::kSync, ModePut::kRequest}) {
    if (ToString(candidate) == name) {
      *mode = candidate;
      return true;
    }
  }
  return false;
}

} // namespace chunkstore::model
