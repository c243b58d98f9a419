#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chunkstore::model {

// Content address: hash of the chunk body.
inline constexpr std::size_t kAddressLength = 32;

using Address = std::string;

struct Chunk {
  Address     address;
  std::string data;
};

/*
  Index mutation intents accepted by ChunkStore::Set.
*/
enum class ModeSet : std::uint8_t {
  kAccess = 0,
  kSync   = 1,
  kRemove = 2,
  kPin    = 3,
  kUnpin  = 4,
};

/*
  How a chunk body arrives at the store.

    kUpload  - produced locally, awaits push replication
    kSync    - received through pull synchronization
    kRequest - retrieved on behalf of a request, immediately gc-eligible
*/
enum class ModePut : std::uint8_t {
  kUpload  = 0,
  kSync    = 1,
  kRequest = 2,
};

/*
  Summary of a chunk's index membership.
*/
enum class ChunkState : std::uint8_t {
  kAbsent  = 0,
  kIndexed = 1,
  kPinned  = 2,
};

constexpr std::string_view ToString(ModeSet mode) {
  switch (mode) {
    case ModeSet::kAccess:
      return "access";
    case ModeSet::kSync:
      return "sync";
    case ModeSet::kRemove:
      return "remove";
    case ModeSet::kPin:
      return "pin";
    case ModeSet::kUnpin:
      return "unpin";
    default:
      return "invalid";
  }
}

constexpr std::string_view ToString(ModePut mode) {
  switch (mode) {
    case ModePut::kUpload:
      return "upload";
    case ModePut::kSync:
      return "sync";
    case ModePut::kRequest:
      return "request";
    default:
      return "invalid";
  }
}

constexpr std::string_view ToString(ChunkState state) {
  switch (state) {
    case ChunkState::kAbsent:
      return "absent";
    case ChunkState::kIndexed:
      return "indexed";
    case ChunkState::kPinned:
      return "pinned";
    default:
      return "invalid";
  }
}

// Parses "access", "sync", ... as printed by ToString. Returns false on unknown names.
bool ParseModeSet(std::string_view name, ModeSet* mode);
bool ParseModePut(std::string_view name, ModePut* mode);

} // namespace chunkstore::model
