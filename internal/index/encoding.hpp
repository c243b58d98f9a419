#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chunkstore::index {

/*
  Big-endian integer encoding for keys and values.

  Big-endian keeps bytewise key order equal to numeric order, which the
  push, pull and gc indexes rely on for oldest-first iteration.
*/

void AppendUint64(std::string& out, std::uint64_t v);
void AppendInt64(std::string& out, std::int64_t v);

std::string EncodeUint64(std::uint64_t v);

// Caller guarantees at least 8 bytes at offset.
std::uint64_t ReadUint64(std::string_view in, std::size_t offset = 0);
std::int64_t  ReadInt64(std::string_view in, std::size_t offset = 0);

} // namespace chunkstore::index
