#pragma once

#include <string>
#include <string_view>

namespace chunkstore::util {

/*
  Hex helpers for addresses on the command line and in logs.
*/

std::string ToHex(std::string_view bytes);

// Throws InvalidArgument on odd length or non-hex characters.
std::string FromHex(std::string_view hex);

} // namespace chunkstore::util
