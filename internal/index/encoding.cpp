#include "encoding.hpp"

namespace chunkstore::index {

void AppendUint64(std::string& out, std::uint64_t v) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((v >> shift) & 0xff));
  }
}

void AppendInt64(std::string& out, std::int64_t v) {
  AppendUint64(out, static_cast<std::uint64_t>(v));
}

std::string EncodeUint64(std::uint64_t v) {
  std::string out;
  out.reserve(8);
  AppendUint64(out, v);
  return out;
}

std::uint64_t ReadUint64(std::string_view in, std::size_t offset) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    v = (v << 8) | static_cast<unsigned char>(in[offset + i]);
  }
  return v;
}

std::int64_t ReadInt64(std::string_view in, std::size_t offset) {
  return static_cast<std::int64_t>(ReadUint64(in, offset));
}

} // namespace chunkstore::index
