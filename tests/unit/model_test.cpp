#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/chunk.hpp"
#include "internal/model/proximity.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace {

using chunkstore::model::kMaxPO;
using chunkstore::model::Proximity;

std::string AddressWithFirstBytes(unsigned char b0, unsigned char b1) {
  std::string address(chunkstore::model::kAddressLength, '\0');
  address[0] = static_cast<char>(b0);
  address[1] = static_cast<char>(b1);
  return address;
}

void TestProximityCountsLeadingEqualBits() {
  const auto base = AddressWithFirstBytes(0x00, 0x00);

  assert(Proximity(base, AddressWithFirstBytes(0x80, 0x00)) == 0);
  assert(Proximity(base, AddressWithFirstBytes(0x40, 0x00)) == 1);
  assert(Proximity(base, AddressWithFirstBytes(0x01, 0x00)) == 7);
  assert(Proximity(base, AddressWithFirstBytes(0x00, 0x80)) == 8);
  assert(Proximity(base, AddressWithFirstBytes(0x00, 0x01)) == 15);
}

void TestProximityCapsAtMaxPO() {
  const auto base = AddressWithFirstBytes(0xab, 0xcd);
  assert(Proximity(base, base) == kMaxPO);

  auto deep = base;
  deep[5]   = static_cast<char>(0xff);
  assert(Proximity(base, deep) == kMaxPO);
}

void TestParseBinRejectsOutOfRange() {
  std::uint8_t bin = 0;
  assert(chunkstore::model::ParseBin("0", &bin) && bin == 0);
  assert(chunkstore::model::ParseBin("16", &bin) && bin == kMaxPO);

  bin = 7;
  assert(!chunkstore::model::ParseBin("17", &bin));
  assert(!chunkstore::model::ParseBin("300", &bin));
  assert(!chunkstore::model::ParseBin("-1", &bin));
  assert(!chunkstore::model::ParseBin("3x", &bin));
  assert(!chunkstore::model::ParseBin("", &bin));
  assert(bin == 7);
}

void TestModeNamesRoundTrip() {
  chunkstore::model::ModeSet mode;
  assert(chunkstore::model::ParseModeSet("unpin", &mode));
  assert(mode == chunkstore::model::ModeSet::kUnpin);
  assert(!chunkstore::model::ParseModeSet("touch", &mode));
  assert(chunkstore::model::ToString(static_cast<chunkstore::model::ModeSet>(42)) == "invalid");

  chunkstore::model::ModePut put_mode;
  assert(chunkstore::model::ParseModePut("request", &put_mode));
  assert(put_mode == chunkstore::model::ModePut::kRequest);
}

void TestHex() {
  assert(chunkstore::util::ToHex(std::string("\x00\xff\x10", 3)) == "00ff10");
  assert(chunkstore::util::FromHex("0x00FF10") == std::string("\x00\xff\x10", 3));

  bool threw = false;
  try {
    (void)chunkstore::util::FromHex("abc");
  } catch (const chunkstore::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)chunkstore::util::FromHex("zz");
  } catch (const chunkstore::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestProximityCountsLeadingEqualBits();
  TestProximityCapsAtMaxPO();
  TestParseBinRejectsOutOfRange();
  TestModeNamesRoundTrip();
  TestHex();

  std::cout << "chunkstore_unit_model: pass\n";
  return 0;
}
