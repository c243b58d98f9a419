#include "chunk_indexes.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "internal/index/encoding.hpp"
#include "internal/model/proximity.hpp"

namespace chunkstore::core {

using index::Item;

namespace {

constexpr std::size_t kU64 = 8;

// Keys made only of the address.
std::string AddressKey(const Item& item) {
  return item.address;
}

std::optional<Item> DecodeAddressKey(std::string_view key) {
  if (key.empty()) return std::nullopt;
  Item item;
  item.address = std::string(key);
  return item;
}

std::string EmptyValue(const Item&) {
  return {};
}

std::optional<Item> DecodeEmptyValue(const Item& key, std::string_view value) {
  if (!value.empty()) return std::nullopt;
  return key;
}

} // namespace

index::IndexFuncs RetrievalDataFuncs() {
  index::IndexFuncs funcs;
  funcs.encode_key   = AddressKey;
  funcs.decode_key   = DecodeAddressKey;
  funcs.encode_value = [](const Item& item) {
    std::string out;
    out.reserve(2 * kU64 + item.data.size());
    index::AppendInt64(out, item.store_timestamp);
    index::AppendUint64(out, item.bin_id);
    out.append(item.data);
    return out;
  };
  funcs.decode_value = [](const Item& key, std::string_view value) -> std::optional<Item> {
    if (value.size() < 2 * kU64) return std::nullopt;
    Item item            = key;
    item.store_timestamp = index::ReadInt64(value, 0);
    item.bin_id          = index::ReadUint64(value, kU64);
    item.data            = std::string(value.substr(2 * kU64));
    return item;
  };
  return funcs;
}

index::IndexFuncs RetrievalAccessFuncs() {
  index::IndexFuncs funcs;
  funcs.encode_key   = AddressKey;
  funcs.decode_key   = DecodeAddressKey;
  funcs.encode_value = [](const Item& item) {
    std::string out;
    index::AppendInt64(out, item.access_timestamp);
    index::AppendInt64(out, item.store_timestamp);
    index::AppendUint64(out, item.bin_id);
    return out;
  };
  funcs.decode_value = [](const Item& key, std::string_view value) -> std::optional<Item> {
    if (value.size() != 3 * kU64) return std::nullopt;
    Item item             = key;
    item.access_timestamp = index::ReadInt64(value, 0);
    item.store_timestamp  = index::ReadInt64(value, kU64);
    item.bin_id           = index::ReadUint64(value, 2 * kU64);
    return item;
  };
  return funcs;
}

index::IndexFuncs PushFuncs() {
  index::IndexFuncs funcs;
  funcs.encode_key = [](const Item& item) {
    std::string out;
    index::AppendInt64(out, item.store_timestamp);
    out.append(item.address);
    return out;
  };
  funcs.decode_key = [](std::string_view key) -> std::optional<Item> {
    if (key.size() <= kU64) return std::nullopt;
    Item item;
    item.store_timestamp = index::ReadInt64(key, 0);
    item.address         = std::string(key.substr(kU64));
    return item;
  };
  funcs.encode_value = EmptyValue;
  funcs.decode_value = DecodeEmptyValue;
  return funcs;
}

index::IndexFuncs PullFuncs(std::string base_address) {
  index::IndexFuncs funcs;
  funcs.encode_key = [base = std::move(base_address)](const Item& item) {
    std::string out;
    out.push_back(static_cast<char>(model::Proximity(base, item.address)));
    index::AppendUint64(out, item.bin_id);
    out.append(item.address);
    return out;
  };
  funcs.decode_key = [](std::string_view key) -> std::optional<Item> {
    if (key.size() <= 1 + kU64) return std::nullopt;
    Item item;
    item.bin_id  = index::ReadUint64(key, 1);
    item.address = std::string(key.substr(1 + kU64));
    return item;
  };
  funcs.encode_value = EmptyValue;
  funcs.decode_value = DecodeEmptyValue;
  return funcs;
}

index::IndexFuncs GcFuncs() {
  index::IndexFuncs funcs;
  funcs.encode_key = [](const Item& item) {
    std::string out;
    index::AppendInt64(out, item.access_timestamp);
    index::AppendUint64(out, item.bin_id);
    out.append(item.address);
    return out;
  };
  funcs.decode_key = [](std::string_view key) -> std::optional<Item> {
    if (key.size() <= 2 * kU64) return std::nullopt;
    Item item;
    item.access_timestamp = index::ReadInt64(key, 0);
    item.bin_id           = index::ReadUint64(key, kU64);
    item.address          = std::string(key.substr(2 * kU64));
    return item;
  };
  funcs.encode_value = EmptyValue;
  funcs.decode_value = DecodeEmptyValue;
  return funcs;
}

index::IndexFuncs GcExcludeFuncs() {
  index::IndexFuncs funcs;
  funcs.encode_key   = AddressKey;
  funcs.decode_key   = DecodeAddressKey;
  funcs.encode_value = EmptyValue;
  funcs.decode_value = DecodeEmptyValue;
  return funcs;
}

index::IndexFuncs PinFuncs() {
  index::IndexFuncs funcs;
  funcs.encode_key   = AddressKey;
  funcs.decode_key   = DecodeAddressKey;
  funcs.encode_value = [](const Item& item) { return index::EncodeUint64(item.pin_counter); };
  funcs.decode_value = [](const Item& key, std::string_view value) -> std::optional<Item> {
    if (value.size() != kU64) return std::nullopt;
    Item item        = key;
    item.pin_counter = index::ReadUint64(value, 0);
    return item;
  };
  return funcs;
}

} // namespace chunkstore::core
