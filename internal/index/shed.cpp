#include "shed.hpp"

#include <stdexcept>
#include <utility>

namespace chunkstore::index {

namespace {

const std::string kSchemaKey("\x00schema", 7);

constexpr unsigned kFirstPrefix = 1;
constexpr unsigned kLastPrefix  = 255;

} // namespace

Shed::Shed(std::shared_ptr<db::KVStore> store) : store_(std::move(store)) {
  std::string raw;
  auto        result = store_->Get(kSchemaKey, &raw);
  if (result.IsNotFound()) {
    return;
  }
  if (!result) {
    throw std::runtime_error("shed: read schema: " + result.message);
  }
  if (!schema_.ParseFromString(raw)) {
    throw std::runtime_error("shed: schema record is corrupt");
  }
}

char Shed::Mount(const std::string& name, const std::string& kind) {
  std::lock_guard lock(mutex_);

  if (auto it = schema_.prefixes().find(name); it != schema_.prefixes().end()) {
    const auto& existing_kind = schema_.kinds().at(name);
    if (existing_kind != kind) {
      throw std::runtime_error("shed: " + name + " already mounted as " + existing_kind + ", requested " + kind);
    }
    return static_cast<char>(it->second);
  }

  unsigned next = kFirstPrefix;
  for (const auto& [_, prefix] : schema_.prefixes()) {
    if (prefix >= next) next = prefix + 1;
  }
  if (next > kLastPrefix) {
    throw std::runtime_error("shed: no free key prefix for " + name);
  }

  (*schema_.mutable_prefixes())[name] = next;
  (*schema_.mutable_kinds())[name]    = kind;

  auto result = store_->Put(kSchemaKey, schema_.SerializeAsString());
  if (!result) {
    schema_.mutable_prefixes()->erase(name);
    schema_.mutable_kinds()->erase(name);
    throw std::runtime_error("shed: persist schema: " + result.message);
  }
  return static_cast<char>(next);
}

Index Shed::NewIndex(const std::string& name, IndexFuncs funcs) {
  return Index(store_, name, Mount(name, "index"), std::move(funcs));
}

Uint64Field Shed::NewUint64Field(const std::string& name) {
  return Uint64Field(store_, name, Mount(name, "uint64"));
}

Uint64Vector Shed::NewUint64Vector(const std::string& name) {
  return Uint64Vector(store_, name, Mount(name, "uint64-vector"));
}

db::Result Shed::WriteBatch(const db::WriteBatch& batch) {
  return store_->Write(batch);
}

} // namespace chunkstore::index
