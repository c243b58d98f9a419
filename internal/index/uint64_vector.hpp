#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/kv_store.hpp"

namespace chunkstore::index {

/*
  Persisted counters addressed by a numeric slot. Missing slots read as
  zero.
*/
class Uint64Vector {
 public:
  Uint64Vector(std::shared_ptr<db::KVStore> store, std::string name, char prefix);

  const std::string& Name() const {
    return name_;
  }

  db::Result Get(std::uint64_t i, std::uint64_t* value) const;
  db::Result Put(std::uint64_t i, std::uint64_t value) const;

  // Increments slot i and commits it immediately; value receives the new count.
  db::Result Inc(std::uint64_t i, std::uint64_t* value) const;

 private:
  std::string Key(std::uint64_t i) const;

  std::shared_ptr<db::KVStore> store_;
  std::string                  name_;
  std::string                  prefix_;
};

} // namespace chunkstore::index
