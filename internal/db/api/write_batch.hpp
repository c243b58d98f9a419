#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkstore::db {

/*
  Staged engine mutations.

  Operations are applied in insertion order when the batch is handed to
  KVStore::Write, so the last operation on a key wins. Nothing is visible
  to readers before Write returns OK, and a failed Write applies nothing.
*/
class WriteBatch {
 public:
  enum class OpType : std::uint8_t {
    kPut,
    kDelete,
  };

  struct Op {
    OpType      type = OpType::kPut;
    std::string key;
    std::string value;
  };

  void Put(std::string key, std::string value);
  void Delete(std::string key);

  const std::vector<Op>& Ops() const {
    return ops_;
  }

  std::size_t Size() const {
    return ops_.size();
  }

  bool Empty() const {
    return ops_.empty();
  }

 private:
  std::vector<Op> ops_;
};

} // namespace chunkstore::db
