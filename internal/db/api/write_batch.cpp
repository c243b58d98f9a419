#include "write_batch.hpp"

#include <utility>

namespace chunkstore::db {

void WriteBatch::Put(std::string key, std::string value) {
  ops_.push_back(Op{OpType::kPut, std::move(key), std::move(value)});
}

void WriteBatch::Delete(std::string key) {
  ops_.push_back(Op{OpType::kDelete, std::move(key), {}});
}

} // namespace chunkstore::db
