#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/chunk_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"

namespace {

using chunkstore::core::ChunkStore;
using chunkstore::core::ChunkStoreOptions;
using chunkstore::model::ModePut;
using chunkstore::model::ModeSet;

const std::filesystem::path kDbPath = std::filesystem::temp_directory_path() / "chunkstore_sqlite_test.sqlite";

void RemoveDb() {
  std::filesystem::remove(kDbPath);
  std::filesystem::remove(kDbPath.string() + "-wal");
  std::filesystem::remove(kDbPath.string() + "-shm");
}

std::shared_ptr<ChunkStore> Open() {
  auto db = std::make_shared<chunkstore::db::sqlite::SqliteDB>(kDbPath.string());
  chunkstore::db::sqlite::SqliteKVStore::Bootstrap(*db);

  ChunkStoreOptions options;
  options.base_address = std::string(chunkstore::model::kAddressLength, '\0');
  options.capacity     = 1000;
  return std::make_shared<ChunkStore>(std::make_shared<chunkstore::db::sqlite::SqliteKVStore>(db), std::move(options));
}

std::string Address(unsigned char first, unsigned char last) {
  std::string address(chunkstore::model::kAddressLength, '\0');
  address.front() = static_cast<char>(first);
  address.back()  = static_cast<char>(last);
  return address;
}

void TestStateSurvivesReopen() {
  RemoveDb();
  const auto a = Address(0x80, 1);
  const auto b = Address(0x80, 2);
  {
    auto store = Open();
    store->Put(ModePut::kUpload, {a, "alpha"});
    store->Put(ModePut::kSync, {b, "beta"});
    store->Set(ModeSet::kAccess, a);
    store->Set(ModeSet::kPin, b);
    store->Set(ModeSet::kPin, b);
    assert(store->GcSize() == 2);
  }

  auto store = Open();
  assert(store->Get(a).data == "alpha");
  assert(store->GcSize() == 2);
  assert(store->Counts().gc == 2);
  assert(store->PinCounter(b) == 2);
  assert(store->LastPullBinID(0) == 2);
}

void TestBinIDsContinueAfterReopen() {
  RemoveDb();
  {
    auto store = Open();
    store->Put(ModePut::kUpload, {Address(0x80, 1), "x"});
    store->Put(ModePut::kUpload, {Address(0x80, 2), "x"});
    store->Set(ModeSet::kRemove, Address(0x80, 2));
  }

  auto store = Open();
  store->Put(ModePut::kUpload, {Address(0x80, 3), "x"});

  const auto items = store->PullItems(0, 0, 0, 0);
  assert(items.size() == 2);
  assert(items[0].bin_id == 1);
  assert(items[1].bin_id == 3 && "removed bin ids are never reused");
}

void TestConcurrentMutationsKeepGcConsistent() {
  RemoveDb();
  auto store = Open();

  std::vector<std::thread> workers;
  for (unsigned char w = 0; w < 4; ++w) {
    workers.emplace_back([store, w] {
      for (unsigned char i = 0; i < 10; ++i) {
        const auto address = Address(static_cast<unsigned char>(0x10 * (w + 1)), i);
        store->Put(ModePut::kUpload, {address, "data"});
        store->Set(ModeSet::kAccess, address);
        store->Set(ModeSet::kAccess, Address(0x10, i));
        if (i % 3 == 0) store->Set(ModeSet::kSync, address);
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(store->GcSize() == store->Counts().gc);
  assert(store->Counts().retrieval_data == 40);
}

} // namespace

int main() {
  TestStateSurvivesReopen();
  TestBinIDsContinueAfterReopen();
  TestConcurrentMutationsKeepGcConsistent();
  RemoveDb();

  std::cout << "chunkstore_integration_chunk_store_sqlite: pass\n";
  return 0;
}
