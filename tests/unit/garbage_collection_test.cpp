#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/chunk_store.hpp"
#include "internal/core/garbage_collector.hpp"
#include "internal/db/memory/memory_kv_store.hpp"

namespace {

using namespace std::chrono_literals;
using chunkstore::core::ChunkStore;
using chunkstore::core::ChunkStoreOptions;
using chunkstore::core::GarbageCollector;
using chunkstore::db::memory::MemoryKVStore;
using chunkstore::model::ModePut;
using chunkstore::model::ModeSet;

std::string Address(unsigned char n) {
  std::string address(chunkstore::model::kAddressLength, '\0');
  address.front() = static_cast<char>(0x80);
  address.back()  = static_cast<char>(n);
  return address;
}

std::shared_ptr<ChunkStore> MakeStore(std::uint64_t capacity, std::uint64_t gc_batch_size) {
  ChunkStoreOptions options;
  options.base_address  = std::string(chunkstore::model::kAddressLength, '\0');
  options.capacity      = capacity;
  options.gc_batch_size = gc_batch_size;
  return std::make_shared<ChunkStore>(std::make_shared<MemoryKVStore>(), std::move(options));
}

void TestEvictsOldestUntilTarget() {
  auto store = MakeStore(10, 3);
  assert(store->GcTarget() == 9);

  for (unsigned char i = 1; i <= 15; ++i) {
    store->Put(ModePut::kRequest, {Address(i), "data"});
  }
  assert(store->GcSize() == 15);

  assert(store->CollectGarbage() == 6);
  assert(store->GcSize() == 9);
  assert(store->Counts().gc == 9);

  for (unsigned char i = 1; i <= 6; ++i) {
    assert(!store->Has(Address(i)));
    assert(!store->Membership(Address(i)).Any());
  }
  for (unsigned char i = 7; i <= 15; ++i) {
    assert(store->Has(Address(i)));
  }

  assert(store->CollectGarbage() == 0);
}

void TestAccessRefreshesEvictionOrder() {
  auto store = MakeStore(3, 100);
  for (unsigned char i = 1; i <= 4; ++i) {
    store->Put(ModePut::kRequest, {Address(i), "data"});
  }

  // chunk 1 becomes the most recently used
  store->Set(ModeSet::kAccess, Address(1));

  assert(store->CollectGarbage() == 2);
  assert(store->Has(Address(1)));
  assert(!store->Has(Address(2)));
  assert(!store->Has(Address(3)));
  assert(store->Has(Address(4)));
}

void TestExcludedChunksLeaveGcIndex() {
  auto store = MakeStore(100, 10);
  for (unsigned char i = 1; i <= 3; ++i) {
    store->Put(ModePut::kRequest, {Address(i), "data"});
  }
  store->Set(ModeSet::kPin, Address(2));
  assert(store->GcSize() == 3);

  assert(store->CollectGarbage() == 0);
  assert(store->GcSize() == 2);
  assert(!store->Membership(Address(2)).gc);
  assert(store->Membership(Address(2)).gc_exclude);
  assert(store->Has(Address(2)));

  // exclusion outlives the pin only until the next sweep
  store->Set(ModeSet::kUnpin, Address(2));
  assert(store->CollectGarbage() == 0);
  assert(store->Counts().gc_exclude == 0);
  assert(store->GcSize() == 2);
}

void TestPinnedChunkIsNeverEvicted() {
  auto store = MakeStore(2, 10);
  assert(store->GcTarget() == 1);

  store->Put(ModePut::kRequest, {Address(1), "a"});
  store->Put(ModePut::kRequest, {Address(2), "b"});
  store->Put(ModePut::kRequest, {Address(3), "c"});
  store->Set(ModeSet::kPin, Address(1));

  assert(store->CollectGarbage() == 1);
  assert(store->Has(Address(1)));
  assert(!store->Has(Address(2)));
  assert(store->Has(Address(3)));
  assert(store->GcSize() == 1);
  assert(store->Counts().gc == 1);
}

void TestCollectorRunsWhenCapacityExceeded() {
  auto             store = MakeStore(4, 10);
  GarbageCollector collector(store);
  collector.Start();

  for (unsigned char i = 1; i <= 4; ++i) {
    store->Put(ModePut::kRequest, {Address(i), "data"});
  }
  assert(!collector.WaitForRuns(1, 20ms));

  store->Put(ModePut::kRequest, {Address(5), "data"});
  assert(collector.WaitForRuns(1, 5s));
  assert(store->GcSize() <= store->GcTarget());
  assert(store->GcSize() == store->Counts().gc);

  collector.Stop();
}

void TestCollectorCatchesUpOnStart() {
  auto store = MakeStore(2, 10);
  for (unsigned char i = 1; i <= 5; ++i) {
    store->Put(ModePut::kRequest, {Address(i), "data"});
  }
  assert(store->GcSize() == 5);

  GarbageCollector collector(store);
  collector.Start();
  assert(collector.WaitForRuns(1, 5s));
  assert(store->GcSize() == 1);
  collector.Stop();
}

// Writers keep the store above capacity while collectors come and go;
// the trigger must never reach a collector that has been destroyed.
void TestCollectorTeardownDuringWrites() {
  auto              store = MakeStore(1, 1000);
  std::atomic<bool> done{false};

  std::thread writer([&] {
    unsigned char n = 0;
    while (!done.load()) {
      const auto address = Address(static_cast<unsigned char>(n++));
      store->Put(ModePut::kRequest, {address, "data"});
      store->Set(ModeSet::kAccess, address);
    }
  });

  for (int i = 0; i < 50; ++i) {
    auto collector = std::make_unique<GarbageCollector>(store);
    collector->Start();
    collector->WaitForRuns(1, 50ms);
    collector->Stop();
    collector.reset();
  }

  done = true;
  writer.join();

  store->Put(ModePut::kRequest, {Address(0xfe), "data"});
  store->Put(ModePut::kRequest, {Address(0xff), "data"});
  assert(store->GcSize() == store->Counts().gc);
}

} // namespace

int main() {
  TestEvictsOldestUntilTarget();
  TestAccessRefreshesEvictionOrder();
  TestExcludedChunksLeaveGcIndex();
  TestPinnedChunkIsNeverEvicted();
  TestCollectorRunsWhenCapacityExceeded();
  TestCollectorCatchesUpOnStart();
  TestCollectorTeardownDuringWrites();

  std::cout << "chunkstore_unit_garbage_collection: pass\n";
  return 0;
}
