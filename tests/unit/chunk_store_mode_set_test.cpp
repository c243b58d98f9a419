#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/chunk_store.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using chunkstore::core::ChunkStore;
using chunkstore::core::ChunkStoreOptions;
using chunkstore::db::memory::MemoryKVStore;
using chunkstore::model::ChunkState;
using chunkstore::model::ModePut;
using chunkstore::model::ModeSet;

// Memory engine whose reads and writes can be made to fail.
class FaultyKVStore final : public chunkstore::db::KVStore {
 public:
  bool IsHealthy() const override {
    return inner_.IsHealthy();
  }

  chunkstore::db::Result Get(const std::string& key, std::string* value) override {
    if (fail_reads) return ReadFailure();
    return inner_.Get(key, value);
  }

  chunkstore::db::Result Has(const std::string& key, bool* found) override {
    if (fail_reads) return ReadFailure();
    return inner_.Has(key, found);
  }

  chunkstore::db::Result Write(const chunkstore::db::WriteBatch& batch) override {
    if (fail_writes) {
      return chunkstore::db::Result::Err(chunkstore::db::ErrorCode::IOError, "injected write failure");
    }
    return inner_.Write(batch);
  }

  chunkstore::db::Result Iterate(const chunkstore::db::IterateOptions& options, const chunkstore::db::IterateFn& fn) override {
    if (fail_reads) return ReadFailure();
    return inner_.Iterate(options, fn);
  }

  chunkstore::db::Result Last(const std::string& prefix, std::string* key, std::string* value) override {
    if (fail_reads) return ReadFailure();
    return inner_.Last(prefix, key, value);
  }

  std::atomic<bool> fail_reads{false};
  std::atomic<bool> fail_writes{false};

 private:
  static chunkstore::db::Result ReadFailure() {
    return chunkstore::db::Result::Err(chunkstore::db::ErrorCode::IOError, "injected read failure");
  }

  MemoryKVStore inner_;
};

class FailingBinSequencer final : public chunkstore::core::BinSequencer {
 public:
  std::uint64_t NextBinID(std::uint8_t bin) override {
    throw chunkstore::util::SequencerError("bin " + std::to_string(bin) + " unavailable");
  }
};

std::string Address(unsigned char first, unsigned char last) {
  std::string address(chunkstore::model::kAddressLength, '\0');
  address.front() = static_cast<char>(first);
  address.back()  = static_cast<char>(last);
  return address;
}

ChunkStoreOptions Options() {
  ChunkStoreOptions options;
  options.base_address = std::string(chunkstore::model::kAddressLength, '\0');
  options.capacity     = 100;
  return options;
}

std::unique_ptr<ChunkStore> MakeStore(std::shared_ptr<chunkstore::db::KVStore> kv = std::make_shared<MemoryKVStore>()) {
  return std::make_unique<ChunkStore>(std::move(kv), Options());
}

template <typename E>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void AssertGcConsistent(const ChunkStore& store) {
  assert(store.GcSize() == store.Counts().gc);
}

void TestScenarioAccessPinSyncUnpinRemove() {
  auto       store = MakeStore();
  const auto a     = Address(0x80, 1);

  assert(!store->Put(ModePut::kUpload, {a, "chunk-a"}));
  assert(store->GcSize() == 0);

  store->Set(ModeSet::kAccess, a);
  assert(store->State(a) == ChunkState::kIndexed);
  assert(store->Membership(a).gc);
  assert(store->GcSize() == 1);

  store->Set(ModeSet::kPin, a);
  assert(store->PinCounter(a) == 1);
  assert(store->Membership(a).gc_exclude);
  assert(store->State(a) == ChunkState::kPinned);

  store->Set(ModeSet::kSync, a);
  assert(!store->Membership(a).gc);
  assert(!store->Membership(a).push);
  assert(store->GcSize() == 0);

  store->Set(ModeSet::kUnpin, a);
  assert(store->PinCounter(a) == 0);
  assert(!store->Membership(a).pin);

  store->Set(ModeSet::kRemove, a);
  const auto membership = store->Membership(a);
  assert(!membership.retrieval_data);
  assert(!membership.retrieval_access);
  assert(!membership.pull);
  assert(!membership.gc);
  assert(store->GcSize() == 0);
  AssertGcConsistent(*store);
}

void TestAccessIsIdempotentWithoutData() {
  auto       store = MakeStore();
  const auto a     = Address(0x80, 2);
  const auto bin   = store->Bin(a);

  store->Set(ModeSet::kAccess, a);
  const auto first = store->PullItems(bin, 0, 0, 0);
  assert(first.size() == 1);
  assert(store->GcSize() == 1);

  store->Set(ModeSet::kAccess, a);
  const auto second = store->PullItems(bin, 0, 0, 0);
  assert(second.size() == 1);
  assert(second[0].address == a);
  assert(second[0].bin_id == first[0].bin_id);
  assert(store->LastPullBinID(bin) == first[0].bin_id);

  assert(store->GcSize() == 1);
  assert(store->Counts().gc == 1);
  assert(store->Counts().retrieval_access == 1);
}

void TestAccessKeepsStoredBinID() {
  auto       store = MakeStore();
  const auto a     = Address(0x80, 3);
  const auto b     = Address(0x80, 4);
  const auto bin   = store->Bin(a);

  store->Put(ModePut::kUpload, {a, "a"});
  store->Put(ModePut::kUpload, {b, "b"});

  store->Set(ModeSet::kAccess, b);
  store->Set(ModeSet::kAccess, a);

  const auto items = store->PullItems(bin, 0, 0, 0);
  assert(items.size() == 2);
  assert(items[0].address == a);
  assert(items[0].bin_id == 1);
  assert(items[1].address == b);
  assert(items[1].bin_id == 2);
}

void TestPinUnpinConservation() {
  auto       store = MakeStore();
  const auto a     = Address(0x40, 5);

  for (int i = 0; i < 3; ++i) {
    store->Set(ModeSet::kPin, a);
  }
  assert(store->PinCounter(a) == 3);
  assert(store->Counts().gc_exclude == 1);

  store->Set(ModeSet::kUnpin, a);
  assert(store->PinCounter(a) == 2);

  store->Set(ModeSet::kUnpin, a);
  store->Set(ModeSet::kUnpin, a);
  assert(store->PinCounter(a) == 0);
  assert(!store->Membership(a).pin);
  assert(store->PinnedAddresses().empty());

  assert(Throws<chunkstore::util::NotFound>([&] { store->Set(ModeSet::kUnpin, a); }));
  assert(store->PinCounter(a) == 0);
}

void TestGcCounterMatchesGcIndex() {
  auto                     store = MakeStore();
  std::vector<std::string> addresses;
  for (unsigned char i = 0; i < 6; ++i) {
    addresses.push_back(Address(static_cast<unsigned char>(0x10 * i), i));
  }

  for (std::size_t i = 0; i < addresses.size(); ++i) {
    store->Put(i % 2 == 0 ? ModePut::kUpload : ModePut::kSync, {addresses[i], "data"});
    AssertGcConsistent(*store);
  }

  const std::vector<std::pair<ModeSet, std::size_t>> ops = {
      {ModeSet::kAccess, 0}, {ModeSet::kAccess, 1}, {ModeSet::kSync, 0},  {ModeSet::kPin, 2},    {ModeSet::kSync, 2},
      {ModeSet::kAccess, 2}, {ModeSet::kSync, 2},   {ModeSet::kUnpin, 2}, {ModeSet::kRemove, 1}, {ModeSet::kAccess, 3},
      {ModeSet::kAccess, 3}, {ModeSet::kSync, 4},   {ModeSet::kRemove, 4}, {ModeSet::kAccess, 5}, {ModeSet::kRemove, 0},
  };
  for (const auto& [mode, i] : ops) {
    store->Set(mode, addresses[i]);
    AssertGcConsistent(*store);
  }
}

void TestRemoveFinality() {
  auto       store = MakeStore();
  const auto a     = Address(0x20, 6);

  store->Put(ModePut::kSync, {a, "payload"});
  store->Set(ModeSet::kAccess, a);
  assert(store->GcSize() == 1);

  store->Set(ModeSet::kRemove, a);
  const auto membership = store->Membership(a);
  assert(!membership.retrieval_data);
  assert(!membership.retrieval_access);
  assert(!membership.pull);
  assert(!membership.gc);
  assert(!store->Has(a));
  assert(store->GcSize() == 0);

  assert(Throws<chunkstore::util::NotFound>([&] { store->Set(ModeSet::kRemove, a); }));
  assert(store->GcSize() == 0);
}

void TestSyncWithoutDataLeavesNoTrace() {
  auto       store = MakeStore();
  const auto a     = Address(0x08, 7);

  store->Set(ModeSet::kSync, a);

  assert(!store->Membership(a).Any());
  const auto counts = store->Counts();
  assert(counts.retrieval_data == 0 && counts.retrieval_access == 0 && counts.push == 0 && counts.pull == 0);
  assert(counts.gc == 0 && counts.gc_exclude == 0 && counts.pin == 0);
  assert(store->GcSize() == 0);
}

// Access does not consult gcExclude: a pinned chunk becomes gc eligible
// again, while Sync keeps it out of the gc index.
void TestAccessReaddsPinnedChunkToGc() {
  auto       store = MakeStore();
  const auto a     = Address(0x80, 8);

  store->Put(ModePut::kUpload, {a, "pinned"});
  store->Set(ModeSet::kPin, a);

  store->Set(ModeSet::kAccess, a);
  assert(store->Membership(a).gc);
  assert(store->Membership(a).gc_exclude);
  assert(store->GcSize() == 1);

  store->Set(ModeSet::kSync, a);
  assert(!store->Membership(a).gc);
  assert(store->GcSize() == 0);
  AssertGcConsistent(*store);
}

void TestInvalidModeChangesNothing() {
  auto       store = MakeStore();
  const auto a     = Address(0x80, 9);

  assert(Throws<chunkstore::util::InvalidMode>([&] { store->Set(static_cast<ModeSet>(9), a); }));
  assert(!store->Membership(a).Any());
  assert(store->GcSize() == 0);
}

void TestInvalidAddressIsRejected() {
  auto store = MakeStore();
  assert(Throws<chunkstore::util::InvalidArgument>([&] { store->Set(ModeSet::kAccess, "short"); }));
}

void TestAccessNotifiesPullSubscribers() {
  auto       store   = MakeStore();
  const auto a       = Address(0x40, 10);
  auto       trigger = store->Subscriptions().Subscribe(store->Bin(a));
  auto       other   = store->Subscriptions().Subscribe(static_cast<std::uint8_t>(store->Bin(a) + 1));

  store->Set(ModeSet::kPin, a);
  assert(!trigger->Wait(10ms));

  store->Set(ModeSet::kAccess, a);
  assert(trigger->Wait(1s));
  assert(!other->Wait(10ms));
}

void TestFailedCommitLeavesNoTraceAndDoesNotNotify() {
  auto       kv    = std::make_shared<FaultyKVStore>();
  auto       store = MakeStore(kv);
  const auto a     = Address(0x80, 11);

  auto trigger = store->Subscriptions().Subscribe(store->Bin(a));
  store->Put(ModePut::kUpload, {a, "body"});
  assert(trigger->Wait(1s));

  kv->fail_writes = true;
  assert(Throws<chunkstore::util::StorageError>([&] { store->Set(ModeSet::kAccess, a); }));
  assert(Throws<chunkstore::util::StorageError>([&] { store->Set(ModeSet::kPin, a); }));

  const auto membership = store->Membership(a);
  assert(!membership.retrieval_access);
  assert(!membership.gc);
  assert(!membership.pin);
  assert(!membership.gc_exclude);
  assert(store->GcSize() == 0);
  assert(!trigger->Wait(20ms));

  kv->fail_writes = false;
  store->Set(ModeSet::kAccess, a);
  assert(store->GcSize() == 1);
  assert(trigger->Wait(1s));
}

void TestSequencerFailureAbortsAccess() {
  auto options          = Options();
  options.bin_sequencer = std::make_shared<FailingBinSequencer>();
  ChunkStore store(std::make_shared<MemoryKVStore>(), options);
  const auto a = Address(0x80, 12);

  assert(Throws<chunkstore::util::SequencerError>([&] { store.Set(ModeSet::kAccess, a); }));
  assert(!store.Membership(a).Any());
  assert(store.GcSize() == 0);
}

void TestReadFailureAbortsEveryMode() {
  auto       kv    = std::make_shared<FaultyKVStore>();
  auto       store = MakeStore(kv);
  const auto a     = Address(0x80, 13);

  store->Put(ModePut::kUpload, {a, "body"});
  store->Set(ModeSet::kAccess, a);
  store->Set(ModeSet::kPin, a);
  const auto before = store->Counts();
  assert(store->GcSize() == 1);
  assert(store->PinCounter(a) == 1);

  kv->fail_reads = true;
  for (const auto mode : {ModeSet::kAccess, ModeSet::kSync, ModeSet::kRemove, ModeSet::kPin, ModeSet::kUnpin}) {
    assert(Throws<chunkstore::util::StorageError>([&] { store->Set(mode, a); }));
  }
  kv->fail_reads = false;

  const auto after = store->Counts();
  assert(after.retrieval_data == before.retrieval_data);
  assert(after.retrieval_access == before.retrieval_access);
  assert(after.push == before.push);
  assert(after.pull == before.pull);
  assert(after.gc == before.gc);
  assert(after.gc_exclude == before.gc_exclude);
  assert(after.pin == before.pin);
  assert(store->GcSize() == 1);
  assert(store->PinCounter(a) == 1);
  AssertGcConsistent(*store);
}

void TestBinCounterWriteFailureAbortsAccess() {
  auto       kv    = std::make_shared<FaultyKVStore>();
  auto       store = MakeStore(kv);
  const auto a     = Address(0x80, 14);

  kv->fail_writes = true;
  assert(Throws<chunkstore::util::SequencerError>([&] { store->Set(ModeSet::kAccess, a); }));
  kv->fail_writes = false;

  assert(!store->Membership(a).Any());
  assert(store->GcSize() == 0);
  assert(store->LastPullBinID(store->Bin(a)) == 0);

  store->Set(ModeSet::kAccess, a);
  assert(store->LastPullBinID(store->Bin(a)) == 1);
}

} // namespace

int main() {
  TestScenarioAccessPinSyncUnpinRemove();
  TestAccessIsIdempotentWithoutData();
  TestAccessKeepsStoredBinID();
  TestPinUnpinConservation();
  TestGcCounterMatchesGcIndex();
  TestRemoveFinality();
  TestSyncWithoutDataLeavesNoTrace();
  TestAccessReaddsPinnedChunkToGc();
  TestInvalidModeChangesNothing();
  TestInvalidAddressIsRejected();
  TestAccessNotifiesPullSubscribers();
  TestFailedCommitLeavesNoTraceAndDoesNotNotify();
  TestSequencerFailureAbortsAccess();
  TestReadFailureAbortsEveryMode();
  TestBinCounterWriteFailureAbortsAccess();

  std::cout << "chunkstore_unit_mode_set: pass\n";
  return 0;
}
