#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "bin_sequencer.hpp"
#include "gc_size.hpp"
#include "internal/db/api/kv_store.hpp"
#include "internal/index/index.hpp"
#include "internal/index/shed.hpp"
#include "internal/model/chunk.hpp"
#include "pull_subscriptions.hpp"

namespace chunkstore::core {

struct ChunkStoreOptions {
  // overlay address of this node; bins are proximity orders against it
  model::Address base_address;

  // gc index size that wakes the garbage collector
  std::uint64_t capacity = 5'000'000;
  // max chunks evicted per committed batch
  std::uint64_t gc_batch_size = 200'000;

  // defaults to a PersistentBinSequencer on the store's "binIDs" vector
  std::shared_ptr<BinSequencer> bin_sequencer;
};

struct PullDescriptor {
  model::Address address;
  std::uint64_t  bin_id = 0;
};

struct IndexCounts {
  std::uint64_t retrieval_data   = 0;
  std::uint64_t retrieval_access = 0;
  std::uint64_t push             = 0;
  std::uint64_t pull             = 0;
  std::uint64_t gc               = 0;
  std::uint64_t gc_exclude       = 0;
  std::uint64_t pin              = 0;
};

// Which indexes hold an entry for one address.
struct IndexMembership {
  bool retrieval_data   = false;
  bool retrieval_access = false;
  bool push             = false;
  bool pull             = false;
  bool gc               = false;
  bool gc_exclude       = false;
  bool pin              = false;

  bool Any() const {
    return retrieval_data || retrieval_access || push || pull || gc || gc_exclude || pin;
  }
};

/*
  ChunkStore

  Keeps the secondary indexes of a content addressed chunk store
  consistent with each other.

  CRITICAL GUARANTEES:

  - Every mutation (Set, Put, CollectGarbage) is serialized by one
    store wide batch mutex and commits as a single atomic batch
  - The persisted gc size is staged in the same batch as the gc index
    changes, so it always equals the gc index cardinality
  - A failed mutation leaves every index and the gc size unchanged
  - Pull notifications and the gc trigger fire only after a commit

  Reads (Get, Has, PullItems, inspection) do not take the batch mutex.

  Errors are reported as exceptions from internal/util/errors.hpp.
*/
class ChunkStore {
 public:
  ChunkStore(std::shared_ptr<db::KVStore> store, ChunkStoreOptions options);
  ~ChunkStore();

  ChunkStore(const ChunkStore&)            = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;

  // Applies one index mutation intent to address.
  void Set(model::ModeSet mode, const model::Address& address);

  // Stores a chunk body and indexes it for mode. Returns true when the
  // chunk was already stored; nothing is changed in that case.
  bool Put(model::ModePut mode, const model::Chunk& chunk);

  model::Chunk Get(const model::Address& address) const;
  bool         Has(const model::Address& address) const;

  // Pull index entries of bin with since < bin_id <= until, ordered by
  // bin id. until == 0 means no upper bound, limit == 0 means no limit.
  std::vector<PullDescriptor> PullItems(std::uint8_t bin, std::uint64_t since, std::uint64_t until, std::size_t limit) const;

  // Highest bin id present in bin's pull index, 0 when empty.
  std::uint64_t LastPullBinID(std::uint8_t bin) const;

  PullSubscriptions& Subscriptions() {
    return subscriptions_;
  }

  // Drops gc entries of excluded chunks, then evicts the oldest gc
  // entries until the gc size is at most GcTarget(). Returns the number
  // of evicted chunks.
  std::uint64_t CollectGarbage();

  // Called after a commit leaves the gc size above capacity.
  void SetGarbageCollectionTrigger(std::function<void()> trigger);

  std::uint64_t             GcSize() const;
  std::uint64_t             PinCounter(const model::Address& address) const;
  std::vector<model::Address> PinnedAddresses() const;
  model::ChunkState         State(const model::Address& address) const;
  IndexCounts               Counts() const;
  // Scans the ordered indexes; meant for diagnostics and tests.
  IndexMembership           Membership(const model::Address& address) const;

  std::uint8_t Bin(const model::Address& address) const;

  std::uint64_t Capacity() const {
    return options_.capacity;
  }

  std::uint64_t GcTarget() const;

 private:
  struct Mutation {
    db::WriteBatch              batch;
    std::int64_t                gc_delta = 0;
    std::optional<std::uint8_t> notify_bin;
  };

  void StageAccess(Mutation& m, const model::Address& address);
  void StageSync(Mutation& m, const model::Address& address);
  void StageRemove(Mutation& m, const model::Address& address);
  void StagePin(Mutation& m, const model::Address& address);
  void StageUnpin(Mutation& m, const model::Address& address);

  // Removes the gc entry recorded by access (if still present) from m.
  void StageGcEntryRemoval(Mutation& m, const index::Item& access);

  // Commits m and returns the resulting gc size. Caller holds batch_mutex_.
  std::uint64_t CommitLocked(Mutation& m, const char* context);
  // Post commit side effects; called without batch_mutex_.
  void          AfterCommit(const Mutation& m, std::uint64_t gc_size);

  std::uint64_t DropExcludedLocked();
  std::uint64_t EvictLocked();

  void ValidateAddress(const model::Address& address) const;

  ChunkStoreOptions options_;

  index::Shed shed_;

  index::Index retrieval_data_;
  index::Index retrieval_access_;
  index::Index push_;
  index::Index pull_;
  index::Index gc_;
  index::Index gc_exclude_;
  index::Index pin_;

  GcSizeCounter                 gc_size_;
  std::shared_ptr<BinSequencer> bin_sequencer_;

  PullSubscriptions subscriptions_;

  // Serializes every read-compute-commit sequence, for all addresses.
  std::mutex batch_mutex_;

  mutable std::mutex    trigger_mutex_;
  std::function<void()> gc_trigger_;
};

} // namespace chunkstore::core
