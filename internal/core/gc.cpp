#include <algorithm>
#include <vector>

#include "chunk_store.hpp"
#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/observe.hpp"

namespace chunkstore::core {

using index::Item;
using observability::UintField;

std::uint64_t ChunkStore::CollectGarbage() {
  return observability::Observe("chunkstore.CollectGarbage", [&] {
    std::uint64_t dropped   = 0;
    std::uint64_t collected = 0;
    std::uint64_t gc_size   = 0;
    {
      std::lock_guard lock(batch_mutex_);
      dropped   = DropExcludedLocked();
      collected = EvictLocked();
      gc_size   = gc_size_.Get();
    }

    observability::Metrics::Instance().SetGcSize(gc_size);
    observability::Metrics::Instance().AddCollectedChunks(collected);
    CHUNKSTORE_LOG_INFO("garbage collection done",
                        {UintField("collected", collected), UintField("excluded_dropped", dropped), UintField("gc_size", gc_size),
                         UintField("gc_target", GcTarget())});
    return collected;
  });
}

// Removes gc entries of chunks listed in gcExclude. Exclusions of
// chunks that are no longer pinned are dropped too.
std::uint64_t ChunkStore::DropExcludedLocked() {
  std::vector<Item> excluded;
  ThrowIfDbError(gc_exclude_.Iterate([&](const Item& item) {
                   excluded.push_back(item);
                   return false;
                 }),
                 "gc: iterate gcExclude");
  if (excluded.empty()) {
    return 0;
  }

  Mutation m;
  for (const auto& item : excluded) {
    Item access;
    auto result = retrieval_access_.Get(item, &access);
    if (result) {
      StageGcEntryRemoval(m, access);
    } else if (!result.IsNotFound()) {
      ThrowIfDbError(result, "gc: lookup retrieval access");
    }

    bool pinned = false;
    ThrowIfDbError(pin_.Has(item, &pinned), "gc: lookup pin");
    if (!pinned) {
      gc_exclude_.DeleteInBatch(m.batch, item);
    }
  }

  CommitLocked(m, "gc: drop excluded");
  return static_cast<std::uint64_t>(-m.gc_delta);
}

// Evicts the oldest gc entries in batches until the gc size reaches the target.
std::uint64_t ChunkStore::EvictLocked() {
  const auto    target    = GcTarget();
  std::uint64_t collected = 0;

  for (;;) {
    const auto gc_size = gc_size_.Get();
    if (gc_size <= target) break;

    const auto        limit = std::min(options_.gc_batch_size, gc_size - target);
    std::vector<Item> oldest;
    ThrowIfDbError(gc_.Iterate([&](const Item& item) {
                     oldest.push_back(item);
                     return oldest.size() >= limit;
                   }),
                   "gc: iterate gc index");

    if (oldest.empty()) {
      CHUNKSTORE_LOG_WARN("gc size above target with empty gc index", {UintField("gc_size", gc_size)});
      break;
    }

    Mutation m;
    for (const auto& item : oldest) {
      retrieval_data_.DeleteInBatch(m.batch, item);
      retrieval_access_.DeleteInBatch(m.batch, item);
      pull_.DeleteInBatch(m.batch, item);
      gc_.DeleteInBatch(m.batch, item);
      m.gc_delta -= 1;
    }
    CommitLocked(m, "gc: evict");
    collected += oldest.size();
  }
  return collected;
}

} // namespace chunkstore::core
