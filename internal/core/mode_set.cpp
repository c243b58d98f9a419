#include <string>

#include "chunk_store.hpp"
#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chunkstore::core {

using index::Item;
using observability::BytesField;
using observability::IntField;
using observability::StringField;
using observability::UintField;

namespace {

Item KeyOf(const model::Address& address) {
  Item item;
  item.address = address;
  return item;
}

} // namespace

void ChunkStore::Set(model::ModeSet mode, const model::Address& address) {
  const std::string route = "chunkstore.Set." + std::string(model::ToString(mode));
  observability::Observe(route, [&] {
    ValidateAddress(address);

    Mutation      m;
    std::uint64_t gc_size = 0;
    {
      std::lock_guard lock(batch_mutex_);

      switch (mode) {
        case model::ModeSet::kAccess:
          StageAccess(m, address);
          break;
        case model::ModeSet::kSync:
          StageSync(m, address);
          break;
        case model::ModeSet::kRemove:
          StageRemove(m, address);
          break;
        case model::ModeSet::kPin:
          StagePin(m, address);
          break;
        case model::ModeSet::kUnpin:
          StageUnpin(m, address);
          break;
        default:
          throw util::InvalidMode("unknown set mode " + std::to_string(static_cast<int>(mode)));
      }

      gc_size = CommitLocked(m, "set: commit");
    }

    AfterCommit(m, gc_size);
    CHUNKSTORE_LOG_DEBUG("chunk indexes updated",
                         {BytesField("address", address), StringField("mode", model::ToString(mode)), IntField("gc_delta", m.gc_delta),
                          UintField("ops", m.batch.Size())});
  });
}

void ChunkStore::StageGcEntryRemoval(Mutation& m, const Item& access) {
  Item gc_item             = KeyOf(access.address);
  gc_item.access_timestamp = access.access_timestamp;
  gc_item.bin_id           = access.bin_id;

  // Pinned syncs and gc sweeps leave access records without gc entries.
  bool present = false;
  ThrowIfDbError(gc_.Has(gc_item, &present), "lookup gc entry");
  if (!present) return;

  gc_.DeleteInBatch(m.batch, gc_item);
  m.gc_delta -= 1;
}

void ChunkStore::StageAccess(Mutation& m, const model::Address& address) {
  Item       item = KeyOf(address);
  const auto bin  = Bin(address);

  Item data;
  auto result = retrieval_data_.Get(item, &data);
  if (result) {
    item.store_timestamp = data.store_timestamp;
    item.bin_id          = data.bin_id;
  } else if (result.IsNotFound()) {
    // First indexing of a chunk without a body. A previous data-less
    // access keeps its store timestamp and bin id.
    Item previous;
    auto access_result = retrieval_access_.Get(item, &previous);
    if (access_result) {
      item.store_timestamp = previous.store_timestamp;
      item.bin_id          = previous.bin_id;
    } else if (access_result.IsNotFound()) {
      item.store_timestamp = util::NowUnixNanos();
      item.bin_id          = bin_sequencer_->NextBinID(bin);
    } else {
      ThrowIfDbError(access_result, "access: lookup retrieval access");
    }
    push_.DeleteInBatch(m.batch, item);
  } else {
    ThrowIfDbError(result, "access: lookup retrieval data");
  }

  Item access;
  result = retrieval_access_.Get(item, &access);
  if (result) {
    StageGcEntryRemoval(m, access);
  } else if (!result.IsNotFound()) {
    ThrowIfDbError(result, "access: lookup retrieval access");
  }

  item.access_timestamp = util::NowUnixNanos();
  retrieval_access_.PutInBatch(m.batch, item);
  pull_.PutInBatch(m.batch, item);
  gc_.PutInBatch(m.batch, item);
  m.gc_delta += 1;
  m.notify_bin = bin;
}

void ChunkStore::StageSync(Mutation& m, const model::Address& address) {
  Item item = KeyOf(address);

  Item data;
  auto result = retrieval_data_.Get(item, &data);
  if (result.IsNotFound()) {
    // Nothing to synchronize; only a push entry left by an earlier
    // access can remain and it is keyed by the recorded store timestamp.
    Item access;
    auto access_result = retrieval_access_.Get(item, &access);
    if (access_result) {
      push_.DeleteInBatch(m.batch, access);
    } else if (!access_result.IsNotFound()) {
      ThrowIfDbError(access_result, "sync: lookup retrieval access");
    }
    return;
  }
  ThrowIfDbError(result, "sync: lookup retrieval data");
  item.store_timestamp = data.store_timestamp;
  item.bin_id          = data.bin_id;

  Item access;
  result = retrieval_access_.Get(item, &access);
  if (result) {
    StageGcEntryRemoval(m, access);
  } else if (!result.IsNotFound()) {
    ThrowIfDbError(result, "sync: lookup retrieval access");
  }

  item.access_timestamp = util::NowUnixNanos();
  retrieval_access_.PutInBatch(m.batch, item);
  push_.DeleteInBatch(m.batch, item);

  bool pinned = false;
  ThrowIfDbError(pin_.Has(item, &pinned), "sync: lookup pin");
  if (!pinned) {
    gc_.PutInBatch(m.batch, item);
    m.gc_delta += 1;
  }
}

void ChunkStore::StageRemove(Mutation& m, const model::Address& address) {
  Item item = KeyOf(address);

  Item access;
  auto access_result = retrieval_access_.Get(item, &access);
  if (!access_result && !access_result.IsNotFound()) {
    ThrowIfDbError(access_result, "remove: lookup retrieval access");
  }

  Item data;
  ThrowIfDbError(retrieval_data_.Get(item, &data), "remove: lookup retrieval data");
  item.store_timestamp = data.store_timestamp;
  item.bin_id          = data.bin_id;

  if (access_result) {
    StageGcEntryRemoval(m, access);
  }

  retrieval_data_.DeleteInBatch(m.batch, item);
  retrieval_access_.DeleteInBatch(m.batch, item);
  pull_.DeleteInBatch(m.batch, item);
}

void ChunkStore::StagePin(Mutation& m, const model::Address& address) {
  Item item = KeyOf(address);

  Item existing;
  auto result = pin_.Get(item, &existing);
  if (result) {
    item.pin_counter = existing.pin_counter;
  } else if (result.IsNotFound()) {
    gc_exclude_.PutInBatch(m.batch, item);
  } else {
    ThrowIfDbError(result, "pin: lookup pin");
  }

  item.pin_counter += 1;
  pin_.PutInBatch(m.batch, item);
}

void ChunkStore::StageUnpin(Mutation& m, const model::Address& address) {
  Item item = KeyOf(address);

  Item existing;
  ThrowIfDbError(pin_.Get(item, &existing), "unpin: lookup pin");

  if (existing.pin_counter > 1) {
    item.pin_counter = existing.pin_counter - 1;
    pin_.PutInBatch(m.batch, item);
    return;
  }
  pin_.DeleteInBatch(m.batch, item);
}

} // namespace chunkstore::core
