#include "chunk_store.hpp"

#include <string>
#include <utility>

#include "chunk_indexes.hpp"
#include "db_errors.hpp"
#include "internal/index/encoding.hpp"
#include "internal/model/proximity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chunkstore::core {

using index::Item;
using observability::BytesField;
using observability::StringField;
using observability::UintField;

namespace {

// gc target is capacity * kGcTargetNum / kGcTargetDen, rounded down
constexpr std::uint64_t kGcTargetNum = 9;
constexpr std::uint64_t kGcTargetDen = 10;

std::shared_ptr<BinSequencer> MakeBinSequencer(index::Shed& shed, std::shared_ptr<BinSequencer> injected) {
  if (injected) return injected;
  return std::make_shared<PersistentBinSequencer>(shed.NewUint64Vector("binIDs"));
}

const ChunkStoreOptions& ValidateOptions(const ChunkStoreOptions& options) {
  if (options.base_address.size() != model::kAddressLength) {
    throw util::InvalidArgument("base address must be " + std::to_string(model::kAddressLength) + " bytes");
  }
  if (options.gc_batch_size == 0) {
    throw util::InvalidArgument("gc batch size must be positive");
  }
  return options;
}

Item KeyOf(const model::Address& address) {
  Item item;
  item.address = address;
  return item;
}

} // namespace

ChunkStore::ChunkStore(std::shared_ptr<db::KVStore> store, ChunkStoreOptions options)
    : options_(ValidateOptions(options)),
      shed_(std::move(store)),
      retrieval_data_(shed_.NewIndex("retrievalData", RetrievalDataFuncs())),
      retrieval_access_(shed_.NewIndex("retrievalAccess", RetrievalAccessFuncs())),
      push_(shed_.NewIndex("push", PushFuncs())),
      pull_(shed_.NewIndex("pull", PullFuncs(options_.base_address))),
      gc_(shed_.NewIndex("gc", GcFuncs())),
      gc_exclude_(shed_.NewIndex("gcExclude", GcExcludeFuncs())),
      pin_(shed_.NewIndex("pin", PinFuncs())),
      gc_size_(shed_.NewUint64Field("gcSize")),
      bin_sequencer_(MakeBinSequencer(shed_, options_.bin_sequencer)) {
  CHUNKSTORE_LOG_INFO("chunk store opened", {BytesField("base_address", options_.base_address), UintField("capacity", options_.capacity),
                                              UintField("gc_size", gc_size_.Get())});
}

ChunkStore::~ChunkStore() {
  subscriptions_.Close();
}

void ChunkStore::ValidateAddress(const model::Address& address) const {
  if (address.size() != model::kAddressLength) {
    throw util::InvalidArgument("address must be " + std::to_string(model::kAddressLength) + " bytes, got " + std::to_string(address.size()));
  }
}

std::uint8_t ChunkStore::Bin(const model::Address& address) const {
  return model::Proximity(options_.base_address, address);
}

std::uint64_t ChunkStore::GcTarget() const {
  const auto capacity = options_.capacity;
  return capacity / kGcTargetDen * kGcTargetNum + capacity % kGcTargetDen * kGcTargetNum / kGcTargetDen;
}

void ChunkStore::SetGarbageCollectionTrigger(std::function<void()> trigger) {
  std::lock_guard lock(trigger_mutex_);
  gc_trigger_ = std::move(trigger);
}

std::uint64_t ChunkStore::CommitLocked(Mutation& m, const char* context) {
  std::uint64_t gc_size = 0;
  if (m.gc_delta != 0) {
    gc_size = gc_size_.ApplyDelta(m.batch, m.gc_delta);
  } else {
    gc_size = gc_size_.Get();
  }

  if (m.batch.Empty()) {
    return gc_size;
  }
  ThrowIfDbError(shed_.WriteBatch(m.batch), context);
  return gc_size;
}

void ChunkStore::AfterCommit(const Mutation& m, std::uint64_t gc_size) {
  observability::Metrics::Instance().SetGcSize(gc_size);

  if (m.notify_bin) {
    subscriptions_.Notify(*m.notify_bin);
  }

  if (gc_size > options_.capacity) {
    // Held across the call so a collector cannot be detached and destroyed
    // while it is being triggered.
    std::lock_guard lock(trigger_mutex_);
    if (gc_trigger_) gc_trigger_();
  }
}

bool ChunkStore::Put(model::ModePut mode, const model::Chunk& chunk) {
  const std::string route = "chunkstore.Put." + std::string(model::ToString(mode));
  return observability::Observe(route, [&] {
    ValidateAddress(chunk.address);
    if (chunk.data.empty()) {
      throw util::InvalidArgument("chunk data is empty");
    }
    if (mode != model::ModePut::kUpload && mode != model::ModePut::kSync && mode != model::ModePut::kRequest) {
      throw util::InvalidMode("unknown put mode " + std::to_string(static_cast<int>(mode)));
    }

    Mutation      m;
    std::uint64_t gc_size = 0;
    {
      std::lock_guard lock(batch_mutex_);

      bool exists = false;
      ThrowIfDbError(retrieval_data_.Has(KeyOf(chunk.address), &exists), "put: lookup retrieval data");
      if (exists) {
        return true;
      }

      Item item    = KeyOf(chunk.address);
      item.data    = chunk.data;
      const auto bin = Bin(chunk.address);

      // A data-less access may already have assigned the chunk its bin id.
      Item access;
      auto result = retrieval_access_.Get(item, &access);
      if (result) {
        item.store_timestamp = access.store_timestamp;
        item.bin_id          = access.bin_id;
      } else if (result.IsNotFound()) {
        item.store_timestamp = util::NowUnixNanos();
        item.bin_id          = bin_sequencer_->NextBinID(bin);
      } else {
        ThrowIfDbError(result, "put: lookup retrieval access");
      }

      retrieval_data_.PutInBatch(m.batch, item);

      switch (mode) {
        case model::ModePut::kUpload:
          pull_.PutInBatch(m.batch, item);
          push_.PutInBatch(m.batch, item);
          m.notify_bin = bin;
          break;
        case model::ModePut::kSync:
        case model::ModePut::kRequest:
          if (result) {
            StageGcEntryRemoval(m, access);
          }
          if (mode == model::ModePut::kSync) {
            pull_.PutInBatch(m.batch, item);
            m.notify_bin = bin;
          }
          item.access_timestamp = util::NowUnixNanos();
          retrieval_access_.PutInBatch(m.batch, item);
          gc_.PutInBatch(m.batch, item);
          m.gc_delta += 1;
          break;
      }

      gc_size = CommitLocked(m, "put: commit");
    }

    AfterCommit(m, gc_size);
    CHUNKSTORE_LOG_DEBUG("chunk stored", {BytesField("address", chunk.address), StringField("mode", model::ToString(mode))});
    return false;
  });
}

model::Chunk ChunkStore::Get(const model::Address& address) const {
  ValidateAddress(address);

  Item item;
  ThrowIfDbError(retrieval_data_.Get(KeyOf(address), &item), "get chunk");
  return model::Chunk{item.address, item.data};
}

bool ChunkStore::Has(const model::Address& address) const {
  ValidateAddress(address);

  bool found = false;
  ThrowIfDbError(retrieval_data_.Has(KeyOf(address), &found), "has chunk");
  return found;
}

std::vector<PullDescriptor> ChunkStore::PullItems(std::uint8_t bin, std::uint64_t since, std::uint64_t until, std::size_t limit) const {
  std::vector<PullDescriptor> out;
  if (since == UINT64_MAX || (until != 0 && until <= since)) {
    return out;
  }

  index::IndexIterateOptions options;
  options.prefix = std::string(1, static_cast<char>(bin));
  options.start_key = options.prefix + index::EncodeUint64(since + 1);

  ThrowIfDbError(pull_.Iterate(
                     [&](const Item& item) {
                       if (until != 0 && item.bin_id > until) return true;
                       out.push_back(PullDescriptor{item.address, item.bin_id});
                       return limit != 0 && out.size() >= limit;
                     },
                     options),
                 "iterate pull index");
  return out;
}

std::uint64_t ChunkStore::LastPullBinID(std::uint8_t bin) const {
  Item item;
  auto result = pull_.Last(std::string(1, static_cast<char>(bin)), &item);
  if (result.IsNotFound()) {
    return 0;
  }
  ThrowIfDbError(result, "last pull bin id");
  return item.bin_id;
}

std::uint64_t ChunkStore::GcSize() const {
  return gc_size_.Get();
}

std::uint64_t ChunkStore::PinCounter(const model::Address& address) const {
  ValidateAddress(address);

  Item item;
  auto result = pin_.Get(KeyOf(address), &item);
  if (result.IsNotFound()) {
    return 0;
  }
  ThrowIfDbError(result, "read pin counter");
  return item.pin_counter;
}

std::vector<model::Address> ChunkStore::PinnedAddresses() const {
  std::vector<model::Address> out;
  ThrowIfDbError(pin_.Iterate([&](const Item& item) {
                   out.push_back(item.address);
                   return false;
                 }),
                 "iterate pin index");
  return out;
}

model::ChunkState ChunkStore::State(const model::Address& address) const {
  if (PinCounter(address) > 0) {
    return model::ChunkState::kPinned;
  }

  bool found = false;
  ThrowIfDbError(retrieval_data_.Has(KeyOf(address), &found), "state: lookup retrieval data");
  if (!found) {
    ThrowIfDbError(retrieval_access_.Has(KeyOf(address), &found), "state: lookup retrieval access");
  }
  return found ? model::ChunkState::kIndexed : model::ChunkState::kAbsent;
}

IndexCounts ChunkStore::Counts() const {
  IndexCounts counts;
  ThrowIfDbError(retrieval_data_.Count(&counts.retrieval_data), "count retrievalData");
  ThrowIfDbError(retrieval_access_.Count(&counts.retrieval_access), "count retrievalAccess");
  ThrowIfDbError(push_.Count(&counts.push), "count push");
  ThrowIfDbError(pull_.Count(&counts.pull), "count pull");
  ThrowIfDbError(gc_.Count(&counts.gc), "count gc");
  ThrowIfDbError(gc_exclude_.Count(&counts.gc_exclude), "count gcExclude");
  ThrowIfDbError(pin_.Count(&counts.pin), "count pin");
  return counts;
}

IndexMembership ChunkStore::Membership(const model::Address& address) const {
  ValidateAddress(address);

  IndexMembership membership;
  const auto      key = KeyOf(address);
  ThrowIfDbError(retrieval_data_.Has(key, &membership.retrieval_data), "membership: retrievalData");
  ThrowIfDbError(retrieval_access_.Has(key, &membership.retrieval_access), "membership: retrievalAccess");
  ThrowIfDbError(gc_exclude_.Has(key, &membership.gc_exclude), "membership: gcExclude");
  ThrowIfDbError(pin_.Has(key, &membership.pin), "membership: pin");

  auto scan = [&](const index::Index& idx, const index::IndexIterateOptions& options, bool* found) {
    ThrowIfDbError(idx.Iterate(
                       [&](const Item& item) {
                         *found = item.address == address;
                         return *found;
                       },
                       options),
                   "membership: " + idx.Name());
  };

  scan(push_, {}, &membership.push);
  index::IndexIterateOptions pull_options;
  pull_options.prefix = std::string(1, static_cast<char>(Bin(address)));
  scan(pull_, pull_options, &membership.pull);
  scan(gc_, {}, &membership.gc);
  return membership;
}

} // namespace chunkstore::core
