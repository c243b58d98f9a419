#include "garbage_collector.hpp"

#include <exception>
#include <utility>

#include "chunk_store.hpp"
#include "internal/observability/logging.hpp"

namespace chunkstore::core {

using observability::StringField;

GarbageCollector::GarbageCollector(std::shared_ptr<ChunkStore> store) : store_(std::move(store)) {
}

GarbageCollector::~GarbageCollector() {
  Stop();
}

void GarbageCollector::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
    // catch up on a store that was opened above capacity
    pending_ = store_->GcSize() > store_->Capacity();
  }

  thread_ = std::thread(&GarbageCollector::Run, this);
  store_->SetGarbageCollectionTrigger([this] { Trigger(); });
}

void GarbageCollector::Stop() {
  store_->SetGarbageCollectionTrigger(nullptr);
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
}

void GarbageCollector::Trigger() {
  {
    std::lock_guard lock(mutex_);
    pending_ = true;
  }
  cv_.notify_one();
}

std::uint64_t GarbageCollector::Runs() const {
  std::lock_guard lock(mutex_);
  return runs_;
}

bool GarbageCollector::WaitForRuns(std::uint64_t runs, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return done_cv_.wait_for(lock, timeout, [&] { return runs_ >= runs; });
}

void GarbageCollector::Run() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return pending_ || !running_; });
      if (!running_) return;
      pending_ = false;
    }

    try {
      store_->CollectGarbage();
    } catch (const std::exception& e) {
      CHUNKSTORE_LOG_ERROR("garbage collection failed", {StringField("error", e.what())});
    }

    {
      std::lock_guard lock(mutex_);
      ++runs_;
    }
    done_cv_.notify_all();
  }
}

} // namespace chunkstore::core
