#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace chunkstore::core {

class ChunkStore;

/*
  Background worker that runs ChunkStore::CollectGarbage.

  Woken by the store whenever a commit leaves the gc size above
  capacity. Triggers arriving while a run is in progress coalesce into
  one more run. Failures are logged and the worker keeps going.
*/
class GarbageCollector {
 public:
  explicit GarbageCollector(std::shared_ptr<ChunkStore> store);
  ~GarbageCollector();

  void Start();
  void Stop();

  void Trigger();

  // Completed runs, successful or not.
  std::uint64_t Runs() const;

  // Blocks until at least runs have completed or timeout expires.
  bool WaitForRuns(std::uint64_t runs, std::chrono::milliseconds timeout);

 private:
  void Run();

  std::shared_ptr<ChunkStore> store_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable done_cv_;
  bool                    pending_ = false;
  bool                    running_ = false;
  std::uint64_t           runs_    = 0;

  std::thread thread_;
};

} // namespace chunkstore::core
