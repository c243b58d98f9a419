#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace chunkstore::core {

/*
  Wake-up signal for one pull subscriber.

  Notifications coalesce: any number of Notify calls between two Waits
  wake the subscriber once. There is no payload; the subscriber
  re-reads the pull index after waking.
*/
class PullTrigger {
 public:
  void Notify();

  // Blocks until notified, closed or timeout. Returns true only when a
  // notification was consumed.
  bool Wait(std::chrono::milliseconds timeout);

  void Close();
  bool Closed() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    pending_ = false;
  bool                    closed_  = false;
};

/*
  Per-bin registry of pull subscribers.
*/
class PullSubscriptions {
 public:
  ~PullSubscriptions();

  std::shared_ptr<PullTrigger> Subscribe(std::uint8_t bin);
  void                         Unsubscribe(std::uint8_t bin, const std::shared_ptr<PullTrigger>& trigger);

  // Best effort, never blocks on subscribers.
  void Notify(std::uint8_t bin);

  // Closes every trigger; later Subscribe calls return closed triggers.
  void Close();

  std::size_t SubscriberCount(std::uint8_t bin) const;

 private:
  mutable std::mutex                                                mutex_;
  std::map<std::uint8_t, std::vector<std::shared_ptr<PullTrigger>>> triggers_;
  bool                                                              closed_ = false;
};

} // namespace chunkstore::core
