#include "pull_subscriptions.hpp"

#include <algorithm>

namespace chunkstore::core {

void PullTrigger::Notify() {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    pending_ = true;
  }
  cv_.notify_all();
}

bool PullTrigger::Wait(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return pending_ || closed_; });

  if (!pending_) return false;
  pending_ = false;
  return true;
}

void PullTrigger::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool PullTrigger::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

PullSubscriptions::~PullSubscriptions() {
  Close();
}

std::shared_ptr<PullTrigger> PullSubscriptions::Subscribe(std::uint8_t bin) {
  auto trigger = std::make_shared<PullTrigger>();

  std::lock_guard lock(mutex_);
  if (closed_) {
    trigger->Close();
    return trigger;
  }
  triggers_[bin].push_back(trigger);
  return trigger;
}

void PullSubscriptions::Unsubscribe(std::uint8_t bin, const std::shared_ptr<PullTrigger>& trigger) {
  std::lock_guard lock(mutex_);

  auto it = triggers_.find(bin);
  if (it == triggers_.end()) return;

  auto& list = it->second;
  list.erase(std::remove(list.begin(), list.end(), trigger), list.end());
  if (list.empty()) triggers_.erase(it);
}

void PullSubscriptions::Notify(std::uint8_t bin) {
  std::vector<std::shared_ptr<PullTrigger>> targets;
  {
    std::lock_guard lock(mutex_);
    auto            it = triggers_.find(bin);
    if (it == triggers_.end()) return;
    targets = it->second;
  }

  for (const auto& trigger : targets) {
    trigger->Notify();
  }
}

void PullSubscriptions::Close() {
  std::map<std::uint8_t, std::vector<std::shared_ptr<PullTrigger>>> triggers;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    triggers.swap(triggers_);
  }

  for (const auto& [_, list] : triggers) {
    for (const auto& trigger : list) {
      trigger->Close();
    }
  }
}

std::size_t PullSubscriptions::SubscriberCount(std::uint8_t bin) const {
  std::lock_guard lock(mutex_);
  auto            it = triggers_.find(bin);
  return it == triggers_.end() ? 0 : it->second.size();
}

} // namespace chunkstore::core
