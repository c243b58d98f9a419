#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/core/pull_subscriptions.hpp"

namespace {

using namespace std::chrono_literals;
using chunkstore::core::PullSubscriptions;

void TestNotifyWakesOnlyMatchingBin() {
  PullSubscriptions subs;
  auto              bin3 = subs.Subscribe(3);
  auto              bin4 = subs.Subscribe(4);

  subs.Notify(3);

  assert(bin3->Wait(1s));
  assert(!bin4->Wait(10ms));
}

void TestNotificationsCoalesce() {
  PullSubscriptions subs;
  auto              trigger = subs.Subscribe(0);

  subs.Notify(0);
  subs.Notify(0);
  subs.Notify(0);

  assert(trigger->Wait(1s));
  assert(!trigger->Wait(10ms));
}

void TestWaitingThreadIsWoken() {
  PullSubscriptions subs;
  auto              trigger = subs.Subscribe(7);
  std::atomic<bool> woke{false};

  std::thread waiter([&] { woke = trigger->Wait(5s); });
  std::this_thread::sleep_for(20ms);
  subs.Notify(7);
  waiter.join();

  assert(woke);
}

void TestUnsubscribeAndClose() {
  PullSubscriptions subs;
  auto              first  = subs.Subscribe(1);
  auto              second = subs.Subscribe(1);
  assert(subs.SubscriberCount(1) == 2);

  subs.Unsubscribe(1, first);
  assert(subs.SubscriberCount(1) == 1);

  subs.Notify(1);
  assert(!first->Wait(10ms));

  subs.Close();
  assert(second->Closed());
  assert(subs.SubscriberCount(1) == 0);

  auto late = subs.Subscribe(1);
  assert(late->Closed());
  assert(!late->Wait(10ms));
}

} // namespace

int main() {
  TestNotifyWakesOnlyMatchingBin();
  TestNotificationsCoalesce();
  TestWaitingThreadIsWoken();
  TestUnsubscribeAndClose();

  std::cout << "chunkstore_unit_pull_subscriptions: pass\n";
  return 0;
}
