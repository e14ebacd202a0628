#include "internal/util/keyed_mutex.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using shopstore::util::KeyedMutex;

void TestSlotReleasedWithLastGuard() {
  KeyedMutex locks;
  {
    auto a = locks.Lock("alpha");
    auto b = locks.Lock("beta");
    assert(locks.Size() == 2);
  }
  assert(locks.Size() == 0);
}

void TestSlotSurvivesWhileContended() {
  KeyedMutex        locks;
  std::atomic<bool> waiter_in{false};
  std::atomic<bool> waiter_done{false};

  std::thread waiter;
  {
    auto held = locks.Lock("alpha");
    waiter    = std::thread([&] {
      waiter_in   = true;
      auto g      = locks.Lock("alpha");
      waiter_done = true;
    });
    while (!waiter_in) std::this_thread::yield();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(!waiter_done);
    assert(locks.Size() == 1);
  }
  waiter.join();
  assert(waiter_done);
  assert(locks.Size() == 0);
}

void TestSameKeyIsSerialised() {
  KeyedMutex               locks;
  int                      counter = 0;
  std::atomic<int>         inside{0};
  std::atomic<bool>        overlapped{false};
  std::vector<std::thread> threads;

  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 500; ++i) {
        auto g = locks.Lock("shared");
        if (++inside > 1) overlapped = true;
        ++counter;
        --inside;
        // unrelated keys churn slots alongside
        auto other = locks.Lock("own-" + std::to_string(t));
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(!overlapped);
  assert(counter == 8 * 500);
  assert(locks.Size() == 0);
}

} // namespace

int main() {
  TestSlotReleasedWithLastGuard();
  TestSlotSurvivesWhileContended();
  TestSameKeyIsSerialised();

  std::cout << "shopstore_unit_keyed_mutex: pass\n";
  return 0;
}
