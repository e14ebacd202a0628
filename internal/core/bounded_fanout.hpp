#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <system_error>
#include <thread>
#include <vector>

#include "internal/util/context.hpp"

namespace shopstore::core {

/*
  Runs fn(i) for i in [0, count) on a fixed pool of min(concurrency, count)
  workers. The calling thread is one of them.

  Workers pull the next index from a shared counter until the range is
  exhausted or the context is cancelled. Units already running always
  finish before return. Returns false when cancellation left units
  unstarted. fn must not throw.
*/
template <typename Fn>
bool ForEachBounded(const util::Context& ctx, std::size_t count, std::size_t concurrency, Fn&& fn) {
  if (count == 0) return true;
  if (concurrency == 0) concurrency = 1;

  std::atomic<std::size_t> next{0};

  auto worker = [&ctx, &next, &fn, count] {
    while (!ctx.IsCancelled()) {
      const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= count) return;
      fn(i);
    }
  };

  const std::size_t        pool = std::min(concurrency, count);
  std::vector<std::thread> workers;
  workers.reserve(pool - 1);

  for (std::size_t w = 1; w < pool; ++w) {
    try {
      workers.emplace_back(worker);
    } catch (const std::system_error&) {
      // out of threads: the workers already started drain the range
      break;
    }
  }

  worker();

  for (auto& t : workers) t.join();

  return next.load(std::memory_order_relaxed) >= count;
}

} // namespace shopstore::core
