#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/model/shop.hpp"
#include "internal/util/time.hpp"

namespace shopstore::cache {

/*
  Bounded TTL cache of materialised shop records.

  - every Get/Set copies; callers never share a record with the cache
  - expiry is lazy: an expired entry is a miss but stays until evicted
  - at capacity, inserting a new id evicts the least recently accessed
    entry (linear scan)
  - last-accessed stamps are atomics so Get only needs the shared lock
*/
class ShopCache {
 public:
  ShopCache(std::size_t capacity, std::chrono::milliseconds ttl, util::ClockFn clock = util::Now);

  std::optional<model::ShopRecord> Get(const std::string& id) const;
  void                             Set(const std::string& id, const model::ShopRecord& record);
  void                             Remove(const std::string& id);
  void                             Clear();

  std::size_t Size() const;

  std::size_t Capacity() const {
    return capacity_;
  }

 private:
  using Rep = util::Clock::duration::rep;

  static Rep Ticks(util::TimePoint tp) {
    return tp.time_since_epoch().count();
  }

  void EvictOldestLocked();

  const std::size_t               capacity_;
  const std::chrono::milliseconds ttl_;
  const util::ClockFn             clock_;

  mutable std::shared_mutex mutex_;

  std::unordered_map<std::string, std::shared_ptr<const model::ShopRecord>> records_;
  std::unordered_map<std::string, util::TimePoint>                          expiry_;
  std::unordered_map<std::string, std::unique_ptr<std::atomic<Rep>>>        last_access_;
};

} // namespace shopstore::cache
