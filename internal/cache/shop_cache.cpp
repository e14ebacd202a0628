#include "internal/cache/shop_cache.hpp"

#include <limits>
#include <mutex>
#include <stdexcept>

namespace shopstore::cache {

ShopCache::ShopCache(std::size_t capacity, std::chrono::milliseconds ttl, util::ClockFn clock)
    : capacity_(capacity), ttl_(ttl), clock_(std::move(clock)) {
  if (capacity_ == 0) {
    throw std::invalid_argument("shop cache capacity must be at least 1");
  }
  if (!clock_) {
    throw std::invalid_argument("shop cache requires a clock");
  }
}

std::optional<model::ShopRecord> ShopCache::Get(const std::string& id) const {
  std::shared_lock lock(mutex_);

  auto it = records_.find(id);
  if (it == records_.end()) return std::nullopt;

  const auto now = clock_();
  if (now > expiry_.at(id)) return std::nullopt;

  last_access_.at(id)->store(Ticks(now), std::memory_order_relaxed);
  return *it->second;
}

void ShopCache::Set(const std::string& id, const model::ShopRecord& record) {
  auto copy = std::make_shared<const model::ShopRecord>(record);

  std::unique_lock lock(mutex_);
  const auto       now = clock_();

  if (!records_.contains(id) && records_.size() >= capacity_) {
    EvictOldestLocked();
  }

  records_[id] = std::move(copy);
  expiry_[id]  = now + ttl_;

  auto& stamp = last_access_[id];
  if (!stamp) stamp = std::make_unique<std::atomic<Rep>>();
  stamp->store(Ticks(now), std::memory_order_relaxed);
}

void ShopCache::EvictOldestLocked() {
  const std::string* oldest    = nullptr;
  Rep                oldest_at = std::numeric_limits<Rep>::max();

  for (const auto& [id, stamp] : last_access_) {
    const auto at = stamp->load(std::memory_order_relaxed);
    if (!oldest || at < oldest_at) {
      oldest    = &id;
      oldest_at = at;
    }
  }
  if (!oldest) return;

  const std::string victim = *oldest;
  records_.erase(victim);
  expiry_.erase(victim);
  last_access_.erase(victim);
}

void ShopCache::Remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  records_.erase(id);
  expiry_.erase(id);
  last_access_.erase(id);
}

void ShopCache::Clear() {
  std::unique_lock lock(mutex_);
  records_.clear();
  expiry_.clear();
  last_access_.clear();
}

std::size_t ShopCache::Size() const {
  std::shared_lock lock(mutex_);
  return records_.size();
}

} // namespace shopstore::cache
