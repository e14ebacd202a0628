#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace shopstore::util {

/*
  One mutex per key, created on first use.

  A slot lives only while some Guard holds or waits on it; the last Guard
  out erases it, so the map is bounded by the number of keys in use.
*/
class KeyedMutex {
 public:
  class Guard {
   public:
    Guard(KeyedMutex* owner, std::string key, std::shared_ptr<std::mutex> mutex)
        : owner_(owner), key_(std::move(key)), mutex_(std::move(mutex)), lock_(*mutex_) {
    }

    ~Guard() {
      lock_.unlock();
      owner_->Release(key_, mutex_);
    }

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    KeyedMutex*                  owner_;
    std::string                  key_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  [[nodiscard]] Guard Lock(const std::string& key) {
    return Guard(this, key, Slot(key));
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(guard_);
    return slots_.size();
  }

 private:
  std::shared_ptr<std::mutex> Slot(const std::string& key) {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       m = slots_[key];
    if (!m) {
      m = std::make_shared<std::mutex>();
    }
    return m;
  }

  // copies are only taken under guard_, so use_count is stable here
  void Release(const std::string& key, const std::shared_ptr<std::mutex>& mutex) {
    std::lock_guard<std::mutex> lock(guard_);
    auto                        it = slots_.find(key);
    if (it != slots_.end() && it->second == mutex && mutex.use_count() == 2) {
      slots_.erase(it);
    }
  }

  mutable std::mutex                                           guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> slots_;
};

} // namespace shopstore::util
