#include "memory_store_backend.hpp"

#include "memory_document_store.hpp"

namespace shopstore::db::memory {

namespace {

constexpr const char* kAddressPrefix = "memory/";

} // namespace

Result MemoryStoreBackend::Open(const std::string& address, const OpenOptions& options, DocumentStorePtr* out) {
  std::shared_ptr<MemoryLog> log;
  {
    std::scoped_lock lock(mutex_);
    auto             it = logs_.find(address);
    if (it == logs_.end()) {
      if (!options.recreate) return Result::Err(ErrorCode::Unavailable, "unknown address " + address);
      it = logs_.emplace(address, std::make_shared<MemoryLog>()).first;
    }

    if (corrupted_.contains(address)) {
      if (!options.recreate) return Result::Err(ErrorCode::Corruption, "store at " + address + " is unreadable");
      corrupted_.erase(address);
      it->second = std::make_shared<MemoryLog>();
    }

    log = it->second;
    ++open_counts_[address];
  }

  *out = std::make_shared<MemoryDocumentStore>(address, std::move(log));
  return Result::Ok();
}

Result MemoryStoreBackend::Create(const std::string& name, DocumentStorePtr* out) {
  std::string                address;
  std::shared_ptr<MemoryLog> log = std::make_shared<MemoryLog>();
  {
    std::scoped_lock lock(mutex_);
    address = kAddressPrefix + std::to_string(next_id_++) + "/" + name;
    logs_.emplace(address, log);
    ++open_counts_[address];
  }

  *out = std::make_shared<MemoryDocumentStore>(address, std::move(log));
  return Result::Ok();
}

void MemoryStoreBackend::MarkCorrupted(const std::string& address) {
  std::scoped_lock lock(mutex_);
  corrupted_.insert(address);
}

uint64_t MemoryStoreBackend::OpenCount(const std::string& address) const {
  std::scoped_lock lock(mutex_);
  auto             it = open_counts_.find(address);
  return it == open_counts_.end() ? 0 : it->second;
}

} // namespace shopstore::db::memory
