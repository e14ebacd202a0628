#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/document_store.hpp"

namespace shopstore::db::memory {

/*
  Process-local entry log for one address. Survives Close() so a reopened
  store sees its history, the same way a file does for the sqlite backend.
*/
struct MemoryLog {
  enum class Op { Put, Delete };

  struct Entry {
    uint64_t              seq = 0;
    Op                    op  = Op::Put;
    model::DocumentRecord doc;
  };

  std::mutex         mutex;
  std::vector<Entry> entries;
  uint64_t           next_seq = 1;
};

class MemoryStoreBackend final : public db::StoreBackend {
 public:
  MemoryStoreBackend() = default;

  Result Open(const std::string& address, const OpenOptions& options, DocumentStorePtr* out) override;
  Result Create(const std::string& name, DocumentStorePtr* out) override;

  std::string Name() const override {
    return "memory";
  }

  // Fault injection for tests: Open() reports Corruption until the address
  // is reopened with recreate=true.
  void MarkCorrupted(const std::string& address);

  // Number of successful Open/Create calls for the address.
  uint64_t OpenCount(const std::string& address) const;

 private:
  mutable std::mutex                                          mutex_;
  std::unordered_map<std::string, std::shared_ptr<MemoryLog>> logs_;
  std::unordered_set<std::string>                             corrupted_;
  std::unordered_map<std::string, uint64_t>                   open_counts_;
  uint64_t                                                    next_id_ = 1;
};

} // namespace shopstore::db::memory
