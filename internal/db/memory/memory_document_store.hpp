#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/document_store.hpp"
#include "memory_store_backend.hpp"

namespace shopstore::db::memory {

class MemoryDocumentStore final : public db::DocumentStore {
 public:
  MemoryDocumentStore(std::string address, std::shared_ptr<MemoryLog> log);

  const std::string& Address() const override {
    return address_;
  }

  Result Load(const util::Context& ctx, int64_t depth) override;
  Result Put(const util::Context& ctx, model::DocumentRecord& doc) override;
  Result Query(const util::Context& ctx, const DocumentPredicate& predicate, std::vector<model::DocumentRecord>* out) override;
  Result Delete(const util::Context& ctx, const std::string& ref) override;
  Result Close() override;

 private:
  Result Append(MemoryLog::Op op, model::DocumentRecord* doc);

  const std::string          address_;
  std::shared_ptr<MemoryLog> log_;

  std::mutex                                   mutex_;
  std::map<std::string, model::DocumentRecord> index_; // key -> latest document
  bool                                         closed_ = false;
};

} // namespace shopstore::db::memory
