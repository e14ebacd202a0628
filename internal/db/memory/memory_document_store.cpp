#include "memory_document_store.hpp"

#include <algorithm>

namespace shopstore::db::memory {

MemoryDocumentStore::MemoryDocumentStore(std::string address, std::shared_ptr<MemoryLog> log)
    : address_(std::move(address)), log_(std::move(log)) {
}

Result MemoryDocumentStore::Load(const util::Context& ctx, int64_t depth) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "load cancelled");

  std::vector<MemoryLog::Entry> entries;
  {
    std::scoped_lock lock(log_->mutex);
    entries = log_->entries;
  }

  size_t first = 0;
  if (depth >= 0 && static_cast<size_t>(depth) < entries.size()) {
    first = entries.size() - static_cast<size_t>(depth);
  }

  std::scoped_lock lock(mutex_);
  if (closed_) return Result::Err(ErrorCode::Closed, address_);

  index_.clear();
  for (size_t i = first; i < entries.size(); ++i) {
    const auto& entry = entries[i];
    if (entry.op == MemoryLog::Op::Put) {
      index_[entry.doc.key] = entry.doc;
    } else {
      index_.erase(entry.doc.key);
    }
  }
  return Result::Ok();
}

Result MemoryDocumentStore::Append(MemoryLog::Op op, model::DocumentRecord* doc) {
  std::scoped_lock lock(log_->mutex);
  const uint64_t   seq = log_->next_seq++;
  if (op == MemoryLog::Op::Put) doc->ref = std::to_string(seq);
  log_->entries.push_back({seq, op, *doc});
  return Result::Ok();
}

Result MemoryDocumentStore::Put(const util::Context& ctx, model::DocumentRecord& doc) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "put cancelled");
  if (doc.key.empty()) return Result::Err(ErrorCode::InvalidArgument, "document key is empty");

  std::scoped_lock lock(mutex_);
  if (closed_) return Result::Err(ErrorCode::Closed, address_);

  if (auto r = Append(MemoryLog::Op::Put, &doc); !r) return r;
  index_[doc.key] = doc;
  return Result::Ok();
}

Result MemoryDocumentStore::Query(const util::Context& ctx, const DocumentPredicate& predicate, std::vector<model::DocumentRecord>* out) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "query cancelled");

  std::scoped_lock lock(mutex_);
  if (closed_) return Result::Err(ErrorCode::Closed, address_);

  out->clear();
  for (const auto& [_, doc] : index_) {
    if (!predicate || predicate(doc)) out->push_back(doc);
  }
  return Result::Ok();
}

Result MemoryDocumentStore::Delete(const util::Context& ctx, const std::string& ref) {
  if (ctx.IsCancelled()) return Result::Err(ErrorCode::Cancelled, "delete cancelled");

  std::scoped_lock lock(mutex_);
  if (closed_) return Result::Err(ErrorCode::Closed, address_);

  auto it = std::find_if(index_.begin(), index_.end(), [&](const auto& kv) { return kv.second.ref == ref; });
  if (it == index_.end()) return Result::Err(ErrorCode::NotFound, "no document with ref " + ref);

  model::DocumentRecord tombstone{ref, it->first, it->second.type, {}};
  if (auto r = Append(MemoryLog::Op::Delete, &tombstone); !r) return r;
  index_.erase(it);
  return Result::Ok();
}

Result MemoryDocumentStore::Close() {
  std::scoped_lock lock(mutex_);
  closed_ = true;
  index_.clear();
  return Result::Ok();
}

} // namespace shopstore::db::memory
