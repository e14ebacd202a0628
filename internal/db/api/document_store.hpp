#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/util/context.hpp"

namespace shopstore::db {

using DocumentPredicate = std::function<bool(const model::DocumentRecord&)>;

/*
  One open per-shop document store.

  A store is an append-only log of put/delete entries plus an in-memory
  index keyed by document key. Nothing is queryable until Load() has
  replayed the persisted log.

  Handles are not thread-safe by contract; implementations in this tree
  serialise internally so the registry may hand the same handle to
  concurrent readers.
*/
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  // Stable address; reopening it yields the same store.
  virtual const std::string& Address() const = 0;

  // Materialise persisted history. depth < 0 replays everything, otherwise
  // only the newest `depth` entries are replayed.
  virtual Result Load(const util::Context& ctx, int64_t depth) = 0;

  // Upsert by doc.key. On success doc.ref holds the reference to pass to Delete.
  virtual Result Put(const util::Context& ctx, model::DocumentRecord& doc) = 0;

  virtual Result Query(const util::Context& ctx, const DocumentPredicate& predicate, std::vector<model::DocumentRecord>* out) = 0;

  virtual Result Delete(const util::Context& ctx, const std::string& ref) = 0;

  // Idempotent at the backend level; the registry enforces NotOpen semantics.
  virtual Result Close() = 0;
};

using DocumentStorePtr = std::shared_ptr<DocumentStore>;

struct OpenOptions {
  // Replace an unreadable store at the address with a fresh empty one.
  bool recreate = false;
};

/*
  Factory side of the backend: resolves addresses to stores and allocates
  new ones.
*/
class StoreBackend {
 public:
  virtual ~StoreBackend() = default;

  virtual Result Open(const std::string& address, const OpenOptions& options, DocumentStorePtr* out) = 0;

  // `name` is a human readable hint folded into the new address.
  virtual Result Create(const std::string& name, DocumentStorePtr* out) = 0;

  virtual std::string Name() const = 0;
};

using StoreBackendPtr = std::shared_ptr<StoreBackend>;

} // namespace shopstore::db
