#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/document_store.hpp"
#include "internal/util/context.hpp"
#include "internal/util/keyed_mutex.hpp"

namespace shopstore::metadata {
class MetadataIndex;
}

namespace shopstore::registry {

/*
  Owns every open per-shop store handle.

  Locking:
    handles_mutex_   shared for lookups, exclusive for insert/erase only
    lifecycle mutex  one per shop id; serialises open/close/repair so two
                     callers never open the same store twice

  No lock in this class is held across a backend call except the
  per-id lifecycle mutex, which only blocks callers of the same id.
*/
class StoreRegistry {
 public:
  StoreRegistry(db::StoreBackendPtr backend, std::shared_ptr<metadata::MetadataIndex> index);

  // Cached handle, or open/create + load. Throws util::StoreUnavailable.
  db::DocumentStorePtr GetOrCreate(const util::Context& ctx, const std::string& id);

  // Throws util::NotOpen when no handle is cached.
  void Close(const std::string& id);

  // Reopens the store at the recorded address, recreating it when it cannot
  // be read. Throws util::NotFound (no address) or util::StoreUnavailable.
  db::DocumentStorePtr Repair(const util::Context& ctx, const std::string& id);

  // Open + load an existing address (startup scan). No metadata writes.
  db::DocumentStorePtr Reconnect(const util::Context& ctx, const std::string& id, const std::string& address);

  // Takes ownership of a handle opened elsewhere; closes any previous one.
  void Adopt(const std::string& id, db::DocumentStorePtr handle);

  db::DocumentStorePtr               Find(const std::string& id) const;
  bool                               IsOpen(const std::string& id) const;
  std::vector<std::string>           OpenIds() const;
  std::map<std::string, std::string> Connected() const; // id -> address

  // Closes everything, logging failures.
  void CloseAll();

  const db::StoreBackendPtr& Backend() const {
    return backend_;
  }

  // Ids with a lifecycle mutex currently held or awaited.
  std::size_t LifecycleSlots() const {
    return lifecycle_.Size();
  }

 private:
  db::DocumentStorePtr        OpenAndLoad(const util::Context& ctx, const std::string& id, const std::string& address, const db::OpenOptions& options);
  void                        Insert(const std::string& id, db::DocumentStorePtr handle);
  db::DocumentStorePtr        Take(const std::string& id);

  db::StoreBackendPtr                      backend_;
  std::shared_ptr<metadata::MetadataIndex> index_;

  mutable std::shared_mutex                             handles_mutex_;
  std::unordered_map<std::string, db::DocumentStorePtr> handles_;

  util::KeyedMutex lifecycle_;
};

} // namespace shopstore::registry
