#include "internal/registry/store_registry.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/metadata/metadata_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shopstore::registry {

namespace {

using observability::StringField;

// Full history replay.
constexpr int64_t kLoadAll = -1;

void CloseAndLog(const db::DocumentStorePtr& handle, const std::string& id) {
  auto result = handle->Close();
  if (!result) {
    SHOPSTORE_LOG_WARN("store close failed", {StringField("shop_id", id), StringField("address", handle->Address()), StringField("error", result.message)});
  }
}

void ThrowOpenFailure(const db::Result& result, const std::string& what) {
  if (result.code == db::ErrorCode::Cancelled) throw util::Cancelled(what + ": " + result.message);
  throw util::StoreUnavailable(what + ": " + result.message);
}

} // namespace

StoreRegistry::StoreRegistry(db::StoreBackendPtr backend, std::shared_ptr<metadata::MetadataIndex> index)
    : backend_(std::move(backend)), index_(std::move(index)) {
}

db::DocumentStorePtr StoreRegistry::Find(const std::string& id) const {
  std::shared_lock lock(handles_mutex_);
  auto             it = handles_.find(id);
  return it == handles_.end() ? nullptr : it->second;
}

bool StoreRegistry::IsOpen(const std::string& id) const {
  std::shared_lock lock(handles_mutex_);
  return handles_.contains(id);
}

std::vector<std::string> StoreRegistry::OpenIds() const {
  std::shared_lock         lock(handles_mutex_);
  std::vector<std::string> ids;
  ids.reserve(handles_.size());
  for (const auto& [id, _] : handles_) ids.push_back(id);
  return ids;
}

std::map<std::string, std::string> StoreRegistry::Connected() const {
  std::shared_lock                   lock(handles_mutex_);
  std::map<std::string, std::string> out;
  for (const auto& [id, handle] : handles_) out[id] = handle->Address();
  return out;
}

void StoreRegistry::Insert(const std::string& id, db::DocumentStorePtr handle) {
  std::unique_lock lock(handles_mutex_);
  handles_[id] = std::move(handle);
}

db::DocumentStorePtr StoreRegistry::Take(const std::string& id) {
  std::unique_lock lock(handles_mutex_);
  auto             it = handles_.find(id);
  if (it == handles_.end()) return nullptr;
  auto handle = std::move(it->second);
  handles_.erase(it);
  return handle;
}

db::DocumentStorePtr StoreRegistry::OpenAndLoad(const util::Context& ctx, const std::string& id, const std::string& address, const db::OpenOptions& options) {
  if (ctx.IsCancelled()) throw util::Cancelled("open store for shop " + id);

  db::DocumentStorePtr handle;
  auto                 opened = backend_->Open(address, options, &handle);
  if (!opened) ThrowOpenFailure(opened, "open store " + address + " for shop " + id);

  auto loaded = handle->Load(ctx, kLoadAll);
  if (!loaded) {
    CloseAndLog(handle, id);
    ThrowOpenFailure(loaded, "load store " + address + " for shop " + id);
  }

  SHOPSTORE_LOG_DEBUG("store opened", {StringField("shop_id", id), StringField("address", address), StringField("backend", backend_->Name())});
  return handle;
}

db::DocumentStorePtr StoreRegistry::GetOrCreate(const util::Context& ctx, const std::string& id) {
  if (auto handle = Find(id)) return handle;

  auto lifecycle = lifecycle_.Lock(id);

  // another caller may have finished the open while we waited
  if (auto handle = Find(id)) return handle;

  auto meta = index_->Get(id);
  if (meta && !meta->storage_address().empty()) {
    auto handle = OpenAndLoad(ctx, id, meta->storage_address(), {});
    Insert(id, handle);
    return handle;
  }

  if (ctx.IsCancelled()) throw util::Cancelled("create store for shop " + id);

  db::DocumentStorePtr handle;
  auto                 created = backend_->Create("shop-" + id, &handle);
  if (!created) ThrowOpenFailure(created, "create store for shop " + id);

  // the address must be discoverable before the handle is usable
  model::ShopMetadata updated;
  if (meta) updated = *meta;
  updated.set_id(id);
  updated.set_storage_address(handle->Address());
  try {
    index_->Save(updated);
  } catch (...) {
    CloseAndLog(handle, id);
    throw;
  }

  auto loaded = handle->Load(ctx, kLoadAll);
  if (!loaded) {
    CloseAndLog(handle, id);
    ThrowOpenFailure(loaded, "load store " + handle->Address() + " for shop " + id);
  }

  SHOPSTORE_LOG_INFO("store created", {StringField("shop_id", id), StringField("address", handle->Address()), StringField("backend", backend_->Name())});
  Insert(id, handle);
  return handle;
}

void StoreRegistry::Close(const std::string& id) {
  auto lifecycle = lifecycle_.Lock(id);

  auto handle = Take(id);
  if (!handle) throw util::NotOpen("store for shop " + id + " is not open");

  core::ThrowIfDbError(handle->Close(), "close store for shop " + id);
}

db::DocumentStorePtr StoreRegistry::Repair(const util::Context& ctx, const std::string& id) {
  auto lifecycle = lifecycle_.Lock(id);

  if (auto handle = Take(id)) {
    core::ThrowIfDbError(handle->Close(), "close store for shop " + id);
  }

  auto meta = index_->Get(id);
  if (!meta || meta->storage_address().empty()) {
    throw util::NotFound("no store address recorded for shop " + id);
  }

  auto handle = OpenAndLoad(ctx, id, meta->storage_address(), db::OpenOptions{.recreate = true});
  Insert(id, handle);

  SHOPSTORE_LOG_INFO("store repaired", {StringField("shop_id", id), StringField("address", handle->Address())});
  return handle;
}

db::DocumentStorePtr StoreRegistry::Reconnect(const util::Context& ctx, const std::string& id, const std::string& address) {
  auto lifecycle = lifecycle_.Lock(id);

  if (auto handle = Find(id)) return handle;

  auto handle = OpenAndLoad(ctx, id, address, {});
  Insert(id, handle);
  return handle;
}

void StoreRegistry::Adopt(const std::string& id, db::DocumentStorePtr handle) {
  auto lifecycle = lifecycle_.Lock(id);

  auto previous = Take(id);
  Insert(id, handle);
  if (previous && previous != handle) CloseAndLog(previous, id);
}

void StoreRegistry::CloseAll() {
  std::unordered_map<std::string, db::DocumentStorePtr> handles;
  {
    std::unique_lock lock(handles_mutex_);
    handles.swap(handles_);
  }

  for (const auto& [id, handle] : handles) {
    CloseAndLog(handle, id);
  }
}

} // namespace shopstore::registry
