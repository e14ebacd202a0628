#include "internal/core/shop_manager.hpp"

#include <algorithm>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>

#include "internal/cache/shop_cache.hpp"
#include "internal/core/bounded_fanout.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/metadata/metadata_index.hpp"
#include "internal/model/shop_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/store_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"

namespace shopstore::core {

namespace {

using observability::IntField;
using observability::StringField;

constexpr int64_t kLoadAll = -1;

bool IsRootOf(const db::model::DocumentRecord& doc, const std::string& id) {
  return doc.type == model::kShopDocumentType && doc.key == id;
}

const std::string& SortKey(const model::ShopRecord& shop, std::string_view sort_by) {
  if (sort_by == "id") return shop.id();
  if (sort_by == "owner") return shop.owner();
  return shop.name();
}

void StampItems(model::ShopRecord* shop, const google::protobuf::Timestamp& now) {
  for (auto& item : *shop->mutable_content()->mutable_items()) {
    if (!item.has_created()) *item.mutable_created() = now;
  }
}

} // namespace

AssetType ParseAssetType(std::string_view value) {
  if (value == "logo") return AssetType::Logo;
  if (value == "item") return AssetType::Item;
  throw util::ValidationError("invalid asset type: " + std::string(value));
}

ShopManager::ShopManager(std::shared_ptr<metadata::MetadataIndex> index, std::shared_ptr<registry::StoreRegistry> registry,
                         std::shared_ptr<cache::ShopCache> cache, ShopManagerOptions options, util::ClockFn clock)
    : index_(std::move(index)), registry_(std::move(registry)), cache_(std::move(cache)), options_(options), clock_(std::move(clock)) {
  if (!index_ || !registry_ || !cache_) {
    throw std::invalid_argument("ShopManager requires index, registry and cache");
  }
  if (!clock_) clock_ = util::Now;
}

void ShopManager::RequireConnected() const {
  if (!connected_.load(std::memory_order_acquire)) {
    throw util::InvalidState("shop manager is not connected");
  }
}

bool ShopManager::IsConnected() const {
  return connected_.load(std::memory_order_acquire);
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

ReconnectReport ShopManager::Connect(const util::Context& ctx) {
  index_->EnsureDirectory();
  connected_.store(true, std::memory_order_release);

  auto report = Scan(ctx);
  SHOPSTORE_LOG_INFO("shop manager connected",
                     {StringField("directory", index_->Directory().string()), IntField("reconnected", static_cast<int64_t>(report.reconnected)),
                      IntField("skipped", static_cast<int64_t>(report.skipped)), IntField("failed", static_cast<int64_t>(report.failures.size()))});
  return report;
}

ReconnectReport ShopManager::Scan(const util::Context& ctx) {
  ReconnectReport report;

  for (const auto& id : index_->ListIds()) {
    if (ctx.IsCancelled()) throw util::Cancelled("reconnect cancelled");

    try {
      auto lock = shop_locks_.Lock(id);
      auto meta = index_->Get(id);
      if (!meta || meta->storage_address().empty()) {
        ++report.skipped;
        continue;
      }
      registry_->Reconnect(ctx, id, meta->storage_address());
      ++report.reconnected;
    } catch (const util::Cancelled&) {
      throw;
    } catch (const std::exception& e) {
      SHOPSTORE_LOG_WARN("store reconnect failed", {StringField("shop_id", id), StringField("error", e.what())});
      report.failures.push_back(id + ": " + e.what());
    }
  }

  return report;
}

ReconnectReport ShopManager::ReconnectExisting(const util::Context& ctx) {
  RequireConnected();

  auto report = Scan(ctx);
  if (report.reconnected == 0 && !report.failures.empty()) {
    throw util::AggregateError("failed to reconnect any shop store", report.failures);
  }
  return report;
}

ReconnectReport ShopManager::ReloadAll(const util::Context& ctx) {
  RequireConnected();

  SHOPSTORE_LOG_INFO("reloading shop stores", {IntField("open", static_cast<int64_t>(registry_->OpenIds().size()))});
  registry_->CloseAll();
  return ReconnectExisting(ctx);
}

void ShopManager::Close() {
  if (!connected_.exchange(false, std::memory_order_acq_rel)) return;

  registry_->CloseAll();
  cache_->Clear();
  SHOPSTORE_LOG_INFO("shop manager closed");
}

// ------------------------------------------------------------
// Store documents
// ------------------------------------------------------------

std::optional<ShopManager::RootDocument> ShopManager::ReadRoot(const util::Context& ctx, const db::DocumentStorePtr& handle, const std::string& id) {
  std::vector<db::model::DocumentRecord> docs;
  ThrowIfDbError(handle->Query(ctx, [&id](const db::model::DocumentRecord& doc) { return IsRootOf(doc, id); }, &docs), "query shop " + id);
  if (docs.empty()) return std::nullopt;

  RootDocument root{model::FromDocument(docs.front()), docs.front().ref};
  return root;
}

void ShopManager::WriteRoot(const util::Context& ctx, const db::DocumentStorePtr& handle, const model::ShopRecord& shop) {
  auto doc = model::ToDocument(shop);
  ThrowIfDbError(handle->Put(ctx, doc), "write shop " + shop.id());
}

// ------------------------------------------------------------
// Single shop
// ------------------------------------------------------------

model::ShopRecord ShopManager::GetShop(const util::Context& ctx, const std::string& id) {
  RequireConnected();
  util::ValidateShopId(id);

  if (auto cached = cache_->Get(id)) return std::move(*cached);

  auto lock = shop_locks_.Lock(id);
  return ReadLocked(ctx, id);
}

model::ShopRecord ShopManager::ReadLocked(const util::Context& ctx, const std::string& id) {
  // filled by whoever held the lock before us
  if (auto cached = cache_->Get(id)) return std::move(*cached);

  if (!index_->Get(id)) throw util::NotFound("shop not found: " + id);

  auto handle = registry_->GetOrCreate(ctx, id);
  auto root   = ReadRoot(ctx, handle, id);
  if (!root) throw util::NotFound("shop document not found: " + id);

  cache_->Set(id, root->shop);
  return std::move(root->shop);
}

model::ShopRecord ShopManager::CreateShop(const util::Context& ctx, const model::ShopRecord& input) {
  RequireConnected();

  model::ShopRecord shop = input;
  model::ApplyDefaults(&shop);
  model::ValidateShop(shop);

  auto lock = shop_locks_.Lock(shop.id());

  auto handle = registry_->GetOrCreate(ctx, shop.id());
  if (ReadRoot(ctx, handle, shop.id())) throw util::AlreadyExists("shop already exists: " + shop.id());

  const auto now = util::ToProto(clock_());
  *shop.mutable_created() = now;
  *shop.mutable_updated() = now;
  StampItems(&shop, now);
  shop.set_storage_address(handle->Address());

  WriteRoot(ctx, handle, shop);
  index_->Save(model::MetadataOf(shop));
  cache_->Set(shop.id(), shop);

  SHOPSTORE_LOG_INFO("shop created", {StringField("shop_id", shop.id()), StringField("owner", shop.owner()), StringField("address", shop.storage_address())});
  return shop;
}

model::ShopRecord ShopManager::UpdateShop(const util::Context& ctx, const model::ShopRecord& input) {
  RequireConnected();

  model::ShopRecord shop = input;
  model::ApplyDefaults(&shop);
  model::ValidateShop(shop);

  auto lock = shop_locks_.Lock(shop.id());
  return UpdateLocked(ctx, std::move(shop));
}

model::ShopRecord ShopManager::UpdateLocked(const util::Context& ctx, model::ShopRecord shop) {
  if (!index_->Get(shop.id())) throw util::NotFound("shop not found: " + shop.id());

  auto handle   = registry_->GetOrCreate(ctx, shop.id());
  auto existing = ReadRoot(ctx, handle, shop.id());
  if (!existing) throw util::NotFound("shop document not found: " + shop.id());

  const auto now          = util::ToProto(clock_());
  *shop.mutable_created() = existing->shop.created();
  *shop.mutable_updated() = now;
  StampItems(&shop, now);
  shop.set_storage_address(handle->Address());

  WriteRoot(ctx, handle, shop);
  index_->Save(model::MetadataOf(shop));
  cache_->Set(shop.id(), shop);

  SHOPSTORE_LOG_DEBUG("shop updated", {StringField("shop_id", shop.id())});
  return shop;
}

void ShopManager::DeleteShop(const util::Context& ctx, const std::string& id) {
  RequireConnected();
  util::ValidateShopId(id);

  auto lock = shop_locks_.Lock(id);

  if (!index_->Get(id)) throw util::NotFound("shop not found: " + id);

  auto handle = registry_->GetOrCreate(ctx, id);
  if (auto root = ReadRoot(ctx, handle, id)) {
    ThrowIfDbError(handle->Delete(ctx, root->ref), "delete shop document " + id);
  }

  try {
    registry_->Close(id);
  } catch (const std::exception& e) {
    SHOPSTORE_LOG_WARN("close after delete failed", {StringField("shop_id", id), StringField("error", e.what())});
  }

  index_->Delete(id);
  cache_->Remove(id);

  SHOPSTORE_LOG_INFO("shop deleted", {StringField("shop_id", id), StringField("address", handle->Address())});
}

model::ShopRecord ShopManager::AddShopAsset(const util::Context& ctx, const std::string& id, AssetType type, const std::string& cid) {
  RequireConnected();
  util::ValidateShopId(id);
  if (cid.empty()) throw util::ValidationError("asset cid is required");

  auto lock = shop_locks_.Lock(id);

  auto shop = ReadLocked(ctx, id);
  switch (type) {
    case AssetType::Logo:
      shop.mutable_assets()->set_logo_cid(cid);
      break;
    case AssetType::Item:
      shop.mutable_assets()->add_item_image_cids(cid);
      break;
  }
  return UpdateLocked(ctx, std::move(shop));
}

model::ShopRecord ShopManager::RemoveShopAsset(const util::Context& ctx, const std::string& id, AssetType type, const std::string& cid) {
  RequireConnected();
  util::ValidateShopId(id);
  if (cid.empty()) throw util::ValidationError("asset cid is required");

  auto lock = shop_locks_.Lock(id);

  auto  shop   = ReadLocked(ctx, id);
  auto* assets = shop.mutable_assets();
  switch (type) {
    case AssetType::Logo:
      if (assets->logo_cid() == cid) assets->clear_logo_cid();
      break;
    case AssetType::Item: {
      auto* cids = assets->mutable_item_image_cids();
      cids->erase(std::remove(cids->begin(), cids->end(), cid), cids->end());
      break;
    }
  }
  return UpdateLocked(ctx, std::move(shop));
}

std::string ShopManager::ExportShop(const util::Context& ctx, const std::string& id) {
  RequireConnected();
  util::ValidateShopId(id);

  auto lock = shop_locks_.Lock(id);

  auto meta = index_->Get(id);
  if (!meta) throw util::NotFound("shop not found: " + id);

  auto handle = registry_->GetOrCreate(ctx, id);
  auto root   = ReadRoot(ctx, handle, id);
  if (!root) throw util::NotFound("shop document not found: " + id);

  model::ShopExport bundle;
  *bundle.mutable_shop_data() = std::move(root->shop);
  *bundle.mutable_metadata()  = std::move(*meta);
  return model::ExportToJson(bundle);
}

model::ShopRecord ShopManager::ImportShop(const util::Context& ctx, const std::string& data) {
  RequireConnected();

  auto              bundle = model::ExportFromJson(data);
  model::ShopRecord shop   = bundle.shop_data();
  model::ApplyDefaults(&shop);
  model::ValidateShop(shop);

  auto lock = shop_locks_.Lock(shop.id());

  const auto& backend = registry_->Backend();

  db::DocumentStorePtr handle;
  const auto&          address = bundle.metadata().storage_address();
  if (!address.empty()) {
    auto opened = backend->Open(address, {}, &handle);
    if (!opened) {
      SHOPSTORE_LOG_WARN("import address unusable, creating a new store", {StringField("shop_id", shop.id()), StringField("address", address), StringField("error", opened.message)});
      handle.reset();
    }
  }
  if (!handle) {
    auto created = backend->Create("shop-" + shop.id(), &handle);
    if (!created) throw util::StoreUnavailable("create store for imported shop " + shop.id() + ": " + created.message);
  }

  try {
    ThrowIfDbError(handle->Load(ctx, kLoadAll), "load store for imported shop " + shop.id());

    if (!shop.has_created()) *shop.mutable_created() = util::ToProto(clock_());
    if (!shop.has_updated()) *shop.mutable_updated() = shop.created();
    shop.set_storage_address(handle->Address());

    WriteRoot(ctx, handle, shop);
    index_->Save(model::MetadataOf(shop));
  } catch (...) {
    if (auto closed = handle->Close(); !closed) {
      SHOPSTORE_LOG_WARN("store close failed", {StringField("shop_id", shop.id()), StringField("error", closed.message)});
    }
    throw;
  }

  registry_->Adopt(shop.id(), handle);
  cache_->Set(shop.id(), shop);

  SHOPSTORE_LOG_INFO("shop imported", {StringField("shop_id", shop.id()), StringField("name", shop.name()), StringField("address", shop.storage_address())});
  return shop;
}

// ------------------------------------------------------------
// Listing
// ------------------------------------------------------------

std::vector<model::ShopRecord> ShopManager::ListShops(const util::Context& ctx, const ListShopsOptions& options) {
  RequireConnected();

  const auto ids    = index_->ListIds();
  const auto limit  = static_cast<std::size_t>(options.limit > 0 ? options.limit : options_.default_list_limit);
  const auto offset = static_cast<std::size_t>(std::max<int64_t>(options.offset, 0));
  if (offset >= ids.size()) return {};

  // the page is cut before fetching, so the owner filter only sees this page
  const auto               end = std::min(ids.size(), offset + limit);
  std::vector<std::string> page(ids.begin() + static_cast<std::ptrdiff_t>(offset), ids.begin() + static_cast<std::ptrdiff_t>(end));

  std::mutex                     results_mutex;
  std::vector<model::ShopRecord> shops;
  std::vector<std::string>       failures;
  shops.reserve(page.size());

  const bool launched_all = ForEachBounded(ctx, page.size(), options_.list_concurrency, [&](std::size_t i) {
    const auto& id = page[i];
    try {
      auto                        shop = GetShop(ctx, id);
      std::lock_guard<std::mutex> lock(results_mutex);
      shops.push_back(std::move(shop));
    } catch (const std::exception& e) {
      std::lock_guard<std::mutex> lock(results_mutex);
      failures.push_back(id + ": " + e.what());
    }
  });

  if (!launched_all || ctx.IsCancelled()) {
    throw util::Cancelled("list shops cancelled");
  }

  if (shops.empty() && !failures.empty()) {
    throw util::AggregateError("failed to load any of " + std::to_string(page.size()) + " shops", failures);
  }
  for (const auto& failure : failures) {
    SHOPSTORE_LOG_WARN("shop skipped in listing", {StringField("error", failure)});
  }

  if (!options.owner.empty()) {
    std::erase_if(shops, [&](const model::ShopRecord& shop) { return shop.owner() != options.owner; });
  }

  if (!options.sort_by.empty()) {
    const std::string_view sort_by = options.sort_by;
    std::stable_sort(shops.begin(), shops.end(), [&](const model::ShopRecord& a, const model::ShopRecord& b) {
      return options.sort_desc ? SortKey(b, sort_by) < SortKey(a, sort_by) : SortKey(a, sort_by) < SortKey(b, sort_by);
    });
  }

  return shops;
}

std::vector<model::ShopRecord> ShopManager::ListShopsByOwner(const util::Context& ctx, const std::string& owner) {
  if (owner.empty()) throw util::ValidationError("owner address is required");

  ListShopsOptions options;
  options.owner = owner;
  return ListShops(ctx, options);
}

std::vector<model::ShopRecord> ShopManager::ShopsFor(const util::Context& ctx, const std::string& owner) {
  if (owner.empty()) throw util::ValidationError("owner address is required");

  ListShopsOptions options;
  options.owner   = owner;
  options.sort_by = "name";
  return ListShops(ctx, options);
}

// ------------------------------------------------------------
// Administration
// ------------------------------------------------------------

std::size_t ShopManager::GetShopCount() const {
  RequireConnected();
  return index_->Count();
}

DatabaseStatus ShopManager::GetDatabaseStatus(const util::Context& ctx, const std::string& id) {
  RequireConnected();
  util::ValidateShopId(id);

  DatabaseStatus status;
  status.shop_id = id;

  if (auto handle = registry_->Find(id)) {
    std::vector<db::model::DocumentRecord> docs;
    ThrowIfDbError(handle->Query(ctx, nullptr, &docs), "query store for shop " + id);
    status.address      = handle->Address();
    status.loaded       = true;
    status.record_count = docs.size();
    return status;
  }

  auto meta = index_->Get(id);
  if (!meta || meta->storage_address().empty()) throw util::NotFound("no store found for shop " + id);
  status.address = meta->storage_address();
  return status;
}

DatabaseStats ShopManager::GetDatabaseStats(const util::Context& ctx) {
  RequireConnected();

  DatabaseStats stats;
  stats.total_databases = index_->Count();
  stats.cached_shops    = cache_->Size();

  for (const auto& id : registry_->OpenIds()) {
    auto handle = registry_->Find(id);
    if (!handle) continue;
    ++stats.loaded_databases;

    std::vector<db::model::DocumentRecord> docs;
    auto                                   result = handle->Query(ctx, nullptr, &docs);
    if (!result) {
      SHOPSTORE_LOG_WARN("record count failed", {StringField("shop_id", id), StringField("error", result.message)});
      continue;
    }
    stats.total_records += docs.size();
  }

  if (stats.loaded_databases > 0) stats.avg_records_per_store = stats.total_records / stats.loaded_databases;
  return stats;
}

std::vector<DatabaseInfo> ShopManager::ConnectedDatabases() const {
  RequireConnected();

  std::vector<DatabaseInfo> out;
  for (auto& [id, address] : registry_->Connected()) {
    out.push_back({id, address});
  }
  return out;
}

void ShopManager::CloseShopDatabase(const std::string& id) {
  RequireConnected();
  util::ValidateShopId(id);
  registry_->Close(id);
  SHOPSTORE_LOG_INFO("store closed", {StringField("shop_id", id)});
}

void ShopManager::RepairShopDatabase(const util::Context& ctx, const std::string& id) {
  RequireConnected();
  util::ValidateShopId(id);

  auto lock = shop_locks_.Lock(id);
  registry_->Repair(ctx, id);
  // the store may have come back empty
  cache_->Remove(id);
}

} // namespace shopstore::core
