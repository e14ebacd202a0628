#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/document_store.hpp"
#include "internal/model/shop.hpp"
#include "internal/util/context.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/time.hpp"

namespace shopstore::metadata {
class MetadataIndex;
}
namespace shopstore::registry {
class StoreRegistry;
}
namespace shopstore::cache {
class ShopCache;
}

namespace shopstore::core {

struct ShopManagerOptions {
  // GetShop calls in flight during ListShops
  std::size_t list_concurrency = 5;

  // page size when ListShopsOptions::limit <= 0
  int64_t default_list_limit = 100;
};

struct ListShopsOptions {
  // post-fetch filter; empty keeps every shop
  std::string owner;

  int64_t limit  = 0;
  int64_t offset = 0;

  // "name", "id" or "owner"; empty keeps fetch order
  std::string sort_by;
  bool        sort_desc = false;
};

enum class AssetType { Logo, Item };

// "logo" / "item"; anything else is a util::ValidationError.
AssetType ParseAssetType(std::string_view value);

struct DatabaseStatus {
  std::string shop_id;
  std::string address;
  bool        loaded       = false;
  std::size_t record_count = 0;
};

struct DatabaseStats {
  std::size_t total_databases       = 0;
  std::size_t loaded_databases      = 0;
  std::size_t total_records         = 0;
  std::size_t avg_records_per_store = 0;
  std::size_t cached_shops          = 0;
};

struct DatabaseInfo {
  std::string shop_id;
  std::string address;
};

struct ReconnectReport {
  std::size_t              reconnected = 0;
  std::size_t              skipped     = 0; // metadata without a store address
  std::vector<std::string> failures;        // "<id>: <error>"
};

/*
  Façade over the metadata index, the store registry and the shop cache.

  Every operation except Connect() requires a connected manager and throws
  util::InvalidState otherwise. Single-shop operations fail fast; bulk
  operations collect per-shop failures and only throw util::AggregateError
  when nothing succeeded.

  Mutations of one shop are serialised by a per-shop mutex. Reads that
  miss the cache take it too, so they never reopen a shop mid-delete.
*/
class ShopManager {
 public:
  ShopManager(std::shared_ptr<metadata::MetadataIndex> index, std::shared_ptr<registry::StoreRegistry> registry, std::shared_ptr<cache::ShopCache> cache,
              ShopManagerOptions options = {}, util::ClockFn clock = util::Now);

  // lifecycle
  ReconnectReport Connect(const util::Context& ctx);
  ReconnectReport ReconnectExisting(const util::Context& ctx);
  ReconnectReport ReloadAll(const util::Context& ctx);
  void            Close();
  bool            IsConnected() const;

  // single shop
  model::ShopRecord GetShop(const util::Context& ctx, const std::string& id);
  model::ShopRecord CreateShop(const util::Context& ctx, const model::ShopRecord& shop);
  model::ShopRecord UpdateShop(const util::Context& ctx, const model::ShopRecord& shop);
  void              DeleteShop(const util::Context& ctx, const std::string& id);

  model::ShopRecord AddShopAsset(const util::Context& ctx, const std::string& id, AssetType type, const std::string& cid);
  model::ShopRecord RemoveShopAsset(const util::Context& ctx, const std::string& id, AssetType type, const std::string& cid);

  std::string       ExportShop(const util::Context& ctx, const std::string& id);
  model::ShopRecord ImportShop(const util::Context& ctx, const std::string& data);

  // listing
  std::vector<model::ShopRecord> ListShops(const util::Context& ctx, const ListShopsOptions& options);
  std::vector<model::ShopRecord> ListShopsByOwner(const util::Context& ctx, const std::string& owner);
  std::vector<model::ShopRecord> ShopsFor(const util::Context& ctx, const std::string& owner);

  // administration
  std::size_t               GetShopCount() const;
  DatabaseStatus            GetDatabaseStatus(const util::Context& ctx, const std::string& id);
  DatabaseStats             GetDatabaseStats(const util::Context& ctx);
  std::vector<DatabaseInfo> ConnectedDatabases() const;
  void                      CloseShopDatabase(const std::string& id);
  void                      RepairShopDatabase(const util::Context& ctx, const std::string& id);

  // per-shop lock slots currently held or awaited
  std::size_t ShopLockSlots() const {
    return shop_locks_.Size();
  }

 private:
  struct RootDocument {
    model::ShopRecord shop;
    std::string       ref;
  };

  void                        RequireConnected() const;

  std::optional<RootDocument> ReadRoot(const util::Context& ctx, const db::DocumentStorePtr& handle, const std::string& id);
  void                        WriteRoot(const util::Context& ctx, const db::DocumentStorePtr& handle, const model::ShopRecord& shop);

  // caller holds shop_locks_ for the id
  model::ShopRecord ReadLocked(const util::Context& ctx, const std::string& id);
  model::ShopRecord UpdateLocked(const util::Context& ctx, model::ShopRecord shop);

  ReconnectReport Scan(const util::Context& ctx);

  std::shared_ptr<metadata::MetadataIndex> index_;
  std::shared_ptr<registry::StoreRegistry> registry_;
  std::shared_ptr<cache::ShopCache>        cache_;
  ShopManagerOptions                       options_;
  util::ClockFn                            clock_;

  std::atomic<bool> connected_{false};

  util::KeyedMutex shop_locks_;
};

} // namespace shopstore::core
