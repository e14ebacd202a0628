#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "internal/cache/shop_cache.hpp"
#include "internal/core/shop_manager.hpp"
#include "internal/db/memory/memory_store_backend.hpp"
#include "internal/db/sqlite/sqlite_store_backend.hpp"
#include "internal/metadata/metadata_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/store_registry.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/service_context.hpp"

namespace shopstore::factory {

using namespace shopstore;

std::shared_ptr<db::StoreBackend> BuildStoreBackend(const shopstore::runtime::config::StoreConfig& config) {
  if (config.has_memory()) {
    return std::make_shared<db::memory::MemoryStoreBackend>();
  }

  if (config.has_sqlite()) {
    const auto& sqlite = config.sqlite();

    std::filesystem::path root = sqlite.root_path();
    if (root.empty()) root = std::filesystem::path(config.directory()) / "stores";

    db::sqlite::SqliteOptions options;
    options.wal_mode        = !sqlite.has_wal_mode() || sqlite.wal_mode();
    options.busy_timeout_ms = sqlite.busy_timeout_ms();
    return std::make_shared<db::sqlite::SqliteStoreBackend>(std::move(root), options);
  }

  throw std::runtime_error("store backend not configured");
}

/*
    Build full application dependency graph
*/
Application Build(const shopstore::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.backend = BuildStoreBackend(config.store());

  auto metadata_index = std::make_shared<metadata::MetadataIndex>(config.store().directory());
  auto store_registry = std::make_shared<registry::StoreRegistry>(app.backend, metadata_index);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto ttl = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(config.cache().ttl().seconds()) +
                                                                         std::chrono::nanoseconds(config.cache().ttl().nanos()));
  auto shop_cache = std::make_shared<cache::ShopCache>(config.cache().capacity(), ttl);

  core::ShopManagerOptions options;
  options.list_concurrency   = config.listing().concurrency();
  options.default_list_limit = config.listing().default_limit();

  app.manager = std::make_shared<core::ShopManager>(metadata_index, store_registry, shop_cache, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  app.catalog_service = std::make_shared<service::CatalogService>(ctx);
  app.admin_service   = std::make_shared<service::AdminService>(ctx);

  SHOPSTORE_LOG_INFO("application built", {observability::StringField("backend", app.backend->Name()), observability::StringField("directory", config.store().directory()),
                                           observability::IntField("cache_capacity", config.cache().capacity()),
                                           observability::IntField("list_concurrency", config.listing().concurrency())});
  return app;
}

} // namespace shopstore::factory
