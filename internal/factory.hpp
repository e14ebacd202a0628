#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/document_store.hpp"

namespace shopstore::core {
class ShopManager;
}
namespace shopstore::service {
class CatalogService;
class AdminService;
} // namespace shopstore::service

namespace shopstore::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::StoreBackend>      backend;
  std::shared_ptr<core::ShopManager>     manager;
  std::shared_ptr<service::CatalogService> catalog_service;
  std::shared_ptr<service::AdminService>   admin_service;
};

/*
  Build

  Composition root: the only place that knows concrete backend types.
  Expects a config that has been through ConfigLoader::ApplyDefaults.
  The manager is returned unconnected.
*/
Application Build(const shopstore::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::StoreBackend> BuildStoreBackend(const shopstore::runtime::config::StoreConfig& config);

} // namespace shopstore::factory
