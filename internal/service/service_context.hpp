#pragma once

#include <memory>

namespace shopstore::core {
class ShopManager;
}

namespace shopstore::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<shopstore::core::ShopManager> manager;
};

} // namespace shopstore::service
