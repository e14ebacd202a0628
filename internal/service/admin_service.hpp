#pragma once

#include "internal/util/context.hpp"
#include "service_context.hpp"
#include "shopstore/v1.hpp"

namespace shopstore::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  shopstore::v1::StatsResponse Stats(const util::Context& ctx, const shopstore::v1::StatsRequest& req);

  shopstore::v1::DatabaseStatusResponse DatabaseStatus(const util::Context& ctx, const shopstore::v1::DatabaseStatusRequest& req);

  shopstore::v1::ListConnectedResponse ListConnected(const shopstore::v1::ListConnectedRequest& req);

  void CloseDatabase(const shopstore::v1::CloseDatabaseRequest& req);

  void RepairDatabase(const util::Context& ctx, const shopstore::v1::RepairDatabaseRequest& req);

  shopstore::v1::ReloadDatabasesResponse ReloadDatabases(const util::Context& ctx, const shopstore::v1::ReloadDatabasesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace shopstore::service
