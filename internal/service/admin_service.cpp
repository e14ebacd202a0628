#include "admin_service.hpp"

#include "internal/core/shop_manager.hpp"
#include "internal/service/observe_rpc.hpp"

namespace shopstore::service {

using namespace shopstore::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const util::Context& ctx, const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    const auto stats = ctx_.manager->GetDatabaseStats(ctx);

    StatsResponse resp;
    resp.set_total_databases(stats.total_databases);
    resp.set_loaded_databases(stats.loaded_databases);
    resp.set_total_records(stats.total_records);
    resp.set_avg_records_per_store(stats.avg_records_per_store);
    resp.set_cached_shops(stats.cached_shops);
    return resp;
  });
}

DatabaseStatusResponse AdminService::DatabaseStatus(const util::Context& ctx, const DatabaseStatusRequest& req) {
  return ObserveRpc("AdminService.DatabaseStatus", req.shop_id(), [&] {
    const auto status = ctx_.manager->GetDatabaseStatus(ctx, req.shop_id());

    DatabaseStatusResponse resp;
    resp.set_shop_id(status.shop_id);
    resp.set_address(status.address);
    resp.set_loaded(status.loaded);
    resp.set_record_count(status.record_count);
    return resp;
  });
}

ListConnectedResponse AdminService::ListConnected(const ListConnectedRequest&) {
  return ObserveRpc("AdminService.ListConnected", "", [&] {
    ListConnectedResponse resp;
    for (const auto& info : ctx_.manager->ConnectedDatabases()) {
      auto* db = resp.add_databases();
      db->set_shop_id(info.shop_id);
      db->set_address(info.address);
    }
    return resp;
  });
}

void AdminService::CloseDatabase(const CloseDatabaseRequest& req) {
  ObserveRpc("AdminService.CloseDatabase", req.shop_id(), [&] { ctx_.manager->CloseShopDatabase(req.shop_id()); });
}

void AdminService::RepairDatabase(const util::Context& ctx, const RepairDatabaseRequest& req) {
  ObserveRpc("AdminService.RepairDatabase", req.shop_id(), [&] { ctx_.manager->RepairShopDatabase(ctx, req.shop_id()); });
}

ReloadDatabasesResponse AdminService::ReloadDatabases(const util::Context& ctx, const ReloadDatabasesRequest&) {
  return ObserveRpc("AdminService.ReloadDatabases", "", [&] {
    const auto report = ctx_.manager->ReloadAll(ctx);

    ReloadDatabasesResponse resp;
    resp.set_reconnected(report.reconnected);
    resp.set_skipped(report.skipped);
    for (const auto& failure : report.failures) resp.add_failures(failure);
    return resp;
  });
}

} // namespace shopstore::service
