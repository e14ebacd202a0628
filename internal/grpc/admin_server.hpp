#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "shopstore/services/v1/shop_admin_service.grpc.pb.h"
#include "shopstore/v1.hpp"

namespace shopstore::grpc {

class AdminServer final : public shopstore::v1::ShopAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<shopstore::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const shopstore::v1::StatsRequest*, shopstore::v1::StatsResponse*) override;

  ::grpc::Status DatabaseStatus(::grpc::ServerContext*, const shopstore::v1::DatabaseStatusRequest*, shopstore::v1::DatabaseStatusResponse*) override;

  ::grpc::Status ListConnected(::grpc::ServerContext*, const shopstore::v1::ListConnectedRequest*, shopstore::v1::ListConnectedResponse*) override;

  ::grpc::Status CloseDatabase(::grpc::ServerContext*, const shopstore::v1::CloseDatabaseRequest*, google::protobuf::Empty*) override;

  ::grpc::Status RepairDatabase(::grpc::ServerContext*, const shopstore::v1::RepairDatabaseRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ReloadDatabases(::grpc::ServerContext*, const shopstore::v1::ReloadDatabasesRequest*, shopstore::v1::ReloadDatabasesResponse*) override;

 private:
  std::shared_ptr<shopstore::service::AdminService> service_;
};

} // namespace shopstore::grpc
