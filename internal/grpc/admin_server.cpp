#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace shopstore::grpc {

AdminServer::AdminServer(std::shared_ptr<shopstore::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext* context, const shopstore::v1::StatsRequest* req, shopstore::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::DatabaseStatus(::grpc::ServerContext* context, const shopstore::v1::DatabaseStatusRequest* req, shopstore::v1::DatabaseStatusResponse* resp) {
  try {
    *resp = service_->DatabaseStatus(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListConnected(::grpc::ServerContext*, const shopstore::v1::ListConnectedRequest* req, shopstore::v1::ListConnectedResponse* resp) {
  try {
    *resp = service_->ListConnected(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::CloseDatabase(::grpc::ServerContext*, const shopstore::v1::CloseDatabaseRequest* req, google::protobuf::Empty*) {
  try {
    service_->CloseDatabase(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RepairDatabase(::grpc::ServerContext* context, const shopstore::v1::RepairDatabaseRequest* req, google::protobuf::Empty*) {
  try {
    service_->RepairDatabase(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ReloadDatabases(::grpc::ServerContext* context, const shopstore::v1::ReloadDatabasesRequest* req, shopstore::v1::ReloadDatabasesResponse* resp) {
  try {
    *resp = service_->ReloadDatabases(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace shopstore::grpc
