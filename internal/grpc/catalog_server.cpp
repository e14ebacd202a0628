#include "catalog_server.hpp"

#include "grpc_error.hpp"

namespace shopstore::grpc {

CatalogServer::CatalogServer(std::shared_ptr<shopstore::service::CatalogService> svc) : service_(std::move(svc)) {
}

::grpc::Status CatalogServer::GetShop(::grpc::ServerContext* context, const shopstore::v1::GetShopRequest* req, shopstore::v1::GetShopResponse* resp) {
  try {
    *resp = service_->GetShop(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ListShops(::grpc::ServerContext* context, const shopstore::v1::ListShopsRequest* req, shopstore::v1::ListShopsResponse* resp) {
  try {
    *resp = service_->ListShops(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::CreateShop(::grpc::ServerContext* context, const shopstore::v1::CreateShopRequest* req, shopstore::v1::CreateShopResponse* resp) {
  try {
    *resp = service_->CreateShop(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::UpdateShop(::grpc::ServerContext* context, const shopstore::v1::UpdateShopRequest* req, shopstore::v1::UpdateShopResponse* resp) {
  try {
    *resp = service_->UpdateShop(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::DeleteShop(::grpc::ServerContext* context, const shopstore::v1::DeleteShopRequest* req, google::protobuf::Empty*) {
  try {
    service_->DeleteShop(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::AddShopAsset(::grpc::ServerContext* context, const shopstore::v1::ShopAssetRequest* req, shopstore::v1::ShopAssetResponse* resp) {
  try {
    *resp = service_->AddShopAsset(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::RemoveShopAsset(::grpc::ServerContext* context, const shopstore::v1::ShopAssetRequest* req, shopstore::v1::ShopAssetResponse* resp) {
  try {
    *resp = service_->RemoveShopAsset(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ExportShop(::grpc::ServerContext* context, const shopstore::v1::ExportShopRequest* req, shopstore::v1::ExportShopResponse* resp) {
  try {
    *resp = service_->ExportShop(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CatalogServer::ImportShop(::grpc::ServerContext* context, const shopstore::v1::ImportShopRequest* req, shopstore::v1::ImportShopResponse* resp) {
  try {
    *resp = service_->ImportShop(FromServerContext(context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace shopstore::grpc
