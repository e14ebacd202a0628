#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/catalog_service.hpp"
#include "shopstore/services/v1/shop_catalog_service.grpc.pb.h"
#include "shopstore/v1.hpp"

namespace shopstore::grpc {

class CatalogServer final : public shopstore::v1::ShopCatalogService::Service {
 public:
  explicit CatalogServer(std::shared_ptr<shopstore::service::CatalogService> svc);

  ::grpc::Status GetShop(::grpc::ServerContext*, const shopstore::v1::GetShopRequest*, shopstore::v1::GetShopResponse*) override;

  ::grpc::Status ListShops(::grpc::ServerContext*, const shopstore::v1::ListShopsRequest*, shopstore::v1::ListShopsResponse*) override;

  ::grpc::Status CreateShop(::grpc::ServerContext*, const shopstore::v1::CreateShopRequest*, shopstore::v1::CreateShopResponse*) override;

  ::grpc::Status UpdateShop(::grpc::ServerContext*, const shopstore::v1::UpdateShopRequest*, shopstore::v1::UpdateShopResponse*) override;

  ::grpc::Status DeleteShop(::grpc::ServerContext*, const shopstore::v1::DeleteShopRequest*, google::protobuf::Empty*) override;

  ::grpc::Status AddShopAsset(::grpc::ServerContext*, const shopstore::v1::ShopAssetRequest*, shopstore::v1::ShopAssetResponse*) override;

  ::grpc::Status RemoveShopAsset(::grpc::ServerContext*, const shopstore::v1::ShopAssetRequest*, shopstore::v1::ShopAssetResponse*) override;

  ::grpc::Status ExportShop(::grpc::ServerContext*, const shopstore::v1::ExportShopRequest*, shopstore::v1::ExportShopResponse*) override;

  ::grpc::Status ImportShop(::grpc::ServerContext*, const shopstore::v1::ImportShopRequest*, shopstore::v1::ImportShopResponse*) override;

 private:
  std::shared_ptr<shopstore::service::CatalogService> service_;
};

} // namespace shopstore::grpc
