#pragma once

#include "internal/util/context.hpp"
#include "service_context.hpp"
#include "shopstore/v1.hpp"

namespace shopstore::service {

/*
  Transport-agnostic shop catalog API. Errors propagate as the util::
  exceptions thrown by the manager.
*/
class CatalogService {
 public:
  explicit CatalogService(ServiceContext ctx);

  shopstore::v1::GetShopResponse GetShop(const util::Context& ctx, const shopstore::v1::GetShopRequest& req);

  shopstore::v1::ListShopsResponse ListShops(const util::Context& ctx, const shopstore::v1::ListShopsRequest& req);

  shopstore::v1::CreateShopResponse CreateShop(const util::Context& ctx, const shopstore::v1::CreateShopRequest& req);

  shopstore::v1::UpdateShopResponse UpdateShop(const util::Context& ctx, const shopstore::v1::UpdateShopRequest& req);

  void DeleteShop(const util::Context& ctx, const shopstore::v1::DeleteShopRequest& req);

  shopstore::v1::ShopAssetResponse AddShopAsset(const util::Context& ctx, const shopstore::v1::ShopAssetRequest& req);

  shopstore::v1::ShopAssetResponse RemoveShopAsset(const util::Context& ctx, const shopstore::v1::ShopAssetRequest& req);

  shopstore::v1::ExportShopResponse ExportShop(const util::Context& ctx, const shopstore::v1::ExportShopRequest& req);

  shopstore::v1::ImportShopResponse ImportShop(const util::Context& ctx, const shopstore::v1::ImportShopRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace shopstore::service
