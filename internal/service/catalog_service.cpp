#include "internal/service/catalog_service.hpp"

#include "internal/core/shop_manager.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace shopstore::service {

using namespace shopstore::v1;

namespace {

core::AssetType ToAssetType(AssetType type) {
  switch (type) {
    case ASSET_TYPE_LOGO:
      return core::AssetType::Logo;
    case ASSET_TYPE_ITEM:
      return core::AssetType::Item;
    default:
      throw util::ValidationError("asset type must be logo or item");
  }
}

} // namespace

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetShopResponse CatalogService::GetShop(const util::Context& ctx, const GetShopRequest& req) {
  return ObserveRpc("CatalogService.GetShop", req.id(), [&] {
    GetShopResponse resp;
    *resp.mutable_shop() = ctx_.manager->GetShop(ctx, req.id());
    return resp;
  });
}

ListShopsResponse CatalogService::ListShops(const util::Context& ctx, const ListShopsRequest& req) {
  return ObserveRpc("CatalogService.ListShops", "", [&] {
    core::ListShopsOptions options;
    options.owner     = req.owner();
    options.limit     = req.limit();
    options.offset    = req.offset();
    options.sort_by   = req.sort_by();
    options.sort_desc = req.sort_desc();

    ListShopsResponse resp;
    for (auto& shop : ctx_.manager->ListShops(ctx, options)) {
      *resp.add_shops() = std::move(shop);
    }
    return resp;
  });
}

CreateShopResponse CatalogService::CreateShop(const util::Context& ctx, const CreateShopRequest& req) {
  return ObserveRpc("CatalogService.CreateShop", req.shop().id(), [&] {
    CreateShopResponse resp;
    *resp.mutable_shop() = ctx_.manager->CreateShop(ctx, req.shop());
    return resp;
  });
}

UpdateShopResponse CatalogService::UpdateShop(const util::Context& ctx, const UpdateShopRequest& req) {
  return ObserveRpc("CatalogService.UpdateShop", req.shop().id(), [&] {
    UpdateShopResponse resp;
    *resp.mutable_shop() = ctx_.manager->UpdateShop(ctx, req.shop());
    return resp;
  });
}

void CatalogService::DeleteShop(const util::Context& ctx, const DeleteShopRequest& req) {
  ObserveRpc("CatalogService.DeleteShop", req.id(), [&] { ctx_.manager->DeleteShop(ctx, req.id()); });
}

ShopAssetResponse CatalogService::AddShopAsset(const util::Context& ctx, const ShopAssetRequest& req) {
  return ObserveRpc("CatalogService.AddShopAsset", req.shop_id(), [&] {
    ShopAssetResponse resp;
    *resp.mutable_shop() = ctx_.manager->AddShopAsset(ctx, req.shop_id(), ToAssetType(req.type()), req.cid());
    return resp;
  });
}

ShopAssetResponse CatalogService::RemoveShopAsset(const util::Context& ctx, const ShopAssetRequest& req) {
  return ObserveRpc("CatalogService.RemoveShopAsset", req.shop_id(), [&] {
    ShopAssetResponse resp;
    *resp.mutable_shop() = ctx_.manager->RemoveShopAsset(ctx, req.shop_id(), ToAssetType(req.type()), req.cid());
    return resp;
  });
}

ExportShopResponse CatalogService::ExportShop(const util::Context& ctx, const ExportShopRequest& req) {
  return ObserveRpc("CatalogService.ExportShop", req.id(), [&] {
    ExportShopResponse resp;
    resp.set_data(ctx_.manager->ExportShop(ctx, req.id()));
    return resp;
  });
}

ImportShopResponse CatalogService::ImportShop(const util::Context& ctx, const ImportShopRequest& req) {
  return ObserveRpc("CatalogService.ImportShop", "", [&] {
    ImportShopResponse resp;
    *resp.mutable_shop() = ctx_.manager->ImportShop(ctx, req.data());
    return resp;
  });
}

} // namespace shopstore::service
