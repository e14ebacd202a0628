#pragma once

#include <string>
#include <string_view>

#include "shopstore/core/v1/shop.pb.h"

namespace shopstore::model {

using shopstore::core::v1::Item;
using shopstore::core::v1::ShopExport;
using shopstore::core::v1::ShopMetadata;
using shopstore::core::v1::ShopRecord;

// Document type of the root record in every shop store.
inline constexpr std::string_view kShopDocumentType = "shop";

/*
  URL-safe slug: lower case, spaces to '-', drop anything outside
  [a-z0-9-], collapse runs of '-', trim '-' at both ends.
*/
std::string MakeUrlName(std::string_view name);

// Fills id (from owner) and url_name (from name) when they are empty.
void ApplyDefaults(ShopRecord* shop);

// Throws util::ValidationError.
void ValidateItem(const Item& item);
void ValidateShop(const ShopRecord& shop);

ShopMetadata MetadataOf(const ShopRecord& shop);

} // namespace shopstore::model
