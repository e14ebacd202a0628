#include "internal/model/shop.hpp"

#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"

namespace shopstore::model {

std::string MakeUrlName(std::string_view name) {
  std::string out;
  out.reserve(name.size());

  for (char raw : name) {
    char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
    if (c == ' ') c = '-';

    const bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    if (!keep) continue;
    if (c == '-' && !out.empty() && out.back() == '-') continue;
    out.push_back(c);
  }

  const auto first = out.find_first_not_of('-');
  if (first == std::string::npos) return {};
  const auto last = out.find_last_not_of('-');
  return out.substr(first, last - first + 1);
}

void ApplyDefaults(ShopRecord* shop) {
  if (shop->id().empty()) shop->set_id(shop->owner());
  if (shop->url_name().empty()) shop->set_url_name(MakeUrlName(shop->name()));
}

void ValidateItem(const Item& item) {
  if (item.name().empty()) {
    throw util::ValidationError("item name is required");
  }
  if (item.price() < 0) {
    throw util::ValidationError("item price must not be negative: " + item.name());
  }
}

void ValidateShop(const ShopRecord& shop) {
  if (shop.id().empty()) {
    throw util::ValidationError("shop id is required");
  }
  util::ValidateShopId(shop.id());

  if (shop.owner().empty()) {
    throw util::ValidationError("shop owner is required");
  }
  if (shop.name().empty()) {
    throw util::ValidationError("shop name is required");
  }

  for (const auto& item : shop.content().items()) {
    ValidateItem(item);
  }
}

ShopMetadata MetadataOf(const ShopRecord& shop) {
  ShopMetadata meta;
  meta.set_id(shop.id());
  meta.set_name(shop.name());
  meta.set_owner(shop.owner());
  meta.set_storage_address(shop.storage_address());
  return meta;
}

} // namespace shopstore::model
