#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace shopstore::util {

// Shop ids become file names; anything that could leave the directory is rejected.
inline void ValidateShopId(const std::string& shop_id) {
  if (shop_id.empty()) {
    throw ValidationError("shop id must not be empty");
  }
  for (char c : shop_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw ValidationError("shop id contains invalid character: " + shop_id);
    }
  }
  if (shop_id == "." || shop_id == "..") {
    throw ValidationError("shop id must not be a relative path component");
  }
}

inline constexpr const char* kMetadataSuffix = "-metadata.json";

inline std::filesystem::path MetadataPath(const std::filesystem::path& root, const std::string& shop_id) {
  ValidateShopId(shop_id);
  return root / (shop_id + kMetadataSuffix);
}

} // namespace shopstore::util
