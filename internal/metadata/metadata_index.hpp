#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/model/shop.hpp"

namespace shopstore::metadata {

/*
  File-backed index: one <id>-metadata.json per shop.

  The index is the single source of truth for where a shop's store lives
  and whether the shop exists at all. It never touches a document store.

  Errors:
    bad id          -> util::ValidationError
    file I/O, JSON  -> util::StorageError
*/
class MetadataIndex {
 public:
  explicit MetadataIndex(std::filesystem::path directory);

  void EnsureDirectory();

  // Overwrites; written to a temp file and renamed into place.
  void Save(const model::ShopMetadata& meta);

  std::optional<model::ShopMetadata> Get(const std::string& id) const;

  // Missing entry is not an error.
  void Delete(const std::string& id);

  // Sorted by file name.
  std::vector<std::string> ListIds() const;

  std::size_t Count() const;

  const std::filesystem::path& Directory() const {
    return directory_;
  }

 private:
  std::filesystem::path     directory_;
  mutable std::shared_mutex mutex_;
};

} // namespace shopstore::metadata
