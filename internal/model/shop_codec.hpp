#pragma once

#include <string>

#include "internal/db/model/document_record.hpp"
#include "internal/model/shop.hpp"

namespace shopstore::model {

/*
  The only place shop protos cross into JSON text.

  Store documents and metadata files are internal formats: decoding
  failures are util::StorageError. Export bundles come from callers:
  decoding failures are util::ValidationError.
*/

db::model::DocumentRecord ToDocument(const ShopRecord& shop);
ShopRecord                FromDocument(const db::model::DocumentRecord& doc);

std::string  MetadataToJson(const ShopMetadata& meta);
ShopMetadata MetadataFromJson(const std::string& json);

// Pretty printed: {"shopData": {...}, "metadata": {...}}
std::string ExportToJson(const ShopExport& bundle);
ShopExport  ExportFromJson(const std::string& json);

} // namespace shopstore::model
