#include "internal/model/shop_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace shopstore::model {

namespace {

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonPrintOptions;

std::string Print(const google::protobuf::Message& message, bool pretty, const char* what) {
  JsonPrintOptions options;
  options.add_whitespace = pretty;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::StorageError(std::string("encode ") + what + ": " + std::string(status.message()));
  }
  return json;
}

// Returns the parser's message on failure, empty on success.
std::string Parse(const std::string& json, google::protobuf::Message* message) {
  JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (status.ok()) return {};
  std::string error(status.message());
  return error.empty() ? "malformed json" : error;
}

} // namespace

db::model::DocumentRecord ToDocument(const ShopRecord& shop) {
  db::model::DocumentRecord doc;
  doc.key  = shop.id();
  doc.type = std::string(kShopDocumentType);
  doc.body = Print(shop, false, "shop document");
  return doc;
}

ShopRecord FromDocument(const db::model::DocumentRecord& doc) {
  ShopRecord shop;
  if (auto error = Parse(doc.body, &shop); !error.empty()) {
    throw util::StorageError("decode shop document " + doc.key + ": " + error);
  }
  if (shop.id().empty()) shop.set_id(doc.key);
  return shop;
}

std::string MetadataToJson(const ShopMetadata& meta) {
  return Print(meta, true, "shop metadata");
}

ShopMetadata MetadataFromJson(const std::string& json) {
  ShopMetadata meta;
  if (auto error = Parse(json, &meta); !error.empty()) {
    throw util::StorageError("decode shop metadata: " + error);
  }
  return meta;
}

std::string ExportToJson(const ShopExport& bundle) {
  return Print(bundle, true, "shop export");
}

ShopExport ExportFromJson(const std::string& json) {
  ShopExport bundle;
  if (auto error = Parse(json, &bundle); !error.empty()) {
    throw util::ValidationError("invalid export data: " + error);
  }
  if (!bundle.has_shop_data()) {
    throw util::ValidationError("invalid export data: shopData is missing");
  }
  return bundle;
}

} // namespace shopstore::model
