#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace shopstore::config {

namespace {

constexpr const char* kDefaultBindAddress  = "0.0.0.0:50061";
constexpr const char* kDefaultDirectory    = "./shops";
constexpr uint32_t    kDefaultCapacity     = 100;
constexpr int64_t     kDefaultTtlSeconds   = 300;
constexpr uint32_t    kDefaultConcurrency  = 5;
constexpr uint32_t    kDefaultListLimit    = 100;
constexpr uint32_t    kDefaultBusyTimeout  = 5000;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

shopstore::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  shopstore::runtime::config::RuntimeConfig config;

  // an empty document is a valid "all defaults" config
  if (yaml.IsNull()) {
    ApplyDefaults(&config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(shopstore::runtime::config::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* store = config->mutable_store();
  if (store->directory().empty()) {
    store->set_directory(kDefaultDirectory);
  }
  if (store->backend_case() == shopstore::runtime::config::StoreConfig::BACKEND_NOT_SET) {
    store->mutable_sqlite();
  }
  if (store->has_sqlite()) {
    auto* sqlite = store->mutable_sqlite();
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(kDefaultBusyTimeout);
    if (!sqlite->has_wal_mode()) sqlite->set_wal_mode(true);
  }

  auto* cache = config->mutable_cache();
  if (cache->capacity() == 0) {
    cache->set_capacity(kDefaultCapacity);
  }
  if (!cache->has_ttl() || (cache->ttl().seconds() == 0 && cache->ttl().nanos() == 0)) {
    cache->mutable_ttl()->set_seconds(kDefaultTtlSeconds);
  }

  auto* listing = config->mutable_listing();
  if (listing->concurrency() == 0) {
    listing->set_concurrency(kDefaultConcurrency);
  }
  if (listing->default_limit() == 0) {
    listing->set_default_limit(kDefaultListLimit);
  }
}

} // namespace shopstore::config
