#pragma once

#include <string>

#include "config/config.pb.h"

namespace shopstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled in by ApplyDefaults so the rest of the process never has to
  special-case zero values.
*/
class ConfigLoader {
 public:
  static shopstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(shopstore::runtime::config::RuntimeConfig* config);
};

} // namespace shopstore::config
