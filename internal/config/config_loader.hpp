#pragma once

#include <string>

#include "config/config.pb.h"

namespace woki::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. The inventory section
  is checked before the config is returned.
*/
class ConfigLoader {
 public:
  static woki::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error describing the first problem found.
  static void Validate(const woki::runtime::config::RuntimeConfig& config);
};

} // namespace woki::config
