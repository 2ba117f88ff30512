#pragma once

#include <string>

#include "config/config.pb.h"

namespace artscan::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static artscan::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const artscan::runtime::config::RuntimeConfig& config);
};

} // namespace artscan::config
