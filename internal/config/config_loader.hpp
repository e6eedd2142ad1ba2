#pragma once

#include <string>

#include "config/config.pb.h"

namespace profile::config {

/*
  Loads RuntimeConfig from a YAML file.

  The YAML tree is converted to a protobuf Value, written out as JSON and
  parsed into RuntimeConfig, so field names and Duration strings follow the
  proto3 JSON mapping. Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static profile::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static profile::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace profile::config
