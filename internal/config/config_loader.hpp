#pragma once

#include <yaml-cpp/yaml.h>

#include <string>

#include "config/config.pb.h"

namespace airtime::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static airtime::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static airtime::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Any YAML subtree as compact JSON; quoted scalars stay strings.
  static std::string YamlToJson(const YAML::Node& node);
};

} // namespace airtime::config
