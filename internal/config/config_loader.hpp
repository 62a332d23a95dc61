#pragma once

#include <string>

#include "config/config.pb.h"

namespace plancast::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON, then parsed into protobuf with unknown
  fields rejected. Defaults for unset fields are applied later by the
  option builders in runtime_options.hpp.
*/
class ConfigLoader {
 public:
  static plancast::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static plancast::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace plancast::config
