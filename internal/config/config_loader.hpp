#pragma once

#include <string>

#include "config/config.pb.h"

namespace fnpipe::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields are rejected.
*/
class ConfigLoader {
 public:
  static fnpipe::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fnpipe::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace fnpipe::config
