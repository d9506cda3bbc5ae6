#pragma once

#include <string>

#include "config/config.pb.h"

namespace projmem::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static projmem::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory document.
  static projmem::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace projmem::config
