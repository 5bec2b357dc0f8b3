#pragma once

#include <string>

#include "config/config.pb.h"

namespace docstore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names and
  enum value names in the YAML are the ones declared in config.proto.
  Unknown fields are rejected. The result is validated before it is
  returned.
*/
class ConfigLoader {
 public:
  static docstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static docstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws std::invalid_argument on inconsistent settings.
  static void Validate(const docstore::runtime::config::RuntimeConfig& config);
};

} // namespace docstore::config
