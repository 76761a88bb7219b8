#pragma once

#include <string>

#include "config/config.pb.h"

namespace bounty::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, printed as JSON and parsed into
  the proto with unknown fields rejected. Defaults are filled in and
  the result validated before it is returned.
*/
class ConfigLoader {
 public:
  static bounty::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static bounty::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

// Zero-valued fields that have a non-zero default.
void ApplyDefaults(bounty::runtime::config::RuntimeConfig& config);

// Throws std::invalid_argument naming the offending key.
void Validate(const bounty::runtime::config::RuntimeConfig& config);

} // namespace bounty::config
