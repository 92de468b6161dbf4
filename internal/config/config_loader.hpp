#pragma once

#include <string>

#include "config/config.pb.h"

namespace strata::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names
  and enum values follow config/config.proto; unknown fields are
  rejected. STRATA_DATABASE_URI, when set, replaces
  database.postgres.connection_uri.
*/
class ConfigLoader {
 public:
  static strata::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static strata::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace strata::config
