#pragma once

#include <string>

#include "config/config.pb.h"

namespace ledger::config {

/*
  Loads RuntimeConfig from YAML.

  The YAML tree is mapped onto protobuf's JSON form and parsed into the
  message, so key names are the proto field names. Unknown keys, a bad
  logging level or sink throw std::runtime_error naming the file and key
  path. Missing fields are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static ledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ledger::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace ledger::config
