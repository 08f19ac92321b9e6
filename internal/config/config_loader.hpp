#pragma once

#include <string>

#include "config/config.pb.h"

namespace voucher::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static voucher::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Used when no config file is given: sqlite ledger in the working directory.
  static voucher::runtime::config::RuntimeConfig Defaults();
};

} // namespace voucher::config
