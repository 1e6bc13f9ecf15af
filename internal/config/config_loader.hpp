#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace refstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected. Fields left unset fall back to Defaults(), and REFSTORE_DATA_DIR
  overrides storage.data_dir in both paths.
*/
class ConfigLoader {
 public:
  static refstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static refstore::runtime::config::RuntimeConfig Defaults();

  // data_dir / refs_subdir
  static std::filesystem::path StorageRoot(const refstore::runtime::config::RuntimeConfig& config);
};

} // namespace refstore::config
