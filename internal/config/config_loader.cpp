#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace refstore::config {

using refstore::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultDataDir        = "./data";
constexpr const char* kDefaultRefsSubdir     = "refs";
constexpr const char* kDefaultLogLevel       = "info";
constexpr const char* kDefaultCleanupPrefix  = "pipeline/";
constexpr uint64_t    kDefaultCleanupMaxAge  = 7 * 24 * 60 * 60;
constexpr uint64_t    kDefaultCleanupEvery   = 60 * 60;
constexpr uint32_t    kDefaultExportInterval = 1000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings.
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void ApplyDefaults(RuntimeConfig* config) {
  auto* storage = config->mutable_storage();
  if (storage->data_dir().empty()) {
    storage->set_data_dir(kDefaultDataDir);
  }
  if (storage->refs_subdir().empty()) {
    storage->set_refs_subdir(kDefaultRefsSubdir);
  }
  if (!storage->has_fsync()) {
    storage->set_fsync(true);
  }

  if (config->logging().level().empty()) {
    config->mutable_logging()->set_level(kDefaultLogLevel);
  }

  // A config without a cleanup section keeps the stock pipeline sweep.
  if (!config->has_cleanup()) {
    auto* cleanup = config->mutable_cleanup();
    cleanup->set_enabled(true);
    auto* rule = cleanup->add_rules();
    rule->set_prefix(kDefaultCleanupPrefix);
    rule->set_max_age_seconds(kDefaultCleanupMaxAge);
  }
  if (config->cleanup().interval_seconds() == 0) {
    config->mutable_cleanup()->set_interval_seconds(kDefaultCleanupEvery);
  }

  auto* observability = config->mutable_observability();
  if (observability->service_name().empty()) {
    observability->set_service_name("refstore");
  }
  if (observability->export_interval_ms() == 0) {
    observability->set_export_interval_ms(kDefaultExportInterval);
  }

  if (const char* data_dir = std::getenv("REFSTORE_DATA_DIR"); data_dir && *data_dir) {
    storage->set_data_dir(data_dir);
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // An empty file is a valid, all-default config.
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
    }

    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

std::filesystem::path ConfigLoader::StorageRoot(const RuntimeConfig& config) {
  const auto& storage = config.storage();
  return std::filesystem::path(storage.data_dir().empty() ? kDefaultDataDir : storage.data_dir()) /
         (storage.refs_subdir().empty() ? kDefaultRefsSubdir : storage.refs_subdir());
}

} // namespace refstore::config
