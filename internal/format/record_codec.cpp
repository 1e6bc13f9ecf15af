#include "record_codec.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include "refstore/v1/reference.pb.h"

namespace refstore::format {

namespace {

constexpr const char* kContentKey  = "content";
constexpr const char* kMetadataKey = "metadata";
constexpr const char* kCreatedKey  = "created";
constexpr const char* kUpdatedKey  = "updated";
constexpr const char* kVersionKey  = "version";
constexpr const char* kBinaryTag   = "tag:yaml.org,2002:binary";

util::TimePoint ParseTimeOr(const std::string& text, util::TimePoint fallback, const char* key) {
  if (text.empty()) {
    return fallback;
  }
  auto parsed = util::ParseTimestamp(text);
  if (!parsed) {
    throw RecordDecodeError(std::string("invalid '") + key + "' timestamp: " + text);
  }
  return *parsed;
}

uint64_t NormalizeVersion(int64_t version) {
  if (version < 0) {
    throw RecordDecodeError("negative version " + std::to_string(version));
  }
  return version == 0 ? 1 : static_cast<uint64_t>(version);
}

// ------------------------------------------------------------
// YAML helpers
// ------------------------------------------------------------

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF.
bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    std::size_t   length = 0;
    unsigned char lo     = 0x80;
    unsigned char hi     = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) lo = 0xA0;
      if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) lo = 0x90;
      if (lead == 0xF4) hi = 0x8F;
    } else {
      return false;
    }
    if (text.size() - i < length) {
      return false;
    }

    const auto second = static_cast<unsigned char>(text[i + 1]);
    if (second < lo || second > hi) {
      return false;
    }
    for (std::size_t k = 2; k < length; ++k) {
      const auto next = static_cast<unsigned char>(text[i + k]);
      if (next < 0x80 || next > 0xBF) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

// The emitter rewrites invalid UTF-8 as U+FFFD; such text goes out as !!binary instead.
void EmitText(YAML::Emitter& out, const std::string& text) {
  if (IsValidUtf8(text)) {
    out << YAML::DoubleQuoted << text;
    return;
  }
  out << YAML::Binary(reinterpret_cast<const unsigned char*>(text.data()), text.size());
}

std::string ScalarText(const YAML::Node& node) {
  if (node.Tag() != kBinaryTag) {
    return node.Scalar();
  }
  const auto binary = node.as<YAML::Binary>();
  return std::string(reinterpret_cast<const char*>(binary.data()), binary.size());
}

std::string YamlText(const YAML::Node& node) {
  if (!node || node.IsNull()) {
    return {};
  }
  if (node.IsScalar()) {
    return ScalarText(node);
  }

  YAML::Emitter out;
  out << YAML::Flow << node;
  return out.c_str();
}

std::string ScalarField(const YAML::Node& root, const char* key) {
  const auto node = root[key];
  if (!node || node.IsNull()) {
    return {};
  }
  if (!node.IsScalar()) {
    throw RecordDecodeError(std::string("field '") + key + "' must be a scalar");
  }
  return ScalarText(node);
}

model::Metadata YamlMetadata(const YAML::Node& root) {
  model::Metadata metadata;

  const auto node = root[kMetadataKey];
  if (!node || node.IsNull()) {
    return metadata;
  }
  if (!node.IsMap()) {
    throw RecordDecodeError("field 'metadata' must be a mapping");
  }

  for (const auto& entry : node) {
    metadata[YamlText(entry.first)] = YamlText(entry.second);
  }
  return metadata;
}

uint64_t YamlVersion(const YAML::Node& root) {
  const auto node = root[kVersionKey];
  if (!node || node.IsNull()) {
    return 1;
  }
  if (!node.IsScalar()) {
    throw RecordDecodeError("field 'version' must be a scalar");
  }

  int64_t version = 0;
  if (!YAML::convert<int64_t>::decode(node, version)) {
    throw RecordDecodeError("field 'version' is not an integer: " + node.Scalar());
  }
  return NormalizeVersion(version);
}

// ------------------------------------------------------------
// Legacy JSON helpers
// ------------------------------------------------------------

std::string JsonValueText(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return {};
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    default:
      break;
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw RecordDecodeError("unprintable metadata value: " + status.ToString());
  }
  return json;
}

} // namespace

// ------------------------------------------------------------
// Current format
// ------------------------------------------------------------

std::string EncodeRecord(const model::ReferenceRecord& record) {
  YAML::Emitter out;

  out << YAML::BeginMap;
  out << YAML::Key << kContentKey << YAML::Value;
  EmitText(out, record.content);

  out << YAML::Key << kMetadataKey << YAML::Value;
  if (record.metadata.empty()) {
    out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
  } else {
    out << YAML::BeginMap;
    for (const auto& [key, value] : record.metadata) {
      out << YAML::Key;
      EmitText(out, key);
      out << YAML::Value;
      EmitText(out, value);
    }
    out << YAML::EndMap;
  }

  out << YAML::Key << kCreatedKey << YAML::Value << util::FormatTimestamp(record.created_at);
  out << YAML::Key << kUpdatedKey << YAML::Value << util::FormatTimestamp(record.updated_at);
  out << YAML::Key << kVersionKey << YAML::Value << record.version;
  out << YAML::EndMap;

  if (!out.good()) {
    throw std::runtime_error("failed to encode record: " + out.GetLastError());
  }

  std::string encoded(out.c_str(), out.size());
  encoded.push_back('\n');
  return encoded;
}

model::ReferenceRecord DecodeRecord(std::string_view bytes, util::TimePoint fallback_time) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(bytes));
  } catch (const YAML::Exception& e) {
    throw RecordDecodeError(std::string("malformed YAML: ") + e.what());
  }

  if (!root.IsMap()) {
    throw RecordDecodeError("record is not a YAML mapping");
  }

  model::ReferenceRecord record;
  try {
    record.content    = ScalarField(root, kContentKey);
    record.metadata   = YamlMetadata(root);
    record.version    = YamlVersion(root);
    record.updated_at = ParseTimeOr(ScalarField(root, kUpdatedKey), fallback_time, kUpdatedKey);
    record.created_at = ParseTimeOr(ScalarField(root, kCreatedKey), record.updated_at, kCreatedKey);
  } catch (const YAML::Exception& e) {
    throw RecordDecodeError(std::string("malformed record: ") + e.what());
  }
  return record;
}

// ------------------------------------------------------------
// Legacy format
// ------------------------------------------------------------

model::ReferenceRecord DecodeLegacyRecord(std::string_view bytes, util::TimePoint fallback_time) {
  refstore::v1::LegacyRecord legacy;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(bytes), &legacy, options);
  if (!status.ok()) {
    throw RecordDecodeError("malformed legacy JSON: " + status.ToString());
  }

  model::ReferenceRecord record;
  record.content = legacy.content();
  for (const auto& [key, value] : legacy.metadata().fields()) {
    record.metadata[key] = JsonValueText(value);
  }
  record.version    = NormalizeVersion(legacy.version());
  record.updated_at = ParseTimeOr(legacy.updated(), fallback_time, kUpdatedKey);
  record.created_at = ParseTimeOr(legacy.created(), record.updated_at, kCreatedKey);
  return record;
}

} // namespace refstore::format
