#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using refstore::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "refstore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::filesystem::path& path) {
  try {
    (void)ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestDefaultsWithoutFile() {
  const auto config = ConfigLoader::Defaults();

  assert(config.storage().data_dir() == "./data");
  assert(config.storage().refs_subdir() == "refs");
  assert(config.storage().fsync());
  assert(!config.storage().cache_enabled());
  assert(config.logging().level() == "info");
  assert(config.cleanup().enabled());
  assert(config.cleanup().interval_seconds() == 3600);
  assert(config.cleanup().rules_size() == 1);
  assert(config.cleanup().rules(0).prefix() == "pipeline/");
  assert(config.cleanup().rules(0).max_age_seconds() == 7 * 24 * 3600);
  assert(ConfigLoader::StorageRoot(config) == std::filesystem::path("./data") / "refs");
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(storage:
  data_dir: "/srv/refstore"
  refs_subdir: references
  fsync: false
  cache_enabled: true
logging:
  level: debug
  pattern: "[%l] %v"
cleanup:
  enabled: true
  interval_seconds: 600
  rules:
    - prefix: "tmp/"
      max_age_seconds: 86400
    - prefix: ""
      max_age_seconds: 31536000
observability:
  tracing_enabled: false
  metrics_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().data_dir() == "/srv/refstore");
  assert(config.storage().refs_subdir() == "references");
  assert(!config.storage().fsync());
  assert(config.storage().cache_enabled());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.cleanup().interval_seconds() == 600);
  assert(config.cleanup().rules_size() == 2);
  assert(config.cleanup().rules(0).prefix() == "tmp/");
  assert(config.cleanup().rules(0).max_age_seconds() == 86400);
  assert(config.cleanup().rules(1).prefix().empty());
  assert(config.observability().transport() == refstore::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(ConfigLoader::StorageRoot(config) == std::filesystem::path("/srv/refstore/references"));
}

void TestPartialConfigKeepsDefaults() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(storage:
  data_dir: /tmp/refs-partial
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().data_dir() == "/tmp/refs-partial");
  assert(config.storage().refs_subdir() == "refs");
  assert(config.storage().fsync());
  assert(config.cleanup().rules_size() == 1);
  assert(config.cleanup().rules(0).prefix() == "pipeline/");
}

void TestExplicitCleanupSectionReplacesDefaultRule() {
  const auto yaml_path = WriteYaml("cleanup_disabled",
                                   R"(cleanup:
  enabled: false
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(!config.cleanup().enabled());
  assert(config.cleanup().rules_size() == 0);
}

void TestEmptyFileIsAllDefaults() {
  const auto config = ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());
  assert(config.storage().data_dir() == "./data");
  assert(config.cleanup().enabled());
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(storage:
  data_dir: "2024"
  refs_subdir: "0"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().data_dir() == "2024");
  assert(config.storage().refs_subdir() == "0");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(storage:
  data_dir: "line1\nline2☃"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.storage().data_dir() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(storage:
  data_dir: "/tmp/data"
unknown_field: 123
)");

  assert(Rejects(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestMalformedYamlIsRejected() {
  assert(Rejects(WriteYaml("malformed", "storage: [unclosed\n")));
  assert(Rejects(WriteYaml("not_a_map", "- a\n- b\n")));
  assert(Rejects(std::filesystem::temp_directory_path() / "refstore_config_loader_tests" / "does_not_exist.yaml"));
}

void TestDataDirEnvironmentOverride() {
  ::setenv("REFSTORE_DATA_DIR", "/env/data", 1);

  const auto defaults = ConfigLoader::Defaults();
  assert(defaults.storage().data_dir() == "/env/data");

  const auto loaded = ConfigLoader::LoadFromYaml(WriteYaml("env_override", "storage:\n  data_dir: /file/data\n").string());
  assert(loaded.storage().data_dir() == "/env/data");
  assert(ConfigLoader::StorageRoot(loaded) == std::filesystem::path("/env/data/refs"));

  ::unsetenv("REFSTORE_DATA_DIR");
}

} // namespace

int main() {
  ::unsetenv("REFSTORE_DATA_DIR");

  TestDefaultsWithoutFile();
  TestFullConfigIsParsed();
  TestPartialConfigKeepsDefaults();
  TestExplicitCleanupSectionReplacesDefaultRule();
  TestEmptyFileIsAllDefaults();
  TestQuotedNumbersStayStrings();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMalformedYamlIsRejected();
  TestDataDirEnvironmentOverride();

  std::cout << "refstore_unit_config_loader: pass\n";
  return 0;
}
