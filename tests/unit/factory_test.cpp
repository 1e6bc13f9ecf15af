#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "internal/maintenance/cleanup_sweeper.hpp"
#include "internal/store/reference_store.hpp"

namespace {

using refstore::maintenance::CleanupSweeper;
using refstore::runtime::config::RuntimeConfig;

RuntimeConfig MakeConfig(const std::string& test_name) {
  const auto data_dir = std::filesystem::temp_directory_path() / "refstore_factory_tests" / test_name;
  std::filesystem::remove_all(data_dir);

  RuntimeConfig config;
  config.mutable_storage()->set_data_dir(data_dir.string());
  config.mutable_storage()->set_refs_subdir("refs");
  config.mutable_storage()->set_fsync(false);
  return config;
}

void AddRule(RuntimeConfig* config, const std::string& prefix, uint64_t max_age_seconds, uint64_t interval_seconds) {
  auto* cleanup = config->mutable_cleanup();
  cleanup->set_enabled(true);
  cleanup->set_interval_seconds(interval_seconds);
  auto* rule = cleanup->add_rules();
  rule->set_prefix(prefix);
  rule->set_max_age_seconds(max_age_seconds);
}

void TestBuildWiresStoreUnderRefsSubdir() {
  auto config = MakeConfig("wiring");
  auto app    = refstore::factory::Build(config);

  assert(app.store);
  assert(app.composer);
  assert(app.service);
  assert(!app.sweeper);
  assert(app.store->root() == std::filesystem::path(config.storage().data_dir()) / "refs");
}

void TestBuildCreatesSweeperFromRules() {
  auto config = MakeConfig("sweeper");
  AddRule(&config, "pipeline/", 7 * 24 * 60 * 60, 3600);

  auto app = refstore::factory::Build(config);
  assert(app.sweeper);
  assert(!app.sweeper->running());
  assert(app.sweeper->interval() == std::chrono::hours(1));
  assert(app.sweeper->rules().size() == 1);
  assert(app.sweeper->rules()[0].max_age == std::chrono::hours(24 * 7));
}

void TestHugeIntervalIsClamped() {
  auto config = MakeConfig("huge_interval");
  AddRule(&config, "pipeline/", 60, std::numeric_limits<uint64_t>::max());

  auto app = refstore::factory::Build(config);
  assert(app.sweeper->interval() == CleanupSweeper::kMaxInterval);

  auto config_ms_overflow = MakeConfig("huge_interval_ms");
  AddRule(&config_ms_overflow, "pipeline/", 60, uint64_t{1} << 62);
  auto app_ms_overflow = refstore::factory::Build(config_ms_overflow);
  assert(app_ms_overflow.sweeper->interval() == CleanupSweeper::kMaxInterval);
}

void TestMaxAgeBeyondSignedRangeIsRejected() {
  auto config = MakeConfig("huge_max_age");
  AddRule(&config, "pipeline/", std::numeric_limits<uint64_t>::max(), 3600);

  bool threw = false;
  try {
    refstore::factory::Build(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildWiresStoreUnderRefsSubdir();
  TestBuildCreatesSweeperFromRules();
  TestHugeIntervalIsClamped();
  TestMaxAgeBeyondSignedRangeIsRejected();

  std::cout << "refstore_unit_factory: pass\n";
  return 0;
}
