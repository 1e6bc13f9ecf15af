#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/maintenance/cleanup_sweeper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/reference_composer.hpp"
#include "internal/service/reference_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/reference_store.hpp"

namespace refstore::factory {

using namespace refstore;

namespace {

std::vector<maintenance::CleanupRule> BuildCleanupRules(const refstore::runtime::config::CleanupConfig& cleanup) {
  std::vector<maintenance::CleanupRule> rules;
  rules.reserve(cleanup.rules_size());
  for (const auto& rule : cleanup.rules()) {
    if (rule.max_age_seconds() > static_cast<uint64_t>(std::numeric_limits<std::chrono::seconds::rep>::max())) {
      throw std::invalid_argument("cleanup rule for '" + rule.prefix() + "': max_age_seconds out of range");
    }
    rules.push_back({rule.prefix(), std::chrono::seconds(static_cast<std::chrono::seconds::rep>(rule.max_age_seconds()))});
  }
  return rules;
}

// Clamped in seconds; converting a huge value to milliseconds would wrap.
std::chrono::milliseconds CleanupInterval(uint64_t interval_seconds) {
  const auto max_seconds = std::chrono::duration_cast<std::chrono::seconds>(maintenance::CleanupSweeper::kMaxInterval).count();
  if (interval_seconds > static_cast<uint64_t>(max_seconds)) {
    return maintenance::CleanupSweeper::kMaxInterval;
  }
  return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(interval_seconds));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const refstore::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  const auto root = refstore::config::ConfigLoader::StorageRoot(config);

  store::ReferenceStore::Options options;
  options.fsync         = !config.storage().has_fsync() || config.storage().fsync();
  options.cache_enabled = config.storage().cache_enabled();

  app.store = std::make_shared<store::ReferenceStore>(root, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.composer = std::make_shared<service::ReferenceComposer>(app.store);

  service::ServiceContext ctx;
  ctx.store    = app.store;
  ctx.composer = app.composer;

  app.service = std::make_shared<service::ReferenceService>(ctx);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  const auto& cleanup = config.cleanup();
  if (cleanup.enabled() && cleanup.rules_size() > 0) {
    app.sweeper = std::make_shared<maintenance::CleanupSweeper>(app.store, BuildCleanupRules(cleanup),
                                                                CleanupInterval(cleanup.interval_seconds()));
  }

  REFSTORE_LOG_INFO("store opened", {observability::StringField("root", app.store->root().string()), observability::BoolField("fsync", options.fsync),
                                     observability::BoolField("cache", options.cache_enabled)});
  return app;
}

} // namespace refstore::factory
