#pragma once

#include <memory>

#include "config/config.pb.h"

namespace refstore::store {
class ReferenceStore;
}
namespace refstore::service {
class ReferenceService;
class ReferenceComposer;
} // namespace refstore::service
namespace refstore::maintenance {
class CleanupSweeper;
}

namespace refstore::factory {

/*
  Application

  Owns every long-lived component of one process. There is exactly one store
  per process; consumers receive it from here instead of a global.
*/
struct Application {
  std::shared_ptr<store::ReferenceStore>       store;
  std::shared_ptr<service::ReferenceComposer>  composer;
  std::shared_ptr<service::ReferenceService>   service;
  std::shared_ptr<maintenance::CleanupSweeper> sweeper; // null when cleanup is disabled
};

/*
  Build

  Composition root. The sweeper is constructed but not started.
*/
Application Build(const refstore::runtime::config::RuntimeConfig& config);

} // namespace refstore::factory
