#pragma once

#include <memory>

namespace refstore::store {
class ReferenceStore;
}

namespace refstore::service {

class ReferenceComposer;

/*
  Dependencies shared by the contract surfaces.
*/
struct ServiceContext {
  std::shared_ptr<refstore::store::ReferenceStore> store;
  std::shared_ptr<ReferenceComposer>               composer;
};

} // namespace refstore::service
