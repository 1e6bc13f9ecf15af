#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/model/reference.hpp"

namespace refstore::store {

/*
  Parsed-record cache keyed by canonical reference name.

  The cache does no locking of its own beyond its map: ReferenceStore only
  touches an entry while it holds that name's lock, exclusive for Put/Remove
  after a write and shared for Put after a miss, so the cache never disagrees
  with the record on disk.
*/
class RecordCache {
 public:
  void Put(const std::string& name, const model::ReferenceRecord& record);

  std::optional<model::ReferenceRecord> Get(const std::string& name) const;

  void Remove(const std::string& name);

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                               mutex_;
  std::unordered_map<std::string, model::ReferenceRecord> cache_;
};

} // namespace refstore::store
