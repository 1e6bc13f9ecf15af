#include "record_cache.hpp"

#include <mutex>

namespace refstore::store {

void RecordCache::Put(const std::string& name, const model::ReferenceRecord& record) {
  std::unique_lock lock(mutex_);
  cache_[name] = record;
}

std::optional<model::ReferenceRecord> RecordCache::Get(const std::string& name) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(name);
  if (it == cache_.end()) return std::nullopt;

  return it->second;
}

void RecordCache::Remove(const std::string& name) {
  std::unique_lock lock(mutex_);
  cache_.erase(name);
}

std::size_t RecordCache::Size() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace refstore::store
