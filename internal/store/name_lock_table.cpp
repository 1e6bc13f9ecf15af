#include "name_lock_table.hpp"

namespace refstore::store {

NameLockTable::Guard::Guard(NameLockTable& table, std::string name, Mode mode)
    : table_(table), name_(std::move(name)), mode_(mode), mutex_(table_.Acquire(name_)) {
  if (mode_ == Mode::kExclusive) {
    mutex_->lock();
  } else {
    mutex_->lock_shared();
  }
}

NameLockTable::Guard::~Guard() {
  // Unlock before releasing the entry: once it leaves the table a new caller
  // gets a fresh mutex, which must not race with this holder.
  if (mode_ == Mode::kExclusive) {
    mutex_->unlock();
  } else {
    mutex_->unlock_shared();
  }
  table_.Release(name_);
}

std::shared_ptr<std::shared_mutex> NameLockTable::Acquire(const std::string& name) {
  std::lock_guard<std::mutex> lock(guard_);
  auto&                       entry = entries_[name];
  if (!entry.mutex) {
    entry.mutex = std::make_shared<std::shared_mutex>();
  }
  ++entry.users;
  return entry.mutex;
}

void NameLockTable::Release(const std::string& name) {
  std::lock_guard<std::mutex> lock(guard_);
  auto                        it = entries_.find(name);
  if (it == entries_.end()) {
    return;
  }
  if (--it->second.users == 0) {
    entries_.erase(it);
  }
}

std::size_t NameLockTable::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return entries_.size();
}

} // namespace refstore::store
