#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace refstore::store {

/*
  Per-name reader/writer locks.

  Entries are created on first use and dropped once the last guard for the
  name is released, so the table only holds names with in-flight operations.
*/
class NameLockTable {
 public:
  enum class Mode {
    kShared,
    kExclusive,
  };

  class Guard {
   public:
    Guard(NameLockTable& table, std::string name, Mode mode);
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

   private:
    NameLockTable&                     table_;
    std::string                        name_;
    Mode                               mode_;
    std::shared_ptr<std::shared_mutex> mutex_;
  };

  Guard Lock(const std::string& name, Mode mode) {
    return Guard(*this, name, mode);
  }

  // Number of names with at least one live guard.
  std::size_t Size() const;

 private:
  struct Entry {
    std::shared_ptr<std::shared_mutex> mutex;
    std::size_t                        users = 0;
  };

  std::shared_ptr<std::shared_mutex> Acquire(const std::string& name);
  void                               Release(const std::string& name);

  mutable std::mutex                     guard_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace refstore::store
