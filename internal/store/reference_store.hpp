#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/reference.hpp"
#include "internal/naming/path_resolver.hpp"
#include "internal/storage/disk/record_file_store.hpp"
#include "internal/store/name_lock_table.hpp"
#include "internal/store/record_cache.hpp"

namespace refstore::store {

/*
  Versioned reference store.

  The only component that reads or writes record files below its root.
  Every failure is thrown as a util::ReferenceError subclass carrying the
  canonical name (or the raw input when it could not be canonicalized) and
  the operation name.

  Locking:
    - mutations hold the per-name lock exclusively for the whole
      read-check-write, so versions for one name are gapless and unique
    - reads hold it shared so the current/legacy fallback sees a stable pair
    - tree_mutex_ is held shared around "mkdir + write + rename" and
      exclusively while pruning empty directories after a removal
  Lock order is always name lock, then tree_mutex_.
*/
class ReferenceStore {
 public:
  struct Options {
    bool fsync         = true;
    bool cache_enabled = false;
  };

  // Creates the root if needed. Throws util::StorageIOError.
  explicit ReferenceStore(std::filesystem::path root);
  ReferenceStore(std::filesystem::path root, Options options);

  // Upsert. With metadata == nullopt an existing record keeps its metadata.
  model::WriteResult CreateOrUpdate(std::string_view name, std::string_view content, std::optional<model::Metadata> metadata = std::nullopt);

  // Like CreateOrUpdate, but the record must already exist.
  model::WriteResult Update(std::string_view name, std::string_view content);

  model::Reference Read(std::string_view name);

  bool Exists(std::string_view name);

  // Returns the canonical name that was removed.
  std::string Delete(std::string_view name);

  // Sorted, each name once. A prefix matches by plain string comparison
  // against canonical names.
  std::vector<std::string> List(const std::optional<std::string>& prefix = std::nullopt);

  // Removes records under `prefix` whose updated_at is older than now - max_age.
  // Returns how many were removed. Throws std::invalid_argument on a negative age.
  std::size_t Cleanup(std::string_view prefix, std::chrono::seconds max_age);

  const std::filesystem::path& root() const {
    return resolver_.root();
  }

 private:
  std::pair<std::string, naming::ReferenceLocation> ResolveFor(std::string_view name, const char* operation) const;

  // Cache, then current file, then legacy file. Caller holds the name lock.
  std::optional<model::ReferenceRecord> Load(const std::string& name, const naming::ReferenceLocation& location, const char* operation);

  model::ReferenceRecord DecodeFile(const std::string& name, const std::filesystem::path& file, std::string_view bytes,
                                    naming::RecordFormat format, const char* operation) const;

  // Caller holds the name lock exclusively.
  model::WriteResult WriteLocked(const std::string& name, const naming::ReferenceLocation& location, std::string_view content,
                                 std::optional<model::Metadata> metadata, const std::optional<model::ReferenceRecord>& existing,
                                 const char* operation);

  // Caller holds the name lock exclusively. Returns false when neither file existed.
  bool RemoveLocked(const std::string& name, const naming::ReferenceLocation& location, const char* operation);

  void CollectNames(const std::filesystem::path& dir, std::string_view prefix, std::vector<std::string>* out) const;

  naming::PathResolver     resolver_;
  storage::RecordFileStore files_;
  Options                  options_;

  NameLockTable             locks_;
  RecordCache               cache_;
  mutable std::shared_mutex tree_mutex_;
};

} // namespace refstore::store
