#include "reference_store.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <system_error>

#include "internal/format/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace refstore::store {

using namespace refstore::util;
using refstore::naming::RecordFormat;
using refstore::naming::ReferenceLocation;

namespace {

std::string_view StripLeadingSeparators(std::string_view text) {
  while (!text.empty() && text.front() == '/') text.remove_prefix(1);
  return text;
}

} // namespace

ReferenceStore::ReferenceStore(std::filesystem::path root) : ReferenceStore(std::move(root), Options{}) {
}

ReferenceStore::ReferenceStore(std::filesystem::path root, Options options)
    : resolver_(std::move(root)), files_(options.fsync), options_(options) {
  std::error_code ec;
  std::filesystem::create_directories(resolver_.root(), ec);
  if (ec) {
    throw StorageIOError(resolver_.root().string(), "open", "create storage root: " + ec.message());
  }
  if (!std::filesystem::is_directory(resolver_.root(), ec)) {
    throw StorageIOError(resolver_.root().string(), "open", "storage root is not a directory");
  }
}

std::pair<std::string, ReferenceLocation> ReferenceStore::ResolveFor(std::string_view name, const char* operation) const {
  try {
    auto canonical = naming::PathResolver::Canonicalize(name);
    auto location  = resolver_.Resolve(canonical);
    return {std::move(canonical), std::move(location)};
  } catch (const InvalidReferenceName& e) {
    throw InvalidReferenceName(std::string(name), operation, e.detail());
  }
}

model::ReferenceRecord ReferenceStore::DecodeFile(const std::string& name, const std::filesystem::path& file, std::string_view bytes,
                                                  RecordFormat format, const char* operation) const {
  const auto fallback = files_.ModifiedAt(file).value_or(Now());
  try {
    return format == RecordFormat::kCurrent ? format::DecodeRecord(bytes, fallback) : format::DecodeLegacyRecord(bytes, fallback);
  } catch (const format::RecordDecodeError& e) {
    throw FormatError(name, operation, file.filename().string() + ": " + e.what());
  }
}

std::optional<model::ReferenceRecord> ReferenceStore::Load(const std::string& name, const ReferenceLocation& location, const char* operation) {
  if (options_.cache_enabled) {
    if (auto cached = cache_.Get(name)) {
      return cached;
    }
  }

  std::optional<model::ReferenceRecord> record;
  for (const auto format : {RecordFormat::kCurrent, RecordFormat::kLegacy}) {
    const auto                 file = location.File(format);
    std::optional<std::string> bytes;
    try {
      bytes = files_.Read(file);
    } catch (const std::runtime_error& e) {
      throw StorageIOError(name, operation, e.what());
    }
    if (bytes) {
      record = DecodeFile(name, file, *bytes, format, operation);
      break;
    }
  }

  if (record && options_.cache_enabled) {
    cache_.Put(name, *record);
  }
  return record;
}

model::WriteResult ReferenceStore::WriteLocked(const std::string& name, const ReferenceLocation& location, std::string_view content,
                                               std::optional<model::Metadata> metadata,
                                               const std::optional<model::ReferenceRecord>& existing, const char* operation) {
  // Records persist microseconds; keep the cached copy at the same precision.
  const auto now = std::chrono::time_point_cast<Clock::duration>(std::chrono::time_point_cast<std::chrono::microseconds>(Now()));

  model::ReferenceRecord record;
  record.content    = std::string(content);
  record.metadata   = metadata ? std::move(*metadata) : (existing ? existing->metadata : model::Metadata{});
  record.created_at = existing ? existing->created_at : now;
  record.updated_at = now;
  record.version    = existing ? existing->version + 1 : 1;

  std::string bytes;
  try {
    bytes = format::EncodeRecord(record);
  } catch (const std::runtime_error& e) {
    throw FormatError(name, operation, std::string("encode: ") + e.what());
  }

  try {
    std::shared_lock tree_lock(tree_mutex_);
    files_.Write(location.CurrentFile(), bytes);
  } catch (const std::runtime_error& e) {
    cache_.Remove(name);
    throw StorageIOError(name, operation, e.what());
  }

  // The current file now shadows any legacy one; removing it is housekeeping.
  try {
    if (files_.Remove(location.LegacyFile())) {
      REFSTORE_LOG_INFO("legacy record upgraded", {observability::StringField("name", name)});
    }
  } catch (const std::runtime_error& e) {
    REFSTORE_LOG_WARN("legacy record left behind", {observability::StringField("name", name), observability::StringField("error", e.what())});
  }

  if (options_.cache_enabled) {
    cache_.Put(name, record);
  }

  REFSTORE_LOG_INFO("reference written", {observability::StringField("name", name), observability::IntField("version", static_cast<std::int64_t>(record.version)),
                                          observability::StringField("operation", operation)});
  return model::WriteResult{name, record.version};
}

bool ReferenceStore::RemoveLocked(const std::string& name, const ReferenceLocation& location, const char* operation) {
  bool removed = false;
  try {
    removed |= files_.Remove(location.LegacyFile());
    removed |= files_.Remove(location.CurrentFile());
  } catch (const std::runtime_error& e) {
    cache_.Remove(name);
    throw StorageIOError(name, operation, e.what());
  }
  cache_.Remove(name);

  if (removed) {
    std::unique_lock tree_lock(tree_mutex_);
    storage::common::PruneEmptyParents(location.base().parent_path(), resolver_.root());
  }
  return removed;
}

model::WriteResult ReferenceStore::CreateOrUpdate(std::string_view name, std::string_view content, std::optional<model::Metadata> metadata) {
  constexpr const char* kOperation = "create_or_update";
  auto [canonical, location]       = ResolveFor(name, kOperation);

  auto       guard    = locks_.Lock(canonical, NameLockTable::Mode::kExclusive);
  const auto existing = Load(canonical, location, kOperation);
  return WriteLocked(canonical, location, content, std::move(metadata), existing, kOperation);
}

model::WriteResult ReferenceStore::Update(std::string_view name, std::string_view content) {
  constexpr const char* kOperation = "update";
  auto [canonical, location]       = ResolveFor(name, kOperation);

  auto       guard    = locks_.Lock(canonical, NameLockTable::Mode::kExclusive);
  const auto existing = Load(canonical, location, kOperation);
  if (!existing) {
    throw ReferenceNotFound(canonical, kOperation);
  }
  return WriteLocked(canonical, location, content, std::nullopt, existing, kOperation);
}

model::Reference ReferenceStore::Read(std::string_view name) {
  constexpr const char* kOperation = "read";
  auto [canonical, location]       = ResolveFor(name, kOperation);

  auto guard  = locks_.Lock(canonical, NameLockTable::Mode::kShared);
  auto record = Load(canonical, location, kOperation);
  if (!record) {
    throw ReferenceNotFound(canonical, kOperation);
  }
  return model::Reference{canonical, std::move(*record)};
}

bool ReferenceStore::Exists(std::string_view name) {
  constexpr const char* kOperation = "exists";
  auto [canonical, location]       = ResolveFor(name, kOperation);

  auto guard = locks_.Lock(canonical, NameLockTable::Mode::kShared);
  if (options_.cache_enabled && cache_.Get(canonical)) {
    return true;
  }
  try {
    return files_.Exists(location.CurrentFile()) || files_.Exists(location.LegacyFile());
  } catch (const std::runtime_error& e) {
    throw StorageIOError(canonical, kOperation, e.what());
  }
}

std::string ReferenceStore::Delete(std::string_view name) {
  constexpr const char* kOperation = "delete";
  auto [canonical, location]       = ResolveFor(name, kOperation);

  auto guard = locks_.Lock(canonical, NameLockTable::Mode::kExclusive);
  if (!RemoveLocked(canonical, location, kOperation)) {
    throw ReferenceNotFound(canonical, kOperation);
  }
  REFSTORE_LOG_INFO("reference deleted", {observability::StringField("name", canonical)});
  return canonical;
}

void ReferenceStore::CollectNames(const std::filesystem::path& dir, std::string_view prefix, std::vector<std::string>* out) const {
  std::error_code                     ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    // Directories pruned by a concurrent delete simply vanish from the listing.
    if (storage::common::IsMissing(ec)) {
      return;
    }
    throw StorageIOError(std::string(prefix), "list", dir.string() + ": " + ec.message());
  }

  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      break;
    }
    const auto&     entry = *it;
    std::error_code status_ec;
    const auto      status = entry.symlink_status(status_ec);
    if (status_ec) {
      continue;
    }

    if (std::filesystem::is_directory(status)) {
      CollectNames(entry.path(), prefix, out);
      continue;
    }
    if (!std::filesystem::is_regular_file(status)) {
      continue;
    }

    const auto found = resolver_.LocationForFile(entry.path());
    if (!found) {
      continue;
    }
    try {
      auto name = resolver_.Unresolve(found->first);
      if (name.starts_with(prefix)) {
        out->push_back(std::move(name));
      }
    } catch (const InvalidReferenceName& e) {
      REFSTORE_LOG_DEBUG("skipping foreign file", {observability::StringField("path", entry.path().string()),
                                                   observability::StringField("reason", e.detail())});
    }
  }

  if (ec && !storage::common::IsMissing(ec)) {
    throw StorageIOError(std::string(prefix), "list", dir.string() + ": " + ec.message());
  }
}

std::vector<std::string> ReferenceStore::List(const std::optional<std::string>& prefix) {
  const auto needle = StripLeadingSeparators(prefix ? std::string_view(*prefix) : std::string_view{});

  // Start the walk at the deepest directory the prefix pins down.
  auto       start = resolver_.root();
  const auto slash = needle.rfind('/');
  if (slash != std::string_view::npos) {
    const auto directory = needle.substr(0, slash);
    if (naming::PathResolver::IsValid(directory)) {
      start = resolver_.Resolve(directory).base();
    }
  }

  std::vector<std::string> names;
  CollectNames(start, needle, &names);

  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return names;
}

std::size_t ReferenceStore::Cleanup(std::string_view prefix, std::chrono::seconds max_age) {
  constexpr const char* kOperation = "cleanup";
  if (max_age.count() < 0) {
    throw std::invalid_argument("cleanup max_age must not be negative");
  }

  const auto names = List(std::string(prefix));

  // Worked in whole seconds: max_age may exceed what Clock::duration can hold.
  const auto now      = Now();
  const auto now_secs = std::chrono::floor<std::chrono::seconds>(now.time_since_epoch());
  const auto min_secs = std::chrono::ceil<std::chrono::seconds>(Clock::duration::min());
  if (max_age >= now_secs - min_secs) {
    // Nothing can predate the clock's range.
    return 0;
  }
  const auto cutoff = TimePoint(std::chrono::duration_cast<Clock::duration>(now_secs - max_age)) + (now.time_since_epoch() - now_secs);

  std::size_t removed = 0;
  for (const auto& name : names) {
    try {
      auto [canonical, location] = ResolveFor(name, kOperation);
      auto       guard           = locks_.Lock(canonical, NameLockTable::Mode::kExclusive);
      const auto record          = Load(canonical, location, kOperation);
      if (!record || record->updated_at >= cutoff) {
        continue;
      }
      if (RemoveLocked(canonical, location, kOperation)) {
        ++removed;
      }
    } catch (const ReferenceError& e) {
      REFSTORE_LOG_WARN("cleanup skipped reference", {observability::StringField("name", name), observability::StringField("error", e.what())});
    }
  }

  observability::Metrics::Instance().RecordCleanupRemoved(prefix, removed);
  REFSTORE_LOG_INFO("cleanup finished", {observability::StringField("prefix", prefix), observability::IntField("scanned", static_cast<std::int64_t>(names.size())),
                                         observability::IntField("removed", static_cast<std::int64_t>(removed))});
  return removed;
}

} // namespace refstore::store
