#include "record_file_store.hpp"

#include <arrow/io/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/uuid.hpp"

namespace refstore::storage {

using namespace refstore::storage::common;

namespace {

std::runtime_error FileError(const std::string& what, const std::filesystem::path& path, const std::error_code& ec) {
  return std::runtime_error(what + " " + path.string() + ": " + ec.message());
}

std::filesystem::path TempPathFor(const std::filesystem::path& path) {
  return path.parent_path() / ("." + path.filename().string() + ".tmp-" + util::ToString(util::GenerateUUID()));
}

} // namespace

RecordFileStore::RecordFileStore(bool fsync) : fsync_(fsync) {
}

void RecordFileStore::SyncDirectory(const std::filesystem::path& dir) const {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    throw FileError("open directory", dir, std::error_code(errno, std::generic_category()));
  }
  const int rc  = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    throw FileError("fsync directory", dir, std::error_code(err, std::generic_category()));
  }
}

std::optional<std::string> RecordFileStore::Read(const std::filesystem::path& path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    if (ec && !IsMissing(ec)) {
      throw FileError("stat", path, ec);
    }
    return std::nullopt;
  }

  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer->ToString();
}

void RecordFileStore::Write(const std::filesystem::path& path, std::string_view bytes) const {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw FileError("create directory", path.parent_path(), ec);
  }

  const auto tmp_path = TempPathFor(path);
  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));
    Unwrap(out->Flush());

    if (fsync_ && ::fsync(out->file_descriptor()) != 0) {
      throw FileError("fsync", tmp_path, std::error_code(errno, std::generic_category()));
    }

    Unwrap(out->Close());

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
      throw FileError("rename", tmp_path, ec);
    }
  } catch (...) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    throw;
  }

  // The rename is the commit point; past it the new bytes are what readers see.
  if (fsync_) {
    try {
      SyncDirectory(path.parent_path());
    } catch (const std::runtime_error& e) {
      REFSTORE_LOG_WARN("directory sync failed after commit", {observability::StringField("path", path.string()), observability::StringField("error", e.what())});
    }
  }
}

bool RecordFileStore::Remove(const std::filesystem::path& path) const {
  std::error_code ec;
  const bool      removed = std::filesystem::remove(path, ec);
  if (ec && !IsMissing(ec)) {
    throw FileError("remove", path, ec);
  }
  return removed;
}

bool RecordFileStore::Exists(const std::filesystem::path& path) const {
  std::error_code ec;
  const bool      exists = std::filesystem::is_regular_file(path, ec);
  if (ec && !IsMissing(ec)) {
    throw FileError("stat", path, ec);
  }
  return exists;
}

std::optional<util::TimePoint> RecordFileStore::ModifiedAt(const std::filesystem::path& path) const {
  std::error_code ec;
  const auto      file_time = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return std::chrono::time_point_cast<util::Clock::duration>(std::chrono::file_clock::to_sys(file_time));
}

} // namespace refstore::storage
