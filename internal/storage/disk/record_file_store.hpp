#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace refstore::storage {

/*
  Durable record files using Arrow IO.

  Properties:
    - atomic replace writes (readers see the old bytes or the new bytes)
    - optional fsync of the file and its directory
    - in-flight temp files are dot-prefixed and never carry a record extension

  Every failure is reported as std::runtime_error; callers attach the
  reference name and operation.
*/

class RecordFileStore {
 public:
  explicit RecordFileStore(bool fsync);
  virtual ~RecordFileStore() = default;

  // nullopt when the file does not exist.
  std::optional<std::string> Read(const std::filesystem::path& path) const;

  /*
    Atomic write:
        mkdir -p parent → write tmp → flush (+fsync) → rename (+dir fsync)

    Throws only when the old bytes are still in place. A directory sync
    failure after the rename is logged.
  */
  void Write(const std::filesystem::path& path, std::string_view bytes) const;

  // Returns false when there was nothing to remove.
  bool Remove(const std::filesystem::path& path) const;

  bool Exists(const std::filesystem::path& path) const;

  std::optional<util::TimePoint> ModifiedAt(const std::filesystem::path& path) const;

 protected:
  virtual void SyncDirectory(const std::filesystem::path& dir) const;

 private:
  bool fsync_;
};

} // namespace refstore::storage
