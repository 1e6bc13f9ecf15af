#pragma once

#include <filesystem>
#include <system_error>

namespace refstore::storage::common {

inline bool IsMissing(const std::error_code& ec) {
  return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

/*
  Remove empty directories from `dir` upwards, stopping at the first
  non-empty one or at `root` (never removed). Failures only stop the walk.
*/
inline void PruneEmptyParents(std::filesystem::path dir, const std::filesystem::path& root) {
  while (dir != root) {
    const auto relative = dir.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
      return;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec) || !std::filesystem::is_empty(dir, ec) || ec) {
      return;
    }
    if (!std::filesystem::remove(dir, ec) || ec) {
      return;
    }
    dir = dir.parent_path();
  }
}

} // namespace refstore::storage::common
