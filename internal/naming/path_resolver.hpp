#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace refstore::naming {

enum class RecordFormat {
  kCurrent, // <segments>.yaml
  kLegacy,  // <segments>.json
};

inline constexpr std::string_view kCurrentExtension = ".yaml";
inline constexpr std::string_view kLegacyExtension  = ".json";

// Leaves room for the extension and the temp-file decoration under NAME_MAX.
inline constexpr std::size_t kMaxSegmentBytes = 200;

/*
  Storage location of one reference: <root>/<seg1>/.../<segN> without an
  extension. Each record format hangs its own extension off the base path.
*/
class ReferenceLocation {
 public:
  ReferenceLocation() = default;
  explicit ReferenceLocation(std::filesystem::path base) : base_(std::move(base)) {
  }

  const std::filesystem::path& base() const {
    return base_;
  }

  std::filesystem::path File(RecordFormat format) const;

  std::filesystem::path CurrentFile() const {
    return File(RecordFormat::kCurrent);
  }

  std::filesystem::path LegacyFile() const {
    return File(RecordFormat::kLegacy);
  }

  bool operator==(const ReferenceLocation& other) const = default;

 private:
  std::filesystem::path base_;
};

/*
  Maps reference names to storage locations and back.

  Valid names are non-empty sequences of '/'-separated segments. A segment is
  never empty, never "." or "..", never contains a control character or a
  backslash, and is at most kMaxSegmentBytes long. Intermediate segments must
  not end in a record extension, because the directory they create would
  shadow the record file of the shorter name.

  Resolve() strips leading and trailing separators before validating, so
  "/a/b/" and "a/b" name the same reference. Over canonical names the mapping
  is bijective: Unresolve(Resolve(n)) == n.
*/
class PathResolver {
 public:
  explicit PathResolver(std::filesystem::path root);

  const std::filesystem::path& root() const {
    return root_;
  }

  // Throws util::InvalidReferenceName.
  ReferenceLocation Resolve(std::string_view name) const;

  // Throws util::InvalidReferenceName when the location is not below the root
  // or does not spell a canonical name.
  std::string Unresolve(const ReferenceLocation& location) const;

  // Maps a file met during enumeration back to its location. Temp files,
  // foreign extensions and paths outside the root yield nothing.
  std::optional<std::pair<ReferenceLocation, RecordFormat>> LocationForFile(const std::filesystem::path& file) const;

  // Strips separators and validates; returns the canonical name.
  // Throws util::InvalidReferenceName.
  static std::string Canonicalize(std::string_view name);

  static bool IsValid(std::string_view name);

 private:
  std::filesystem::path root_;
};

} // namespace refstore::naming
