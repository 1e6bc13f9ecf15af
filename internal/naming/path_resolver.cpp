#include "path_resolver.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace refstore::naming {

namespace {

constexpr char kSeparator = '/';

std::string_view StripSeparators(std::string_view name) {
  while (!name.empty() && name.front() == kSeparator) name.remove_prefix(1);
  while (!name.empty() && name.back() == kSeparator) name.remove_suffix(1);
  return name;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

// Returns an empty string when the segment is acceptable, otherwise the reason.
std::string CheckSegment(std::string_view segment, bool last) {
  if (segment.empty()) {
    return "empty path segment";
  }
  if (segment == "." || segment == "..") {
    return "relative path segment '" + std::string(segment) + "'";
  }
  if (segment.size() > kMaxSegmentBytes) {
    return "path segment longer than " + std::to_string(kMaxSegmentBytes) + " bytes";
  }
  for (char c : segment) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7F) {
      return "control character in name";
    }
    if (c == '\\') {
      return "backslash in name";
    }
  }
  if (!last && (EndsWith(segment, kCurrentExtension) || EndsWith(segment, kLegacyExtension))) {
    return "intermediate segment '" + std::string(segment) + "' ends in a record extension";
  }
  return {};
}

std::vector<std::string_view> SplitSegments(std::string_view name) {
  std::vector<std::string_view> segments;
  std::size_t                   start = 0;
  while (true) {
    const auto next = name.find(kSeparator, start);
    if (next == std::string_view::npos) {
      segments.push_back(name.substr(start));
      return segments;
    }
    segments.push_back(name.substr(start, next - start));
    start = next + 1;
  }
}

std::string Validate(std::string_view canonical) {
  if (canonical.empty()) {
    return "name must not be empty";
  }
  const auto segments = SplitSegments(canonical);
  for (std::size_t i = 0; i < segments.size(); ++i) {
    auto reason = CheckSegment(segments[i], i + 1 == segments.size());
    if (!reason.empty()) {
      return reason;
    }
  }
  return {};
}

bool IsBelow(const std::filesystem::path& relative) {
  if (relative.empty()) {
    return false;
  }
  const auto first = *relative.begin();
  return first != ".." && first != "." && !relative.is_absolute();
}

} // namespace

std::filesystem::path ReferenceLocation::File(RecordFormat format) const {
  auto file = base_;
  file += std::string(format == RecordFormat::kCurrent ? kCurrentExtension : kLegacyExtension);
  return file;
}

PathResolver::PathResolver(std::filesystem::path root) : root_(std::filesystem::absolute(root).lexically_normal()) {
  if (!root_.has_filename() && root_.has_relative_path()) {
    root_ = root_.parent_path();
  }
}

std::string PathResolver::Canonicalize(std::string_view name) {
  const auto canonical = StripSeparators(name);
  auto       reason    = Validate(canonical);
  if (!reason.empty()) {
    throw util::InvalidReferenceName(std::string(name), "resolve", std::move(reason));
  }
  return std::string(canonical);
}

bool PathResolver::IsValid(std::string_view name) {
  return Validate(name).empty();
}

ReferenceLocation PathResolver::Resolve(std::string_view name) const {
  const auto canonical = Canonicalize(name);

  auto base = root_;
  for (const auto segment : SplitSegments(canonical)) {
    base /= std::string(segment);
  }
  return ReferenceLocation(std::move(base));
}

std::string PathResolver::Unresolve(const ReferenceLocation& location) const {
  const auto relative = location.base().lexically_relative(root_);
  if (!IsBelow(relative)) {
    throw util::InvalidReferenceName(location.base().string(), "unresolve", "location is not below the storage root");
  }

  auto name   = relative.generic_string();
  auto reason = Validate(name);
  if (!reason.empty()) {
    throw util::InvalidReferenceName(name, "unresolve", std::move(reason));
  }
  return name;
}

std::optional<std::pair<ReferenceLocation, RecordFormat>> PathResolver::LocationForFile(const std::filesystem::path& file) const {
  const auto extension = file.extension().string();

  RecordFormat format;
  if (extension == kCurrentExtension) {
    format = RecordFormat::kCurrent;
  } else if (extension == kLegacyExtension) {
    format = RecordFormat::kLegacy;
  } else {
    return std::nullopt;
  }

  auto       base     = file.parent_path() / file.stem();
  const auto relative = base.lexically_relative(root_);
  if (!IsBelow(relative) || !Validate(relative.generic_string()).empty()) {
    return std::nullopt;
  }
  return std::make_pair(ReferenceLocation(std::move(base)), format);
}

} // namespace refstore::naming
