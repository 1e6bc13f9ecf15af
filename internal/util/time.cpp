#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace refstore::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatTimestamp(TimePoint tp) {
  // TimeUtil picks 0, 3, 6 or 9 fractional digits; truncate to microseconds so
  // records stay at a fixed precision.
  auto micros = std::chrono::time_point_cast<std::chrono::microseconds>(tp);
  return google::protobuf::util::TimeUtil::ToString(ToProto(std::chrono::time_point_cast<Clock::duration>(micros)));
}

std::optional<TimePoint> ParseTimestamp(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::string normalized = text;
  if (normalized.size() > 10 && normalized[10] == ' ') {
    normalized[10] = 'T';
  }

  if (normalized.back() == 'z') {
    normalized.back() = 'Z';
  }

  const auto time_part = normalized.find('T');
  const bool has_zone =
      normalized.back() == 'Z' || (time_part != std::string::npos && normalized.find_first_of("+-", time_part) != std::string::npos);
  if (!has_zone) {
    normalized += 'Z';
  }

  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(normalized, &ts)) {
    return std::nullopt;
  }
  return FromProto(ts);
}

} // namespace refstore::util
