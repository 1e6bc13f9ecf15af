#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace refstore::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 in UTC with microsecond precision, e.g. 2024-05-01T12:00:00.123456Z.
std::string FormatTimestamp(TimePoint tp);

// Accepts RFC 3339 and zone-less ISO 8601 ("2024-05-01T12:00:00.123456"),
// the latter read as UTC.
std::optional<TimePoint> ParseTimestamp(const std::string& text);

} // namespace refstore::util
