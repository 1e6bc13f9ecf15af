#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/model/reference.hpp"
#include "internal/util/time.hpp"

namespace refstore::format {

/*
  On-disk record encodings.

  Current format (YAML, one mapping per file):

    content: "Hello, {name}!"
    metadata:
      "source": "synapse"
    created: 2024-05-01T12:00:00.000000Z
    updated: 2024-05-02T08:30:00.250000Z
    version: 2

  Legacy format (JSON object with the same keys). Timestamps are ISO 8601,
  usually without a zone designator, and metadata values may be any JSON
  value; non-string values are flattened to their JSON text.

  Missing timestamps fall back to the caller-supplied time (the file's
  modification time). A missing or zero version reads as 1.
*/

class RecordDecodeError : public std::runtime_error {
 public:
  explicit RecordDecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

std::string EncodeRecord(const model::ReferenceRecord& record);

// Both throw RecordDecodeError.
model::ReferenceRecord DecodeRecord(std::string_view bytes, util::TimePoint fallback_time);
model::ReferenceRecord DecodeLegacyRecord(std::string_view bytes, util::TimePoint fallback_time);

} // namespace refstore::format
