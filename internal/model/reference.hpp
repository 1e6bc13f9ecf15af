#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/util/time.hpp"

namespace refstore::model {

using Metadata = std::map<std::string, std::string>;

/*
  Persistent reference record.

  IMPORTANT:
  - created_at is copied forward on every overwrite.
  - version starts at 1 and grows by exactly 1 per write to the same name.
  - Deleting the record ends the lineage; a later create starts over at 1.
*/
struct ReferenceRecord {
  std::string content;
  Metadata    metadata;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  uint64_t version = 0;
};

struct Reference {
  std::string     name;
  ReferenceRecord record;
};

struct WriteResult {
  std::string name;
  uint64_t    version = 0;
};

} // namespace refstore::model
