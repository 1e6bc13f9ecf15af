#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace refstore::util {

/*
  UUID helpers

  Used to give in-flight temp files a name no concurrent writer can pick.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace refstore::util
