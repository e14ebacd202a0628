#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace shopstore::util {

/*
  UUID helpers

  Store addresses embed a random RFC4122 v4 UUID so two stores created
  for the same shop never collide on disk.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace shopstore::util
