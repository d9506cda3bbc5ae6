#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace projmem::util {

/*
  UUID helpers

  Request ids are random RFC4122 v4 UUIDs; logs carry the short form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// first 8 hex chars, e.g. "3f2a9c01"
std::string NewRequestId();

} // namespace projmem::util
