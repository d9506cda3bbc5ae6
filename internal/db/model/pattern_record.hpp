#pragma once

#include <cstdint>
#include <string>

namespace projmem::db::model {

struct PatternRecord {
  std::string name; // unique key

  std::string description;
  std::string example;
  std::string when_to_use;

  // epoch ms of the last insert-or-replace
  uint64_t updated_at_ms = 0;
};

} // namespace projmem::db::model
