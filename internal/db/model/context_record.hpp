#pragma once

#include <cstdint>
#include <string>

namespace projmem::db::model {

struct ContextRecord {
  std::string key;
  std::string value;

  uint64_t updated_at_ms = 0;
};

} // namespace projmem::db::model
