#pragma once

#include <cstdint>

namespace projmem::db::model {

struct TableCounts {
  uint64_t decisions    = 0;
  uint64_t patterns     = 0;
  uint64_t context_keys = 0;

  // SUM(LENGTH(...)) over every stored text column
  uint64_t text_bytes = 0;
};

} // namespace projmem::db::model
