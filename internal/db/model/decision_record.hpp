#pragma once

#include <cstdint>
#include <string>

namespace projmem::db::model {

/*
  Append-log row.

  id is assigned by storage (AUTOINCREMENT) and never reused,
  even after eviction or purge.
*/

struct DecisionRecord {
  int64_t id = 0;

  // ISO-8601 creation time (preserved across export/import)
  std::string timestamp;

  std::string decision;
  std::string rationale;
  std::string context;
  std::string alternatives;
};

} // namespace projmem::db::model
