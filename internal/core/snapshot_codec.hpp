#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "memory_store.hpp"
#include "projmem/v1/memory.pb.h"
#include "projmem/v1/operations.pb.h"

namespace projmem::core {

struct SnapshotOptions {
  std::string project;

  uint64_t max_json_bytes   = 10 * 1024 * 1024;
  uint64_t max_decisions    = 10000;
  uint64_t max_patterns     = 1000;
  uint64_t max_context_keys = 500;
};

/*
  SnapshotCodec

  Export: one read transaction -> MemorySnapshot -> protobuf JSON
          (snake_case field names, version = service version).

  Import: size guard -> JSON parse -> major version check -> item count
          guards -> every field re-validated like a live write -> one write
          transaction that replaces the whole store.

  Capacity rules still apply during import: surplus decisions evict the
  oldest imported ones, surplus patterns or context keys abort the import
  with nothing changed.
*/
class SnapshotCodec {
 public:
  SnapshotCodec(std::shared_ptr<MemoryStore> store, SnapshotOptions options);

  projmem::v1::ExportMemoryResult Export();

  projmem::v1::ImportSummary Import(const std::string& json);

  // "1.4.2" is compatible with a 1.x service; "" or "2.0.0" is not.
  static bool IsCompatibleVersion(const std::string& version);

 private:
  std::shared_ptr<MemoryStore> store_;
  SnapshotOptions              options_;
};

} // namespace projmem::core
