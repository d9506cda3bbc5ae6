#pragma once

#include <memory>

#include "internal/config/memory_options.hpp"
#include "internal/service/service_context.hpp"

namespace projmem::factory {

/*
  Build

  Composition root: opens (and if needed creates) the store file, applies
  migrations, verifies integrity, and wires pool -> repository -> store ->
  codec / health -> protocol handler.

  It is the ONLY place allowed to know concrete DB types.

  Throws util::StorageIntegrity when the file is not a usable database;
  callers treat that as fatal.
*/
std::shared_ptr<service::ServiceContext> Build(const config::MemoryOptions& options);

} // namespace projmem::factory
