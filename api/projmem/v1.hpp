#pragma once

// Single include point for the generated wire types (projmem::v1).

#include "projmem/v1/memory.pb.h"
#include "projmem/v1/operations.pb.h"
