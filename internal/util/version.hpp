#pragma once

namespace projmem::util {

// Snapshot blobs are compatible across minor/patch releases of the same major.
inline constexpr const char* kServiceVersion = "1.1.0";
inline constexpr int         kServiceMajorVersion = 1;

} // namespace projmem::util
