#pragma once
// Kernel and primitive catalog versions
//
// The catalog version tracks the syscall table layout. Adding metadata
// bumps the minor; adding, removing or re-layering a primitive bumps
// the major.

#include <string>

#define CORTEX_VERSION "1.4.0"
#define CORTEX_CATALOG_VERSION_MAJOR 1
#define CORTEX_CATALOG_VERSION_MINOR 0

namespace cortex {
namespace version {

// A caller built against catalog major.minor can run on this kernel
inline bool catalog_compatible(int major, int minor) {
    return major == CORTEX_CATALOG_VERSION_MAJOR &&
           minor <= CORTEX_CATALOG_VERSION_MINOR;
}

inline std::string catalog_version() {
    return std::to_string(CORTEX_CATALOG_VERSION_MAJOR) + "." +
           std::to_string(CORTEX_CATALOG_VERSION_MINOR);
}

} // namespace version
} // namespace cortex
