/**
 * version.hpp - hashfleet version information
 */

#pragma once

#define HASHFLEET_VERSION "1.0.0"
#define HASHFLEET_MAJOR_VERSION 1
#define HASHFLEET_NAME "hashfleetd"

namespace hashfleet {

inline const char* version() { return HASHFLEET_VERSION; }

}  // namespace hashfleet
