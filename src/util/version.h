#pragma once

/// @file version.h
/// @brief Library version.

#define MASTERPRINT_VERSION_MAJOR 1
#define MASTERPRINT_VERSION_MINOR 0
#define MASTERPRINT_VERSION_PATCH 0
#define MASTERPRINT_VERSION_STRING "1.0.0"

namespace masterprint {

/// @brief Returns the library version string.
inline const char* version() { return MASTERPRINT_VERSION_STRING; }

}  // namespace masterprint
