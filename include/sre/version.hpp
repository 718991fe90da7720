#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define SRE_VERSION_MAJOR 0
#define SRE_VERSION_MINOR 3
#define SRE_VERSION_PATCH 0
#define SRE_VERSION_STRING "0.3.0"

namespace sre {

/// Spell resolution engine version at compile time.
struct Version {
    static constexpr int major = SRE_VERSION_MAJOR;
    static constexpr int minor = SRE_VERSION_MINOR;
    static constexpr int patch = SRE_VERSION_PATCH;
    static constexpr const char* string = SRE_VERSION_STRING;
};

} // namespace sre
