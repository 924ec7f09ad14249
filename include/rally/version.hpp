#pragma once

/// @file version.hpp
/// @brief Project version information and root namespace definition.

#define RALLY_VERSION_MAJOR 0
#define RALLY_VERSION_MINOR 3
#define RALLY_VERSION_PATCH 0
#define RALLY_VERSION_STRING "0.3.0"

namespace rally {

/// Project version information at compile time.
struct Version {
    static constexpr int major = RALLY_VERSION_MAJOR;
    static constexpr int minor = RALLY_VERSION_MINOR;
    static constexpr int patch = RALLY_VERSION_PATCH;
    static constexpr const char* string = RALLY_VERSION_STRING;
};

} // namespace rally
