#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GCB_VERSION_MAJOR 0
#define GCB_VERSION_MINOR 3
#define GCB_VERSION_PATCH 0
#define GCB_VERSION_STRING "0.3.0"

/// Wire protocol revision spoken by this build.
#define GCB_PROTOCOL_REVISION 1

namespace gcb {

/// Project version information at compile time.
struct Version {
    static constexpr int major = GCB_VERSION_MAJOR;
    static constexpr int minor = GCB_VERSION_MINOR;
    static constexpr int patch = GCB_VERSION_PATCH;
    static constexpr const char* string = GCB_VERSION_STRING;
    static constexpr int protocolRevision = GCB_PROTOCOL_REVISION;
};

} // namespace gcb
