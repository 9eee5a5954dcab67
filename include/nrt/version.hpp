#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define NRT_VERSION_MAJOR 0
#define NRT_VERSION_MINOR 3
#define NRT_VERSION_PATCH 0
#define NRT_VERSION_STRING "0.3.0"

namespace nrt {

/// Runtime version information at compile time.
struct Version {
    static constexpr int major = NRT_VERSION_MAJOR;
    static constexpr int minor = NRT_VERSION_MINOR;
    static constexpr int patch = NRT_VERSION_PATCH;
    static constexpr const char* string = NRT_VERSION_STRING;
};

} // namespace nrt
