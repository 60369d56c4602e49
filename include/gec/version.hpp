#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GEC_VERSION_MAJOR 0
#define GEC_VERSION_MINOR 3
#define GEC_VERSION_PATCH 0
#define GEC_VERSION_STRING "0.3.0"

namespace gec {

/// Project version information at compile time.
struct Version {
    static constexpr int major = GEC_VERSION_MAJOR;
    static constexpr int minor = GEC_VERSION_MINOR;
    static constexpr int patch = GEC_VERSION_PATCH;
    static constexpr const char* string = GEC_VERSION_STRING;
};

} // namespace gec
