#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define SEDIT_VERSION_MAJOR 0
#define SEDIT_VERSION_MINOR 3
#define SEDIT_VERSION_PATCH 0
#define SEDIT_VERSION_STRING "0.3.0"

namespace sedit {

/// Scene editor core version at compile time.
struct Version {
    static constexpr int major = SEDIT_VERSION_MAJOR;
    static constexpr int minor = SEDIT_VERSION_MINOR;
    static constexpr int patch = SEDIT_VERSION_PATCH;
    static constexpr const char* string = SEDIT_VERSION_STRING;
};

} // namespace sedit
