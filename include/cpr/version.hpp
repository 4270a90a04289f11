#pragma once

/// @file version.hpp
/// @brief Runtime version information and core namespace definition.

#define CPR_VERSION_MAJOR 0
#define CPR_VERSION_MINOR 3
#define CPR_VERSION_PATCH 0
#define CPR_VERSION_STRING "0.3.0"

namespace cpr {

/// Runtime version information at compile time.
struct Version {
    static constexpr int major = CPR_VERSION_MAJOR;
    static constexpr int minor = CPR_VERSION_MINOR;
    static constexpr int patch = CPR_VERSION_PATCH;
    static constexpr const char* string = CPR_VERSION_STRING;
};

} // namespace cpr
