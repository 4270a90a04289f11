#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the plugin runtime.

#include <cstdint>
#include <string_view>

namespace cpr::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be determined from the code value alone and callers can
/// branch on kind without string matching.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,

    // Manifest / discovery (0x0100 - 0x01FF)
    ManifestInvalid = 0x0100,
    ManifestNotFound = 0x0101,
    DuplicateExtensionId = 0x0102,
    DiscoveryFailed = 0x0103,

    // Loader (0x0200 - 0x02FF)
    ExtensionLoadFailed = 0x0200,
    SymbolNotFound = 0x0201,
    ApiVersionMismatch = 0x0202,
    InterfaceMismatch = 0x0203,

    // Lifecycle (0x0300 - 0x03FF)
    ExtensionNotFound = 0x0300,
    InvalidLifecycleTransition = 0x0301,
    ExtensionInitFailed = 0x0302,
    ExtensionStartFailed = 0x0303,
    DependencyUnsatisfied = 0x0304,
    DependencyCycle = 0x0305,
    ExtensionStopFailed = 0x0306,

    // Security (0x0400 - 0x04FF)
    PermissionDenied = 0x0400,
    ResourceLimitExceeded = 0x0401,
    IsolationFailure = 0x0402,
    PolicyInvalid = 0x0403,
    SubscriptionUnavailable = 0x0404,

    // Action dispatch (0x0500 - 0x05FF)
    ActionNotFound = 0x0500,
    ActionInputInvalid = 0x0501,
    ActionFailed = 0x0502,

    // State store (0x0600 - 0x06FF)
    StateStoreError = 0x0600,
    StateNotSerializable = 0x0601,
    StorageUnavailable = 0x0602,

    // Streams (0x0700 - 0x07FF)
    StreamConsumptionFailed = 0x0700,
    StreamCancelled = 0x0701,
    StreamTimedOut = 0x0702,

    // Config (0x0800 - 0x08FF)
    ConfigLoadFailed = 0x0800,
    ConfigKeyNotFound = 0x0801,
    ConfigTypeMismatch = 0x0802,

    // Thread (0x0900 - 0x09FF)
    ThreadError = 0x0900,
    JobScheduleFailed = 0x0901,
    JobNotFound = 0x0902,

    // Logger (0x0A00 - 0x0AFF)
    LoggerError = 0x0A00,
    LoggerFlushFailed = 0x0A01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Manifest";
        case 0x0200: return "Loader";
        case 0x0300: return "Lifecycle";
        case 0x0400: return "Security";
        case 0x0500: return "Action";
        case 0x0600: return "State";
        case 0x0700: return "Stream";
        case 0x0800: return "Config";
        case 0x0900: return "Thread";
        case 0x0A00: return "Logger";
        default: return "Unknown";
    }
}

/// True for codes in the given subsystem range (e.g. 0x0400 for Security).
constexpr bool isInSubsystem(ErrorCode code, uint32_t rangeBase) {
    return (static_cast<uint32_t>(code) & 0xFF00) == rangeBase;
}

} // namespace cpr::foundation
