#pragma once

/// @file runtime_logger.hpp
/// @brief RuntimeLogger wrapping kcenon common_system logging for the plugin runtime.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cpr/foundation/runtime_result.hpp"

namespace cpr::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Runtime log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Runtime facade and host
    Discovery = 1, ///< Manifest scanning and validation
    Loader    = 2, ///< Shared-library and static entry resolution
    Lifecycle = 3, ///< State transitions and hooks
    Security  = 4, ///< Permission checks and limit enforcement
    Isolation = 5, ///< Worker processes
    State     = 6, ///< Per-extension state store
    Stream    = 7, ///< Action streams
    Events    = 8  ///< Event bus delivery
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 9;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Discovery", "Loader", "Lifecycle", "Security",
        "Isolation", "State", "Stream", "Events"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "WARNING", ...). Unknown names yield nullopt.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.extensionId = "text.tools";
///   ctx.action = "summarize";
///   RuntimeLogger::instance().logWithContext(
///       LogLevel::Warning, LogCategory::Security, "wall clock exceeded", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> extensionId;
    std::optional<std::string> action;
    std::optional<uint64_t> streamId;
    std::unordered_map<std::string, std::string> extra;
};

/// Runtime logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
/// Every category defaults to Info. The host adjusts levels through the
/// `logging.level` and `logging.<category>` config keys.
class RuntimeLogger {
public:
    RuntimeLogger();
    ~RuntimeLogger();

    RuntimeLogger(const RuntimeLogger&) = delete;
    RuntimeLogger& operator=(const RuntimeLogger&) = delete;
    RuntimeLogger(RuntimeLogger&&) noexcept;
    RuntimeLogger& operator=(RuntimeLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    RuntimeResult<void> flush();

    /// Get the global RuntimeLogger singleton instance.
    static RuntimeLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cpr::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace, macros are global)
// ---------------------------------------------------------------------------

/// @name CPR_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// CPR_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef CPR_MIN_LOG_LEVEL
    #define CPR_MIN_LOG_LEVEL 0
#endif

#define CPR_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= CPR_MIN_LOG_LEVEL &&                        \
            ::cpr::foundation::RuntimeLogger::instance().isEnabled((level), (cat))) \
        {                                                                          \
            ::cpr::foundation::RuntimeLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define CPR_LOG_DEBUG(cat, msg) \
    CPR_LOG(::cpr::foundation::LogLevel::Debug, (cat), (msg))

#define CPR_LOG_INFO(cat, msg) \
    CPR_LOG(::cpr::foundation::LogLevel::Info, (cat), (msg))

#define CPR_LOG_WARN(cat, msg) \
    CPR_LOG(::cpr::foundation::LogLevel::Warning, (cat), (msg))

#define CPR_LOG_ERROR(cat, msg) \
    CPR_LOG(::cpr::foundation::LogLevel::Error, (cat), (msg))

/// @}
