#pragma once

/// @file host_runner.hpp
/// @brief Shared utilities for the host entry point.
///
/// Provides signal handling, configuration loading, log-level setup and
/// CLI argument parsing for the cpr_host executable.

#include <atomic>
#include <filesystem>

#include "cpr/foundation/config_manager.hpp"
#include "cpr/foundation/runtime_result.hpp"

namespace cpr::host {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// On destruction the default handlers are restored so that a second
/// signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. CPR_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] cpr::foundation::RuntimeResult<void>
loadConfig(cpr::foundation::ConfigManager& config, const std::filesystem::path& defaultPath);

/// Apply `logging.level` and `logging.categories.<name>` to the runtime logger.
/// Unknown level names are reported and ignored.
void applyLogLevels(const cpr::foundation::ConfigManager& config);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace cpr::host
