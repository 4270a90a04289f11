/// @file host_runner.cpp
/// @brief Implementation of the host entry-point utilities.

#include "cpr/host/host_runner.hpp"

#include <array>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

#include "cpr/foundation/runtime_logger.hpp"

using cpr::foundation::LogCategory;

namespace cpr::host {

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- Config loading ----------------------------------------------------------

cpr::foundation::RuntimeResult<void> loadConfig(cpr::foundation::ConfigManager& config,
                                                const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("CPR_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

void applyLogLevels(const cpr::foundation::ConfigManager& config) {
    auto& logger = cpr::foundation::RuntimeLogger::instance();

    if (auto name = config.get<std::string>("logging.level")) {
        if (auto level = cpr::foundation::parseLogLevel(name.value())) {
            logger.setAllLevels(*level);
        } else {
            CPR_LOG_WARN(LogCategory::Core, "unknown log level '" + name.value() + "'");
        }
    }

    constexpr std::array<LogCategory, cpr::foundation::kLogCategoryCount> categories = {
        LogCategory::Core,   LogCategory::Discovery, LogCategory::Loader,
        LogCategory::Lifecycle, LogCategory::Security, LogCategory::Isolation,
        LogCategory::State,  LogCategory::Stream,    LogCategory::Events};
    for (auto cat : categories) {
        std::string key = "logging.categories." + std::string(cpr::foundation::logCategoryName(cat));
        auto name = config.get<std::string>(key);
        if (!name) {
            continue;
        }
        if (auto level = cpr::foundation::parseLogLevel(name.value())) {
            logger.setCategoryLevel(cat, *level);
        } else {
            CPR_LOG_WARN(LogCategory::Core, "unknown log level '" + name.value() + "' for " + key);
        }
    }
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

}  // namespace cpr::host
