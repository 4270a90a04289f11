/// @file main.cpp
/// @brief Extension host entry point.
///
/// Boots the extension runtime from a YAML config, discovers, initializes
/// and starts every extension, then waits for SIGINT/SIGTERM and drains
/// the runtime to UNLOADED.

#include <cstdlib>
#include <iostream>
#include <memory>

#include "cpr/foundation/config_manager.hpp"
#include "cpr/host/host_runner.hpp"
#include "cpr/plugin/extension_runtime.hpp"
#include "cpr/version.hpp"

namespace {

void printReport(const char* phase, const cpr::plugin::BatchReport& report) {
    for (const auto& [id, error] : report.failed) {
        std::cerr << phase << " failed for " << id << ": " << error.describe() << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    cpr::host::SignalHandler signals;

    auto configPath = cpr::host::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/cpr/config.yaml";
    }

    auto config = std::make_shared<cpr::foundation::ConfigManager>();
    auto loadResult = cpr::host::loadConfig(*config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    cpr::host::applyLogLevels(*config);

    cpr::plugin::ExtensionRuntime runtime(cpr::plugin::RuntimeOptions::FromConfig(*config));
    runtime.Services().add<cpr::foundation::ConfigManager>(config);

    auto initResult = runtime.Init();
    if (!initResult) {
        std::cerr << "Failed to initialize runtime: " << initResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto scan = runtime.Scan();
    if (!scan) {
        std::cerr << "Discovery failed: " << scan.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    for (const auto& rejected : scan.value().discovery.rejected) {
        std::cerr << "Rejected " << rejected.path.string() << ": " << rejected.error.message()
                  << "\n";
    }

    printReport("initialize", runtime.InitializeAll());
    printReport("start", runtime.StartAll());

    std::size_t started = 0;
    for (const auto& snap : runtime.Snapshot()) {
        std::cout << "  " << snap.id << " " << snap.version << " "
                  << cpr::plugin::LifecycleStateName(snap.state) << "\n";
        if (snap.state == cpr::plugin::LifecycleState::Started) {
            ++started;
        }
    }
    std::cout << "Extension host " << cpr::Version::string << " running (" << started
              << " extension(s) started)\n";

    signals.waitForShutdown();

    std::cout << "Shutting down extension host...\n";
    runtime.Shutdown();
    std::cout << "Extension host stopped\n";
    return EXIT_SUCCESS;
}
