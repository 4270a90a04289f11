#pragma once

/// @file extension_runtime.hpp
/// @brief ExtensionRuntime: process-wide facade owning every runtime component.

#include "cpr/foundation/config_manager.hpp"
#include "cpr/foundation/job_scheduler.hpp"
#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/service_locator.hpp"
#include "cpr/plugin/action_stream.hpp"
#include "cpr/plugin/discovery.hpp"
#include "cpr/plugin/event_bus.hpp"
#include "cpr/plugin/isolated_executor.hpp"
#include "cpr/plugin/lifecycle_manager.hpp"
#include "cpr/plugin/loader.hpp"
#include "cpr/plugin/registry.hpp"
#include "cpr/plugin/security_manager.hpp"
#include "cpr/plugin/state_store.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cpr::plugin {

/// Runtime settings.  See FromConfig() for the configuration keys.
struct RuntimeOptions {
    std::vector<std::filesystem::path> pluginDirs;
    std::filesystem::path stateDir = "state";
    std::optional<std::filesystem::path> policyFile;
    std::filesystem::path workerPath;  ///< Empty: cpr_extension_worker next to this executable.
    std::chrono::milliseconds streamIdleTimeout{30000};
    std::size_t discoveryThreads = 2;

    /// Read `runtime.plugin_dirs`, `runtime.state_dir`, `runtime.policy_file`,
    /// `runtime.worker_path`, `runtime.stream_idle_timeout_ms` and
    /// `runtime.discovery_threads`.  Missing keys keep their defaults.
    [[nodiscard]] static RuntimeOptions FromConfig(const cpr::foundation::ConfigManager& config);
};

/// Outcome of one Scan().
struct ScanReport {
    DiscoveryReport discovery;
    std::vector<std::string> registered;  ///< Includes entries registered in ERROR.
    std::vector<std::string> unchanged;   ///< Already registered from the same directory.
};

/// Owns the registry, lifecycle, security, state, stream and event
/// components and wires them together.
///
/// Init() must succeed before anything else; it fails only on
/// unrecoverable conditions (state storage unavailable, invalid policy).
/// Shutdown() drains every entry to UNLOADED and is called by the
/// destructor.
///
/// Example:
/// @code
///   ExtensionRuntime runtime(RuntimeOptions::FromConfig(config));
///   if (auto r = runtime.Init(); !r) { ... }
///   runtime.Scan();
///   runtime.InitializeAll();
///   runtime.StartAll();
///   auto result = runtime.Invoke("com.example.greeter", "greet", input);
/// @endcode
class ExtensionRuntime {
public:
    explicit ExtensionRuntime(RuntimeOptions options);
    ~ExtensionRuntime();

    ExtensionRuntime(const ExtensionRuntime&) = delete;
    ExtensionRuntime& operator=(const ExtensionRuntime&) = delete;

    [[nodiscard]] cpr::foundation::RuntimeResult<void> Init();

    /// Discover, load and register extensions.  Safe to repeat: ids
    /// already live from the same directory are left alone, a live id
    /// found at a different path is logged as a duplicate, and UNLOADED
    /// tombstones are replaced.
    [[nodiscard]] cpr::foundation::RuntimeResult<ScanReport> Scan();

    [[nodiscard]] cpr::foundation::RuntimeResult<void> Initialize(std::string_view id);
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Start(std::string_view id);
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Stop(std::string_view id);
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Unload(std::string_view id);
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Uninstall(std::string_view id);

    BatchReport InitializeAll();
    BatchReport StartAll();

    /// Invoke an action; see SecurityManager::Invoke for the checks applied.
    [[nodiscard]] cpr::foundation::RuntimeResult<InvocationResult>
    Invoke(std::string_view id, const std::string& action, const YAML::Node& input = YAML::Node());

    void Shutdown();

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }
    [[nodiscard]] std::vector<EntrySnapshot> Snapshot() const { return registry_.Snapshot(); }

    [[nodiscard]] const RuntimeOptions& Options() const noexcept { return options_; }
    [[nodiscard]] Registry& GetRegistry() noexcept { return registry_; }
    [[nodiscard]] EventBus& Bus() noexcept { return bus_; }
    [[nodiscard]] cpr::foundation::ServiceLocator& Services() noexcept { return services_; }
    [[nodiscard]] StateStore& Store() noexcept { return *store_; }
    [[nodiscard]] SecurityManager& Security() noexcept { return *security_; }
    [[nodiscard]] LifecycleManager& Lifecycle() noexcept { return *lifecycle_; }
    [[nodiscard]] StreamSupervisor& Streams() noexcept { return *supervisor_; }

    /// Default worker location: cpr_extension_worker beside the running executable.
    [[nodiscard]] static std::filesystem::path DefaultWorkerPath();

private:
    cpr::foundation::RuntimeResult<void> requireInit() const;

    RuntimeOptions options_;
    cpr::foundation::ServiceLocator services_;
    EventBus bus_;
    Registry registry_;
    ExtensionLoader loader_;
    std::unique_ptr<StateStore> store_;
    std::unique_ptr<cpr::foundation::JobScheduler> scheduler_;
    std::unique_ptr<IsolatedExecutor> isolation_;
    std::unique_ptr<StreamSupervisor> supervisor_;
    std::unique_ptr<SecurityManager> security_;
    std::unique_ptr<LifecycleManager> lifecycle_;
    bool initialized_ = false;
};

}  // namespace cpr::plugin
