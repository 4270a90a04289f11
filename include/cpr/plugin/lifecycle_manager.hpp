#pragma once

/// @file lifecycle_manager.hpp
/// @brief Per-entry lifecycle state machine with dependency-gated start.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/service_locator.hpp"
#include "cpr/plugin/event_bus.hpp"
#include "cpr/plugin/isolated_executor.hpp"
#include "cpr/plugin/loader.hpp"
#include "cpr/plugin/registry.hpp"
#include "cpr/plugin/security_manager.hpp"
#include "cpr/plugin/state_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cpr::plugin {

/// Per-entry outcome of a batch operation.
struct BatchReport {
    std::vector<std::string> succeeded;
    std::vector<std::pair<std::string, cpr::foundation::RuntimeError>> failed;

    [[nodiscard]] bool AllSucceeded() const noexcept { return failed.empty(); }
};

/// Drives registry entries through their lifecycle.
///
///   REGISTERED →(initialize)→ INITIALIZED →(start)→ STARTED →(stop)→ STOPPED →(unload)→ UNLOADED
///
/// STOPPED entries may be started again.  Any hook failure lands the entry
/// in ERROR, except:
///   - a denied permission leaves it REGISTERED,
///   - an unsatisfied dependency leaves it where it was.
/// Transitions on one entry are serialized; different entries proceed
/// independently.  Every transition publishes an `extension.*` event with
/// payload {id, version, state, error?} once the entry's transition lock
/// has been released.
class LifecycleManager {
public:
    LifecycleManager(Registry& registry, ExtensionLoader& loader, IsolatedExecutor& isolation,
                     SecurityManager& security, StateStore& store, EventBus& bus,
                     cpr::foundation::ServiceLocator& services);

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    /// Load @p manifest and commit it to the registry.
    ///
    /// A load failure still registers the entry, in ERROR with the error
    /// recorded.  Isolated entries are validated in a throwaway worker and
    /// never opened in the host.
    /// @return DuplicateExtensionId if a live entry with the same id exists.
    [[nodiscard]] cpr::foundation::RuntimeResult<std::shared_ptr<RegistryEntry>>
    Register(Manifest manifest, const std::filesystem::path& extensionDir,
             const std::filesystem::path& manifestPath);

    /// Grant permissions and run OnInitialize().
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Initialize(std::string_view id);

    /// Check dependencies and run OnStart().
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Start(std::string_view id);

    /// Cancel open streams, drop subscriptions and run OnStop().
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Stop(std::string_view id);

    /// Release the instance.  Unknown and already-unloaded ids succeed.
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Unload(std::string_view id);

    /// Stop if started, unload, and delete the extension's persisted state.
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Uninstall(std::string_view id);

    /// Initialize every REGISTERED entry in registration order.
    BatchReport InitializeAll();

    /// Start every INITIALIZED entry in dependency order.  Entries on a
    /// dependency cycle fail with DependencyCycle.
    BatchReport StartAll();

    /// Stop started entries in reverse start order, then unload everything.
    void Shutdown();

    [[nodiscard]] cpr::foundation::RuntimeResult<LifecycleState> GetState(std::string_view id) const;

private:
    cpr::foundation::RuntimeResult<std::shared_ptr<RegistryEntry>> find(std::string_view id) const;

    /// Events raised while a transition lock is held.  They are published
    /// only after the lock is released, so handlers may drive the same
    /// entry through further transitions.
    using PendingEvents = std::vector<Event>;

    cpr::foundation::RuntimeResult<void> loadInstance(RegistryEntry& entry);

    /// Run an isolated entry's hooks in a throwaway worker.  Events the
    /// hooks publish are queued on @p events.
    cpr::foundation::RuntimeResult<void> runIsolatedHooks(RegistryEntry& entry,
                                                          IsolatedHookStage stage,
                                                          PendingEvents& events);

    /// Move @p entry to ERROR, record @p error and queue extension.error.
    cpr::foundation::RuntimeResult<void> fail(RegistryEntry& entry,
                                              cpr::foundation::RuntimeError error,
                                              PendingEvents& events);

    [[nodiscard]] static Event lifecycleEvent(const RegistryEntry& entry, const char* type,
                                              const cpr::foundation::RuntimeError* error = nullptr);

    void publish(PendingEvents& events);

    cpr::foundation::RuntimeResult<void> initializeLocked(RegistryEntry& entry,
                                                          PendingEvents& events);
    cpr::foundation::RuntimeResult<void> startLocked(RegistryEntry& entry, PendingEvents& events);
    cpr::foundation::RuntimeResult<void> stopLocked(RegistryEntry& entry, PendingEvents& events);
    cpr::foundation::RuntimeResult<void> unloadLocked(RegistryEntry& entry, PendingEvents& events);

    Registry& registry_;
    ExtensionLoader& loader_;
    IsolatedExecutor& isolation_;
    SecurityManager& security_;
    StateStore& store_;
    EventBus& bus_;
    cpr::foundation::ServiceLocator& services_;

    std::mutex startOrderMutex_;
    std::vector<std::string> startOrder_;
};

}  // namespace cpr::plugin
