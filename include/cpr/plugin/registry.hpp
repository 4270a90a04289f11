#pragma once

/// @file registry.hpp
/// @brief Registry: extension id → manifest, instance, lifecycle state, paths.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/plugin/action_stream.hpp"
#include "cpr/plugin/extension_context.hpp"
#include "cpr/plugin/host_policy.hpp"
#include "cpr/plugin/loader.hpp"
#include "cpr/plugin/manifest.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cpr::plugin {

/// Lifecycle states of a registry entry.
enum class LifecycleState : uint8_t {
    Registered,   ///< Discovered and loaded; not yet initialized.
    Initialized,  ///< Permissions granted, OnInitialize() succeeded.
    Started,      ///< Accepting action invocations.
    Stopped,      ///< Stopped; may be restarted or unloaded.
    Unloaded,     ///< Instance released.  Terminal.
    Error         ///< A load or hook failure occurred.
};

[[nodiscard]] std::string_view LifecycleStateName(LifecycleState state);

/// Everything the runtime knows about one extension.
///
/// Lifecycle transitions lock `transitionMutex` for their whole duration.
/// Invocations hold `activityMutex` shared; stop and unload take it
/// exclusively so no action is mid-flight while hooks run.
struct RegistryEntry {
    Manifest manifest;
    std::filesystem::path extensionDir;
    std::filesystem::path manifestPath;

    /// In-process instance (null for isolated entries or after unload).
    ExtensionPtr instance;

    /// Parsed entry reference (used to run isolated entries in the worker).
    EntryReference entry;

    std::atomic<LifecycleState> state{LifecycleState::Registered};

    /// Policy resolved when the entry was admitted.
    ResolvedPolicy policy;

    /// Permission grant, valid from INITIALIZED on.
    PermissionGrant grant;

    std::unique_ptr<StateHandle> stateHandle;
    std::unique_ptr<EventHandle> eventHandle;
    ExtensionContext context;

    std::atomic<uint64_t> violations{0};

    std::mutex transitionMutex;
    std::shared_mutex activityMutex;

    /// Streams handed out and not yet closed.
    std::mutex streamsMutex;
    std::vector<std::weak_ptr<ActionStream>> openStreams;

    /// In-flight invocations, bounded by policy.limits.maxConcurrency.
    std::mutex slotMutex;
    std::condition_variable slotFreed;
    uint32_t activeInvocations = 0;

    /// Record @p error as the latest failure.
    void SetLastError(cpr::foundation::RuntimeError error);
    void ClearLastError();
    [[nodiscard]] std::optional<cpr::foundation::RuntimeError> LastError() const;

    [[nodiscard]] bool IsIsolated() const noexcept { return policy.isolated; }

private:
    mutable std::mutex errorMutex_;
    std::optional<cpr::foundation::RuntimeError> lastError_;
};

/// Read-only copy of an entry's visible status.
struct EntrySnapshot {
    std::string id;
    std::string version;
    LifecycleState state = LifecycleState::Registered;
    std::filesystem::path extensionDir;
    std::optional<std::string> lastError;
    uint64_t violations = 0;
    bool isolated = false;
};

/// Single source of truth for registered extensions.
///
/// Commits are serialized; lookups take a shared lock.  Only one entry per
/// id is live at a time.  An UNLOADED entry stays as a tombstone until a
/// later registration of the same id replaces it.
class Registry {
public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Commit @p entry.
    /// @return DuplicateExtensionId if a live entry with the same id exists.
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Register(std::shared_ptr<RegistryEntry> entry);

    /// Find an entry (nullptr if unknown).
    [[nodiscard]] std::shared_ptr<RegistryEntry> Find(std::string_view id) const;

    /// All entries in registration order, tombstones included.
    [[nodiscard]] std::vector<std::shared_ptr<RegistryEntry>> Entries() const;

    /// id → version of entries currently INITIALIZED or STARTED.
    [[nodiscard]] std::unordered_map<std::string, SemVersion> ActiveVersions() const;

    [[nodiscard]] std::vector<EntrySnapshot> Snapshot() const;

    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RegistryEntry>> entries_;
    std::vector<std::string> order_;
};

}  // namespace cpr::plugin
