/// @file lifecycle_manager.cpp
/// @brief LifecycleManager implementation: registration, transitions, batch start and shutdown.

#include "cpr/plugin/lifecycle_manager.hpp"

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"
#include "cpr/plugin/version_resolver.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>

using cpr::foundation::ErrorCode;
using cpr::foundation::LogCategory;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

RuntimeError invalidTransition(const RegistryEntry& entry, std::string_view operation) {
    return RuntimeError(ErrorCode::InvalidLifecycleTransition,
                        "cannot " + std::string(operation) + " '" + entry.manifest.id +
                            "' in state " + std::string(LifecycleStateName(entry.state.load())));
}

}  // namespace

LifecycleManager::LifecycleManager(Registry& registry, ExtensionLoader& loader,
                                   IsolatedExecutor& isolation, SecurityManager& security,
                                   StateStore& store, EventBus& bus,
                                   cpr::foundation::ServiceLocator& services)
    : registry_(registry),
      loader_(loader),
      isolation_(isolation),
      security_(security),
      store_(store),
      bus_(bus),
      services_(services) {}

// ── Registration ────────────────────────────────────────────────────────

RuntimeResult<std::shared_ptr<RegistryEntry>> LifecycleManager::Register(
    Manifest manifest, const std::filesystem::path& extensionDir,
    const std::filesystem::path& manifestPath) {
    using Out = RuntimeResult<std::shared_ptr<RegistryEntry>>;

    if (auto existing = registry_.Find(manifest.id);
        existing && existing->state.load() != LifecycleState::Unloaded) {
        return Out::err(RuntimeError(ErrorCode::DuplicateExtensionId,
                                     "extension '" + manifest.id + "' is already registered from " +
                                         existing->extensionDir.string()));
    }

    auto entry = std::make_shared<RegistryEntry>();
    entry->manifest = std::move(manifest);
    entry->extensionDir = extensionDir;
    entry->manifestPath = manifestPath;
    entry->policy = security_.ResolvePolicy(entry->manifest.id);

    auto loaded = loadInstance(*entry);
    if (loaded.hasError()) {
        entry->state = LifecycleState::Error;
        entry->SetLastError(loaded.error());
        CPR_LOG_ERROR(LogCategory::Loader, loaded.error().describe());
    }

    if (auto committed = registry_.Register(entry); committed.hasError()) {
        return Out::err(committed.error());
    }

    if (loaded.hasError()) {
        bus_.Publish(lifecycleEvent(*entry, "extension.error", &loaded.error()));
    } else {
        CPR_LOG_INFO(LogCategory::Lifecycle,
                     "registered '" + entry->manifest.id + "' " + entry->manifest.version +
                         (entry->IsIsolated() ? " (isolated)" : ""));
        bus_.Publish(lifecycleEvent(*entry, "extension.registered"));
    }
    return Out::ok(std::move(entry));
}

RuntimeResult<void> LifecycleManager::loadInstance(RegistryEntry& entry) {
    const auto& manifest = entry.manifest;

    auto ref = EntryReference::Parse(manifest.entryReference, entry.extensionDir);
    if (ref.hasError()) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::ExtensionLoadFailed,
            "cannot load '" + manifest.id + "': " + std::string(ref.error().message())));
    }
    entry.entry = ref.value();

    if (!entry.IsIsolated()) {
        auto instance = loader_.Instantiate(entry.entry, manifest);
        if (instance.hasError()) {
            return RuntimeResult<void>::err(instance.error());
        }
        entry.instance = std::move(instance).value();
        return RuntimeResult<void>::ok();
    }

    if (entry.entry.kind != EntryReference::Kind::SharedLibrary) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::ExtensionLoadFailed,
            "cannot load '" + manifest.id + "': isolated extensions must be shared libraries"));
    }

    auto supported = isolation_.Describe(entry.entry.libraryPath, entry.entry.factorySymbol,
                                         entry.policy.limits);
    if (supported.hasError()) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::ExtensionLoadFailed,
            "cannot load '" + manifest.id + "': " + std::string(supported.error().message())));
    }
    std::set<std::string> available(supported.value().begin(), supported.value().end());
    for (const auto& action : manifest.actions) {
        if (available.count(action.name) == 0) {
            return RuntimeResult<void>::err(RuntimeError(
                ErrorCode::ExtensionLoadFailed,
                "cannot load '" + manifest.id + "': declared action '" + action.name +
                    "' not supported"));
        }
    }
    return RuntimeResult<void>::ok();
}

// ── Lifecycle: Initialize ───────────────────────────────────────────────

RuntimeResult<void> LifecycleManager::Initialize(std::string_view id) {
    auto found = find(id);
    if (found.hasError()) {
        return RuntimeResult<void>::err(found.error());
    }
    auto& entry = *found.value();

    PendingEvents events;
    auto result = [&] {
        std::lock_guard transition(entry.transitionMutex);
        return initializeLocked(entry, events);
    }();
    publish(events);
    return result;
}

RuntimeResult<void> LifecycleManager::initializeLocked(RegistryEntry& entry,
                                                       PendingEvents& events) {
    if (entry.state.load() != LifecycleState::Registered) {
        return RuntimeResult<void>::err(invalidTransition(entry, "initialize"));
    }

    auto grant = SecurityManager::ComputeGrant(entry.manifest, entry.policy);
    if (grant.hasError()) {
        entry.SetLastError(grant.error());
        CPR_LOG_WARN(LogCategory::Security, std::string(grant.error().message()));
        return RuntimeResult<void>::err(grant.error());
    }

    entry.grant = std::move(grant).value();
    entry.stateHandle = std::make_unique<StateHandle>(store_, entry.manifest.id);
    entry.eventHandle = std::make_unique<EventHandle>(bus_, entry.manifest.id, entry.grant);
    entry.context.extensionId = entry.manifest.id;
    entry.context.version = entry.manifest.version;
    entry.context.extensionDir = entry.extensionDir;
    entry.context.state = entry.stateHandle.get();
    entry.context.events = entry.eventHandle.get();
    entry.context.grant = &entry.grant;
    entry.context.services = &services_;

    if (entry.instance) {
        try {
            if (!entry.instance->OnInitialize(entry.context)) {
                return fail(entry,
                            RuntimeError(ErrorCode::ExtensionInitFailed,
                                         "OnInitialize() failed for '" + entry.manifest.id + "'"),
                            events);
            }
        } catch (const std::exception& e) {
            return fail(entry,
                        RuntimeError(ErrorCode::ExtensionInitFailed,
                                     "OnInitialize() threw for '" + entry.manifest.id +
                                         "': " + e.what()),
                        events);
        }
    } else if (entry.IsIsolated()) {
        if (auto hooks = runIsolatedHooks(entry, IsolatedHookStage::Initialize, events);
            hooks.hasError()) {
            return fail(entry,
                        RuntimeError(ErrorCode::ExtensionInitFailed,
                                     "OnInitialize() failed for '" + entry.manifest.id +
                                         "' in worker: " + std::string(hooks.error().message()),
                                     hooks.error().code()),
                        events);
        }
    }

    entry.state = LifecycleState::Initialized;
    entry.ClearLastError();
    events.push_back(lifecycleEvent(entry, "extension.initialized"));
    return RuntimeResult<void>::ok();
}

// ── Lifecycle: Start ────────────────────────────────────────────────────

RuntimeResult<void> LifecycleManager::Start(std::string_view id) {
    auto found = find(id);
    if (found.hasError()) {
        return RuntimeResult<void>::err(found.error());
    }
    auto& entry = *found.value();

    PendingEvents events;
    auto result = [&] {
        std::lock_guard transition(entry.transitionMutex);
        return startLocked(entry, events);
    }();
    publish(events);
    return result;
}

RuntimeResult<void> LifecycleManager::startLocked(RegistryEntry& entry, PendingEvents& events) {
    auto state = entry.state.load();
    if (state != LifecycleState::Initialized && state != LifecycleState::Stopped) {
        return RuntimeResult<void>::err(invalidTransition(entry, "start"));
    }

    auto report = VersionResolver::Resolve(registry_.ActiveVersions(), entry.manifest.dependencies);
    if (!report.AllSatisfied()) {
        RuntimeError error(ErrorCode::DependencyUnsatisfied,
                           "cannot start '" + entry.manifest.id + "': " + report.DescribeUnsatisfied(),
                           report);
        entry.SetLastError(error);
        CPR_LOG_WARN(LogCategory::Lifecycle, std::string(error.message()));
        return RuntimeResult<void>::err(std::move(error));
    }

    if (entry.instance) {
        try {
            if (!entry.instance->OnStart()) {
                return fail(entry,
                            RuntimeError(ErrorCode::ExtensionStartFailed,
                                         "OnStart() failed for '" + entry.manifest.id + "'"),
                            events);
            }
        } catch (const std::exception& e) {
            return fail(entry,
                        RuntimeError(ErrorCode::ExtensionStartFailed,
                                     "OnStart() threw for '" + entry.manifest.id + "': " + e.what()),
                        events);
        }
    } else if (entry.IsIsolated()) {
        if (auto hooks = runIsolatedHooks(entry, IsolatedHookStage::Start, events);
            hooks.hasError()) {
            return fail(entry,
                        RuntimeError(ErrorCode::ExtensionStartFailed,
                                     "OnStart() failed for '" + entry.manifest.id +
                                         "' in worker: " + std::string(hooks.error().message()),
                                     hooks.error().code()),
                        events);
        }
    }

    entry.state = LifecycleState::Started;
    entry.ClearLastError();
    {
        std::lock_guard lock(startOrderMutex_);
        startOrder_.push_back(entry.manifest.id);
    }
    CPR_LOG_INFO(LogCategory::Lifecycle, "started '" + entry.manifest.id + "'");
    events.push_back(lifecycleEvent(entry, "extension.started"));
    return RuntimeResult<void>::ok();
}

// ── Lifecycle: Stop ─────────────────────────────────────────────────────

RuntimeResult<void> LifecycleManager::Stop(std::string_view id) {
    auto found = find(id);
    if (found.hasError()) {
        return RuntimeResult<void>::err(found.error());
    }
    auto& entry = *found.value();

    PendingEvents events;
    auto result = [&] {
        std::lock_guard transition(entry.transitionMutex);
        return stopLocked(entry, events);
    }();
    publish(events);
    return result;
}

RuntimeResult<void> LifecycleManager::stopLocked(RegistryEntry& entry, PendingEvents& events) {
    if (entry.state.load() != LifecycleState::Started) {
        return RuntimeResult<void>::err(invalidTransition(entry, "stop"));
    }

    std::optional<RuntimeError> hookError;
    {
        std::unique_lock activity(entry.activityMutex);
        SecurityManager::CancelStreams(entry);
        if (entry.eventHandle) {
            entry.eventHandle->UnsubscribeAll();
        }
        {
            std::lock_guard lock(startOrderMutex_);
            startOrder_.erase(std::remove(startOrder_.begin(), startOrder_.end(), entry.manifest.id),
                              startOrder_.end());
        }

        if (entry.instance) {
            try {
                entry.instance->OnStop();
            } catch (const std::exception& e) {
                hookError = RuntimeError(ErrorCode::ExtensionStopFailed,
                                         "OnStop() threw for '" + entry.manifest.id + "': " + e.what());
            }
        }
        if (!hookError) {
            entry.state = LifecycleState::Stopped;
        }
    }
    if (hookError) {
        return fail(entry, std::move(*hookError), events);
    }

    CPR_LOG_INFO(LogCategory::Lifecycle, "stopped '" + entry.manifest.id + "'");
    events.push_back(lifecycleEvent(entry, "extension.stopped"));
    return RuntimeResult<void>::ok();
}

// ── Lifecycle: Unload ───────────────────────────────────────────────────

RuntimeResult<void> LifecycleManager::Unload(std::string_view id) {
    auto entryPtr = registry_.Find(id);
    if (!entryPtr) {
        return RuntimeResult<void>::ok();
    }
    auto& entry = *entryPtr;

    PendingEvents events;
    auto result = [&] {
        std::lock_guard transition(entry.transitionMutex);
        return unloadLocked(entry, events);
    }();
    publish(events);
    return result;
}

RuntimeResult<void> LifecycleManager::unloadLocked(RegistryEntry& entry, PendingEvents& events) {
    auto state = entry.state.load();
    if (state == LifecycleState::Unloaded) {
        return RuntimeResult<void>::ok();
    }
    if (state == LifecycleState::Started) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::InvalidLifecycleTransition,
            "extension '" + entry.manifest.id + "' must be stopped before unloading"));
    }

    {
        std::unique_lock activity(entry.activityMutex);
        SecurityManager::CancelStreams(entry);

        // Handlers must be gone, and finished, before the instance they call into.
        if (entry.eventHandle) {
            entry.eventHandle->UnsubscribeAll();
        }

        if (entry.instance && state != LifecycleState::Registered) {
            try {
                entry.instance->OnUnload();
            } catch (const std::exception& e) {
                CPR_LOG_ERROR(LogCategory::Lifecycle,
                              "OnUnload() threw for '" + entry.manifest.id + "': " + e.what());
            }
        }

        entry.instance.reset();
        entry.context = ExtensionContext{};
        entry.eventHandle.reset();
        entry.stateHandle.reset();
        entry.state = LifecycleState::Unloaded;
    }

    CPR_LOG_INFO(LogCategory::Lifecycle, "unloaded '" + entry.manifest.id + "'");
    events.push_back(lifecycleEvent(entry, "extension.unloaded"));
    return RuntimeResult<void>::ok();
}

RuntimeResult<void> LifecycleManager::Uninstall(std::string_view id) {
    auto found = find(id);
    if (found.hasError()) {
        return RuntimeResult<void>::err(found.error());
    }
    auto& entry = *found.value();

    PendingEvents events;
    auto unloaded = [&] {
        std::lock_guard transition(entry.transitionMutex);
        if (entry.state.load() == LifecycleState::Started) {
            if (auto stopped = stopLocked(entry, events); stopped.hasError()) {
                CPR_LOG_WARN(LogCategory::Lifecycle, stopped.error().describe());
            }
        }
        return unloadLocked(entry, events);
    }();
    publish(events);
    if (unloaded.hasError()) {
        return unloaded;
    }

    auto dropped = store_.DropNamespace(entry.manifest.id);
    if (dropped.hasError()) {
        return dropped;
    }
    CPR_LOG_INFO(LogCategory::State, "removed persisted state of '" + entry.manifest.id + "'");
    return RuntimeResult<void>::ok();
}

// ── Batch operations ────────────────────────────────────────────────────

BatchReport LifecycleManager::InitializeAll() {
    BatchReport report;
    for (const auto& entry : registry_.Entries()) {
        if (entry->state.load() != LifecycleState::Registered) {
            continue;
        }
        const auto& id = entry->manifest.id;
        if (auto r = Initialize(id); r.hasError()) {
            report.failed.emplace_back(id, r.error());
        } else {
            report.succeeded.push_back(id);
        }
    }
    return report;
}

BatchReport LifecycleManager::StartAll() {
    BatchReport report;

    std::map<std::string, std::vector<std::string>> graph;
    for (const auto& entry : registry_.Entries()) {
        if (entry->state.load() != LifecycleState::Initialized) {
            continue;
        }
        auto& deps = graph[entry->manifest.id];
        for (const auto& dep : entry->manifest.dependencies) {
            deps.push_back(dep.pluginId);
        }
    }

    auto plan = VersionResolver::StartupOrder(graph);
    for (const auto& id : plan.order) {
        if (auto r = Start(id); r.hasError()) {
            report.failed.emplace_back(id, r.error());
        } else {
            report.succeeded.push_back(id);
        }
    }

    if (!plan.blocked.empty()) {
        std::string cycle;
        for (const auto& step : plan.cyclePath) {
            cycle += (cycle.empty() ? "" : " -> ") + step;
        }
        for (const auto& id : plan.blocked) {
            RuntimeError error(ErrorCode::DependencyCycle,
                               "cannot start '" + id + "': dependency cycle " + cycle,
                               plan.cyclePath);
            if (auto entry = registry_.Find(id)) {
                entry->SetLastError(error);
            }
            CPR_LOG_WARN(LogCategory::Lifecycle, std::string(error.message()));
            report.failed.emplace_back(id, std::move(error));
        }
    }
    return report;
}

void LifecycleManager::Shutdown() {
    std::vector<std::string> order;
    {
        std::lock_guard lock(startOrderMutex_);
        order = startOrder_;
    }
    std::reverse(order.begin(), order.end());

    for (const auto& id : order) {
        if (auto r = Stop(id); r.hasError()) {
            CPR_LOG_WARN(LogCategory::Lifecycle, r.error().describe());
        }
    }

    auto entries = registry_.Entries();
    std::reverse(entries.begin(), entries.end());
    for (const auto& entry : entries) {
        if (entry->state.load() == LifecycleState::Started) {
            if (auto r = Stop(entry->manifest.id); r.hasError()) {
                CPR_LOG_WARN(LogCategory::Lifecycle, r.error().describe());
            }
        }
        if (auto r = Unload(entry->manifest.id); r.hasError()) {
            CPR_LOG_WARN(LogCategory::Lifecycle, r.error().describe());
        }
    }
}

RuntimeResult<LifecycleState> LifecycleManager::GetState(std::string_view id) const {
    auto found = find(id);
    if (found.hasError()) {
        return RuntimeResult<LifecycleState>::err(found.error());
    }
    return RuntimeResult<LifecycleState>::ok(found.value()->state.load());
}

// ── Helpers ─────────────────────────────────────────────────────────────

RuntimeResult<std::shared_ptr<RegistryEntry>> LifecycleManager::find(std::string_view id) const {
    auto entry = registry_.Find(id);
    if (!entry) {
        return RuntimeResult<std::shared_ptr<RegistryEntry>>::err(
            RuntimeError(ErrorCode::ExtensionNotFound, "extension not found: " + std::string(id)));
    }
    return RuntimeResult<std::shared_ptr<RegistryEntry>>::ok(std::move(entry));
}

RuntimeResult<void> LifecycleManager::runIsolatedHooks(RegistryEntry& entry,
                                                       IsolatedHookStage stage,
                                                       PendingEvents& events) {
    return isolation_.RunHooks(security_.InvocationFor(entry), stage,
                               [&events](const Event& event) { events.push_back(event); });
}

RuntimeResult<void> LifecycleManager::fail(RegistryEntry& entry, RuntimeError error,
                                           PendingEvents& events) {
    entry.state = LifecycleState::Error;
    entry.SetLastError(error);
    if (entry.eventHandle) {
        entry.eventHandle->UnsubscribeAll();
    }
    CPR_LOG_ERROR(LogCategory::Lifecycle, error.describe());
    events.push_back(lifecycleEvent(entry, "extension.error", &error));
    return RuntimeResult<void>::err(std::move(error));
}

Event LifecycleManager::lifecycleEvent(const RegistryEntry& entry, const char* type,
                                       const RuntimeError* error) {
    YAML::Node payload;
    payload["id"] = entry.manifest.id;
    payload["version"] = entry.manifest.version;
    payload["state"] = std::string(LifecycleStateName(entry.state.load()));
    if (error != nullptr) {
        payload["error"] = error->describe();
    }

    Event event;
    event.type = type;
    event.source = kRuntimeEventSource;
    event.payload = std::move(payload);
    return event;
}

void LifecycleManager::publish(PendingEvents& events) {
    for (const auto& event : events) {
        bus_.Publish(event);
    }
    events.clear();
}

}  // namespace cpr::plugin
