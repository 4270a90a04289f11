/// @file security_manager.cpp
/// @brief Enforcement boundary: grants, concurrency slots, limit checks, isolation dispatch.

#include "cpr/plugin/security_manager.hpp"

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"

#include <algorithm>
#include <ctime>
#include <set>

using cpr::foundation::Clock;
using cpr::foundation::ErrorCode;
using cpr::foundation::LogCategory;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;
using cpr::foundation::StreamId;

namespace cpr::plugin {

namespace {

using ViolationFn = std::function<void(const RuntimeError&)>;

std::chrono::nanoseconds threadCpuTime() {
    timespec ts{};
    clock_gettime(CLOCK_THREAD_CPUTIME_ID, &ts);
    return std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
}

std::size_t encodedSize(const YAML::Node& node) {
    YAML::Emitter out;
    out << node;
    return out.size();
}

RuntimeError limitExceeded(const std::string& limit, const std::string& message) {
    return RuntimeError(ErrorCode::ResourceLimitExceeded, message, limit);
}

std::string limitName(const RuntimeError& error) {
    const auto* limit = error.context<std::string>();
    return limit != nullptr ? *limit : std::string("unknown");
}

/// Checks measured against the profile after an in-process dispatch or pull.
std::optional<RuntimeError> checkTimeLimits(const ResourceLimits& limits,
                                            std::chrono::nanoseconds cpuUsed,
                                            Clock::duration wallUsed) {
    if (limits.HasWallClockLimit() && wallUsed > limits.wallClock) {
        return limitExceeded("wall_clock", "wall-clock limit of " +
                                               std::to_string(limits.wallClock.count()) +
                                               " ms exceeded");
    }
    if (limits.HasCpuLimit() && cpuUsed > limits.cpuTime) {
        return limitExceeded("cpu_time", "CPU time limit of " +
                                             std::to_string(limits.cpuTime.count()) +
                                             " ms exceeded");
    }
    return std::nullopt;
}

/// Holds one concurrency slot of an entry until destroyed.
class ConcurrencySlot {
public:
    explicit ConcurrencySlot(std::shared_ptr<RegistryEntry> entry) : entry_(std::move(entry)) {}

    ~ConcurrencySlot() {
        {
            std::lock_guard lock(entry_->slotMutex);
            --entry_->activeInvocations;
        }
        entry_->slotFreed.notify_one();
    }

    ConcurrencySlot(const ConcurrencySlot&) = delete;
    ConcurrencySlot& operator=(const ConcurrencySlot&) = delete;

private:
    std::shared_ptr<RegistryEntry> entry_;
};

/// Wait for a slot when the profile caps concurrency.
/// A null slot means the entry is uncapped.
RuntimeResult<std::shared_ptr<void>> acquireSlot(const std::shared_ptr<RegistryEntry>& entry) {
    const auto& limits = entry->policy.limits;
    if (limits.maxConcurrency == 0) {
        return RuntimeResult<std::shared_ptr<void>>::ok(nullptr);
    }

    std::unique_lock lock(entry->slotMutex);
    auto free = [&] { return entry->activeInvocations < limits.maxConcurrency; };
    if (limits.HasWallClockLimit()) {
        if (!entry->slotFreed.wait_for(lock, limits.wallClock, free)) {
            return RuntimeResult<std::shared_ptr<void>>::err(limitExceeded(
                "concurrency", "no free invocation slot for '" + entry->manifest.id + "'"));
        }
    } else {
        entry->slotFreed.wait(lock, free);
    }
    ++entry->activeInvocations;
    lock.unlock();
    return RuntimeResult<std::shared_ptr<void>>::ok(std::make_shared<ConcurrencySlot>(entry));
}

/// Applies limits to every pull of a stream.
class EnforcingProducer final : public ChunkProducer {
public:
    EnforcingProducer(std::unique_ptr<ChunkProducer> inner, ResourceLimits limits,
                      bool measureInProcess, ViolationFn onViolation)
        : inner_(std::move(inner)),
          limits_(limits),
          measureInProcess_(measureInProcess),
          onViolation_(std::move(onViolation)) {}

    ChunkResult Next() override {
        auto cpu0 = threadCpuTime();
        auto wall0 = Clock::now();
        auto chunk = inner_->Next();

        if (measureInProcess_) {
            if (auto breach = checkTimeLimits(limits_, threadCpuTime() - cpu0, Clock::now() - wall0)) {
                onViolation_(*breach);
                return ChunkResult::err(std::move(*breach));
            }
        }
        if (chunk.hasError()) {
            if (chunk.error().code() == ErrorCode::ResourceLimitExceeded) {
                onViolation_(chunk.error());
            }
            return chunk;
        }
        if (chunk.value() && limits_.maxOutputBytes > 0) {
            bytes_ += encodedSize(*chunk.value());
            if (bytes_ > limits_.maxOutputBytes) {
                auto breach = limitExceeded("output_size",
                                            "stream output exceeded " +
                                                std::to_string(limits_.maxOutputBytes) + " bytes");
                onViolation_(breach);
                return ChunkResult::err(std::move(breach));
            }
        }
        return chunk;
    }

    void Release() override { inner_->Release(); }

private:
    std::unique_ptr<ChunkProducer> inner_;
    ResourceLimits limits_;
    bool measureInProcess_;
    ViolationFn onViolation_;
    std::size_t bytes_ = 0;
};

}  // namespace

SecurityManager::SecurityManager(HostPolicy policy, EventBus& bus, StreamSupervisor& supervisor,
                                 IsolatedExecutor& isolation, std::filesystem::path stateRoot)
    : policy_(std::move(policy)),
      bus_(bus),
      supervisor_(supervisor),
      isolation_(isolation),
      stateRoot_(std::move(stateRoot)) {}

// ── Grants ──────────────────────────────────────────────────────────────

RuntimeResult<PermissionGrant> SecurityManager::ComputeGrant(const Manifest& manifest,
                                                             const ResolvedPolicy& policy) {
    std::set<std::string> granted;
    std::vector<std::string> denied;
    for (const auto& token : manifest.declaredPermissions) {
        if (policy.Allows(token)) {
            granted.insert(token);
        } else {
            denied.push_back(token);
        }
    }

    if (!denied.empty()) {
        std::string joined;
        for (const auto& d : denied) {
            joined += (joined.empty() ? "" : ", ") + d;
        }
        return RuntimeResult<PermissionGrant>::err(RuntimeError(
            ErrorCode::PermissionDenied,
            "extension '" + manifest.id + "' requests permissions denied by tier '" + policy.tier +
                "': " + joined,
            denied));
    }
    return RuntimeResult<PermissionGrant>::ok(PermissionGrant(std::move(granted)));
}

// ── Invocation ──────────────────────────────────────────────────────────

RuntimeResult<InvocationResult> SecurityManager::Invoke(const std::shared_ptr<RegistryEntry>& entryPtr,
                                                        const std::string& action,
                                                        const YAML::Node& input) {
    using Out = RuntimeResult<InvocationResult>;
    auto& entry = *entryPtr;
    const std::string& id = entry.manifest.id;

    std::shared_lock activity(entry.activityMutex);

    auto state = entry.state.load();
    if (state != LifecycleState::Started) {
        return Out::err(RuntimeError(ErrorCode::InvalidLifecycleTransition,
                                     "extension '" + id + "' is not started (state " +
                                         std::string(LifecycleStateName(state)) + ")"));
    }

    const ActionSpec* spec = entry.manifest.FindAction(action);
    if (spec == nullptr) {
        return Out::err(RuntimeError(ErrorCode::ActionNotFound,
                                     "extension '" + id + "' has no action '" + action + "'"));
    }

    std::vector<std::string> missing;
    for (const auto& p : spec->permissions) {
        if (!entry.grant.Allows(p)) {
            missing.push_back(p);
        }
    }
    if (!missing.empty()) {
        return Out::err(RuntimeError(ErrorCode::PermissionDenied,
                                     "action '" + action + "' of '" + id +
                                         "' needs permissions that were not granted",
                                     missing));
    }

    if (auto valid = ValidateInput(spec->inputSchema, input); valid.hasError()) {
        return Out::err(valid.error());
    }

    auto slot = acquireSlot(entryPtr);
    if (slot.hasError()) {
        return Out::err(slot.error());
    }

    auto output = entry.IsIsolated() ? runIsolated(entry, *spec, input)
                                     : runInProcess(entry, *spec, input);
    if (output.hasError()) {
        if (output.error().code() == ErrorCode::ResourceLimitExceeded) {
            RecordViolation(entry, action, output.error());
        }
        return Out::err(output.error());
    }

    auto& result = output.value();
    if (!result.IsStream()) {
        if (spec->streamsOutput) {
            CPR_LOG_DEBUG(LogCategory::Security,
                          "streaming action '" + action + "' of '" + id + "' returned a value");
        }
        return Out::ok(InvocationResult::Value(result.value()));
    }

    auto stream = openStream(entryPtr, action, result.TakeProducer(), std::move(slot).value());
    return Out::ok(InvocationResult::Stream(std::move(stream)));
}

RuntimeResult<ActionOutput> SecurityManager::runInProcess(RegistryEntry& entry,
                                                          const ActionSpec& spec,
                                                          const YAML::Node& input) {
    const auto& limits = entry.policy.limits;
    if (!entry.instance) {
        return RuntimeResult<ActionOutput>::err(RuntimeError(
            ErrorCode::ExtensionNotFound, "extension '" + entry.manifest.id + "' has no instance"));
    }

    std::optional<Clock::time_point> deadline;
    if (limits.HasWallClockLimit()) {
        deadline = Clock::now() + limits.wallClock;
    }
    ActionContext ctx(entry.manifest.id, spec.name, deadline);
    ActionRequest request{spec.name, input};

    auto cpu0 = threadCpuTime();
    auto wall0 = Clock::now();
    auto output = [&]() -> RuntimeResult<ActionOutput> {
        try {
            return entry.instance->Dispatch(request, ctx);
        } catch (const std::exception& e) {
            CPR_LOG_ERROR(LogCategory::Security, "action '" + spec.name + "' of '" +
                                                     entry.manifest.id + "' threw: " + e.what());
            return cpr::foundation::fail<ActionOutput>(ErrorCode::ActionFailed,
                                                       std::string("action threw: ") + e.what());
        }
    }();

    if (auto breach = checkTimeLimits(limits, threadCpuTime() - cpu0, Clock::now() - wall0)) {
        if (output.hasValue() && output.value().IsStream()) {
            output.value().TakeProducer()->Release();
        }
        return RuntimeResult<ActionOutput>::err(std::move(*breach));
    }
    if (output.hasValue() && !output.value().IsStream() && limits.maxOutputBytes > 0) {
        auto size = encodedSize(output.value().value());
        if (size > limits.maxOutputBytes) {
            return RuntimeResult<ActionOutput>::err(limitExceeded(
                "output_size", "result of " + std::to_string(size) + " bytes exceeds limit of " +
                                   std::to_string(limits.maxOutputBytes)));
        }
    }
    return output;
}

IsolatedInvocation SecurityManager::InvocationFor(const RegistryEntry& entry) const {
    IsolatedInvocation invocation;
    invocation.extensionId = entry.manifest.id;
    invocation.version = entry.manifest.version;
    invocation.library = entry.entry.libraryPath;
    invocation.factorySymbol = entry.entry.factorySymbol;
    invocation.extensionDir = entry.extensionDir;
    invocation.stateRoot = stateRoot_;
    invocation.grant.assign(entry.grant.Tokens().begin(), entry.grant.Tokens().end());
    invocation.declaredActions = entry.manifest.ActionNames();
    invocation.limits = entry.policy.limits;
    return invocation;
}

RuntimeResult<ActionOutput> SecurityManager::runIsolated(RegistryEntry& entry,
                                                         const ActionSpec& spec,
                                                         const YAML::Node& input) {
    auto invocation = InvocationFor(entry);
    invocation.action = spec.name;
    invocation.input = input;

    auto output = isolation_.Invoke(invocation, [this](const Event& event) { bus_.Publish(event); });
    if (output.hasError()) {
        return output;
    }

    const auto& limits = entry.policy.limits;
    if (!output.value().IsStream() && limits.maxOutputBytes > 0) {
        auto size = encodedSize(output.value().value());
        if (size > limits.maxOutputBytes) {
            return RuntimeResult<ActionOutput>::err(limitExceeded(
                "output_size", "result of " + std::to_string(size) + " bytes exceeds limit of " +
                                   std::to_string(limits.maxOutputBytes)));
        }
    }
    return output;
}

std::shared_ptr<ActionStream> SecurityManager::openStream(
    const std::shared_ptr<RegistryEntry>& entry, const std::string& action,
    std::unique_ptr<ChunkProducer> producer, std::shared_ptr<void> slot) {
    StreamId id(nextStreamId_.fetch_add(1));
    std::weak_ptr<RegistryEntry> weakEntry = entry;

    auto enforced = std::make_unique<EnforcingProducer>(
        std::move(producer), entry->policy.limits, !entry->IsIsolated(),
        [this, weakEntry, action](const RuntimeError& error) {
            if (auto e = weakEntry.lock()) {
                RecordViolation(*e, action, error);
            }
        });

    auto onClose = [weakEntry, id, slot = std::move(slot)](StreamState) mutable {
        slot.reset();
        auto e = weakEntry.lock();
        if (!e) {
            return;
        }
        // Released after the lock so no stream destructor runs under it.
        std::vector<std::shared_ptr<ActionStream>> alive;
        std::lock_guard lock(e->streamsMutex);
        auto& open = e->openStreams;
        open.erase(std::remove_if(open.begin(), open.end(),
                                  [&](const std::weak_ptr<ActionStream>& w) {
                                      auto s = w.lock();
                                      bool closed = !s || s->Id() == id;
                                      alive.push_back(std::move(s));
                                      return closed;
                                  }),
                   open.end());
    };

    auto stream = std::make_shared<ActionStream>(id, entry->manifest.id, action,
                                                 std::move(enforced), std::move(onClose));
    {
        std::lock_guard lock(entry->streamsMutex);
        entry->openStreams.push_back(stream);
    }
    supervisor_.Track(stream);
    CPR_LOG_DEBUG(LogCategory::Stream, "opened stream " + std::to_string(id.value()) + " for '" +
                                           entry->manifest.id + "." + action + "'");
    return stream;
}

// ── Violations ──────────────────────────────────────────────────────────

void SecurityManager::RecordViolation(RegistryEntry& entry, const std::string& action,
                                      const RuntimeError& error) {
    ViolationRecord record;
    record.extensionId = entry.manifest.id;
    record.action = action;
    record.limit = limitName(error);
    record.message = std::string(error.message());
    record.count = entry.violations.fetch_add(1) + 1;

    CPR_LOG_WARN(LogCategory::Security,
                 "resource limit '" + record.limit + "' exceeded by '" + record.extensionId + "." +
                     action + "' (" + std::to_string(record.count) + " total): " + record.message);

    YAML::Node payload;
    payload["id"] = record.extensionId;
    payload["version"] = entry.manifest.version;
    payload["state"] = std::string(LifecycleStateName(entry.state.load()));
    payload["action"] = record.action;
    payload["limit"] = record.limit;
    payload["error"] = record.message;
    payload["violations"] = record.count;
    bus_.Publish("extension.resource_limit_exceeded", kRuntimeEventSource, payload);

    EscalationCallback callback;
    {
        std::lock_guard lock(callbackMutex_);
        callback = escalation_;
    }
    if (callback) {
        callback(record);
    }
}

void SecurityManager::SetEscalationCallback(EscalationCallback callback) {
    std::lock_guard lock(callbackMutex_);
    escalation_ = std::move(callback);
}

// ── Streams ─────────────────────────────────────────────────────────────

void SecurityManager::CancelStreams(RegistryEntry& entry) {
    std::vector<std::shared_ptr<ActionStream>> streams;
    {
        std::lock_guard lock(entry.streamsMutex);
        for (const auto& w : entry.openStreams) {
            if (auto s = w.lock()) {
                streams.push_back(std::move(s));
            }
        }
    }
    for (const auto& s : streams) {
        s->Cancel();
    }
}

std::size_t SecurityManager::OpenStreamCount(RegistryEntry& entry) {
    std::vector<std::shared_ptr<ActionStream>> streams;
    {
        std::lock_guard lock(entry.streamsMutex);
        for (const auto& w : entry.openStreams) {
            if (auto s = w.lock()) {
                streams.push_back(std::move(s));
            }
        }
    }
    return static_cast<std::size_t>(std::count_if(
        streams.begin(), streams.end(), [](const auto& s) { return s->IsOpen(); }));
}

}  // namespace cpr::plugin
