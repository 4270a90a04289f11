#pragma once

/// @file security_manager.hpp
/// @brief Permission grants and the enforcement boundary around action invocations.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/types.hpp"
#include "cpr/plugin/action_stream.hpp"
#include "cpr/plugin/event_bus.hpp"
#include "cpr/plugin/host_policy.hpp"
#include "cpr/plugin/isolated_executor.hpp"
#include "cpr/plugin/registry.hpp"

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace cpr::plugin {

/// One resource-limit breach.
struct ViolationRecord {
    std::string extensionId;
    std::string action;
    std::string limit;    ///< "cpu_time", "memory", "wall_clock" or "output_size".
    std::string message;
    uint64_t count = 0;   ///< Violations recorded for this extension so far.
};

/// Host hook notified on every violation.  Escalation is the host's call;
/// the runtime itself never changes lifecycle state because of a violation.
using EscalationCallback = std::function<void(const ViolationRecord&)>;

/// Enforces permissions and resource limits.
///
/// Every invocation goes through Invoke(), which checks in order:
///   1. the entry is STARTED,
///   2. the action is declared,
///   3. the action's permissions are granted,
///   4. the input matches the action's schema,
///   5. a concurrency slot is free (waiting at most the wall-clock limit),
/// then runs the action in-process or, for isolated entries, in a worker.
///
/// In-process limits are cooperative: the action sees its deadline through
/// ActionContext, and wall-clock, thread CPU time and output size are
/// checked after each dispatch and each stream pull.  Memory ceilings are
/// only enforceable inside the isolation boundary.
class SecurityManager {
public:
    SecurityManager(HostPolicy policy, EventBus& bus, StreamSupervisor& supervisor,
                    IsolatedExecutor& isolation, std::filesystem::path stateRoot);

    SecurityManager(const SecurityManager&) = delete;
    SecurityManager& operator=(const SecurityManager&) = delete;

    [[nodiscard]] const HostPolicy& Policy() const noexcept { return policy_; }

    [[nodiscard]] ResolvedPolicy ResolvePolicy(std::string_view extensionId) const {
        return policy_.Resolve(extensionId);
    }

    /// Compute the grant for @p manifest under @p policy.
    /// @return PermissionDenied listing the denied tokens
    ///         (std::vector<std::string> context) if any declared permission
    ///         is not allowed.
    [[nodiscard]] static cpr::foundation::RuntimeResult<PermissionGrant>
    ComputeGrant(const Manifest& manifest, const ResolvedPolicy& policy);

    /// Invoke @p action on a started extension.
    [[nodiscard]] cpr::foundation::RuntimeResult<InvocationResult>
    Invoke(const std::shared_ptr<RegistryEntry>& entry, const std::string& action,
           const YAML::Node& input);

    /// Count a violation, publish extension.resource_limit_exceeded and
    /// notify the escalation callback.
    void RecordViolation(RegistryEntry& entry, const std::string& action,
                         const cpr::foundation::RuntimeError& error);

    void SetEscalationCallback(EscalationCallback callback);

    /// Worker request fields for @p entry; the action and input are left empty.
    [[nodiscard]] IsolatedInvocation InvocationFor(const RegistryEntry& entry) const;

    /// Cancel every open stream of @p entry.
    static void CancelStreams(RegistryEntry& entry);

    /// Number of streams of @p entry that are still open.
    [[nodiscard]] static std::size_t OpenStreamCount(RegistryEntry& entry);

private:
    cpr::foundation::RuntimeResult<ActionOutput>
    runInProcess(RegistryEntry& entry, const ActionSpec& spec, const YAML::Node& input);

    cpr::foundation::RuntimeResult<ActionOutput>
    runIsolated(RegistryEntry& entry, const ActionSpec& spec, const YAML::Node& input);

    std::shared_ptr<ActionStream> openStream(const std::shared_ptr<RegistryEntry>& entry,
                                             const std::string& action,
                                             std::unique_ptr<ChunkProducer> producer,
                                             std::shared_ptr<void> slot);

    HostPolicy policy_;
    EventBus& bus_;
    StreamSupervisor& supervisor_;
    IsolatedExecutor& isolation_;
    std::filesystem::path stateRoot_;

    std::mutex callbackMutex_;
    EscalationCallback escalation_;
    std::atomic<uint64_t> nextStreamId_{1};
};

}  // namespace cpr::plugin
