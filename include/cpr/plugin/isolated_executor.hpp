#pragma once

/// @file isolated_executor.hpp
/// @brief Runs actions of untrusted extensions in a separate worker process.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/types.hpp"
#include "cpr/plugin/event_bus.hpp"
#include "cpr/plugin/extension.hpp"
#include "cpr/plugin/host_policy.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace cpr::plugin {

/// Everything the worker needs to run one action.
struct IsolatedInvocation {
    std::string extensionId;
    std::string version;
    std::filesystem::path library;
    std::string factorySymbol;
    std::filesystem::path extensionDir;
    std::filesystem::path stateRoot;
    std::vector<std::string> grant;
    std::vector<std::string> declaredActions;
    std::string action;
    YAML::Node input;
    ResourceLimits limits;
};

/// How far RunHooks drives a fresh instance before tearing it down.
enum class IsolatedHookStage : uint8_t {
    Initialize,  ///< OnInitialize()
    Start,       ///< OnInitialize(), then OnStart()
};

/// Receives events published by the isolated extension.
using EventSink = std::function<void(const Event&)>;

/// One forked+exec'd worker process and its two pipes.
///
/// The child gets RLIMIT_CPU and RLIMIT_AS from the resource limits
/// before exec.  Destroying the handle closes the request pipe, gives the
/// worker a short grace period to exit, then kills and reaps it.
class WorkerProcess {
public:
    [[nodiscard]] static cpr::foundation::RuntimeResult<std::unique_ptr<WorkerProcess>>
    Spawn(const std::filesystem::path& workerPath, const ResourceLimits& limits);

    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    [[nodiscard]] cpr::foundation::RuntimeResult<void> Send(const YAML::Node& message);

    /// Read the next message from the worker, up to @p deadline.
    [[nodiscard]] cpr::foundation::RuntimeResult<YAML::Node>
    Receive(std::optional<cpr::foundation::Clock::time_point> deadline);

    /// SIGKILL the worker and reap it.
    void Kill();

    /// Reap the worker, killing it if it does not exit within @p grace.
    /// @return The raw wait status.
    int Reap(std::chrono::milliseconds grace);

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] bool KilledByHost() const noexcept { return killedByHost_; }

    /// User plus system CPU time the worker consumed.  Valid once reaped.
    [[nodiscard]] std::chrono::milliseconds CpuTime() const noexcept;

private:
    WorkerProcess(pid_t pid, int toWorker, int fromWorker)
        : pid_(pid), toWorker_(toWorker), fromWorker_(fromWorker) {}

    void closePipes();
    bool waitFor(int options);

    pid_t pid_;
    int toWorker_;
    int fromWorker_;
    bool reaped_ = false;
    bool killedByHost_ = false;
    int status_ = 0;
    struct rusage usage_ {};
};

/// Spawns a fresh worker per invocation and speaks the worker protocol.
///
/// Enforcement inside the isolation boundary:
///   - CPU time: RLIMIT_CPU in the worker (SIGXCPU, then SIGKILL at the hard limit).
///   - Memory:   RLIMIT_AS in the worker; allocation failure is reported back.
///   - Wall clock: a host-side deadline on every response (each pull for
///     streams); breach SIGKILLs the worker.
/// All three surface as ResourceLimitExceeded with the limit name
/// ("cpu_time", "memory", "wall_clock") as std::string context.  A worker
/// SIGKILLed before using up its CPU allowance (e.g. by the OOM killer)
/// is an IsolationFailure.
class IsolatedExecutor {
public:
    explicit IsolatedExecutor(std::filesystem::path workerPath);

    /// Run an action.  Streams keep their worker alive until the stream closes.
    [[nodiscard]] cpr::foundation::RuntimeResult<ActionOutput>
    Invoke(const IsolatedInvocation& invocation, EventSink sink);

    /// Run the lifecycle hooks up to @p stage in a fresh worker, then the
    /// matching stop and unload hooks.  The action and input of
    /// @p invocation are ignored.
    /// @return The hook's failure (ExtensionInitFailed/ExtensionStartFailed),
    ///         or a limit or isolation error from the worker.
    [[nodiscard]] cpr::foundation::RuntimeResult<void>
    RunHooks(const IsolatedInvocation& invocation, IsolatedHookStage stage, EventSink sink);

    /// Instantiate the library in a throwaway worker and return the
    /// actions it supports.  Used to validate isolated extensions at load
    /// time without opening their code in the host.
    [[nodiscard]] cpr::foundation::RuntimeResult<std::vector<std::string>>
    Describe(const std::filesystem::path& library, const std::string& factorySymbol,
             const ResourceLimits& limits);

    [[nodiscard]] const std::filesystem::path& WorkerPath() const noexcept { return workerPath_; }

private:
    std::filesystem::path workerPath_;
};

}  // namespace cpr::plugin
