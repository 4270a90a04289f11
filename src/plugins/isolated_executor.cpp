/// @file isolated_executor.cpp
/// @brief Worker process spawning, watchdog and the host side of the worker protocol.

#include "cpr/plugin/isolated_executor.hpp"

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"
#include "cpr/plugin/worker_protocol.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

using cpr::foundation::Clock;
using cpr::foundation::ErrorCode;
using cpr::foundation::LogCategory;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

constexpr int kExecFailedStatus = 127;
constexpr auto kExitGrace = std::chrono::milliseconds(500);

RuntimeError limitExceeded(const std::string& limit, const std::string& message) {
    return RuntimeError(ErrorCode::ResourceLimitExceeded, message, limit);
}

/// Child side of Spawn: wire the pipes to the well-known fds, apply the
/// rlimits and exec.  Never returns.
[[noreturn]] void execWorker(const std::filesystem::path& workerPath, const ResourceLimits& limits,
                             int requestRead, int responseWrite) {
    // Move above the target range first so dup2 never sees src == dst.
    int in = fcntl(requestRead, F_DUPFD, 10);
    int out = fcntl(responseWrite, F_DUPFD, 10);
    if (in < 0 || out < 0 || dup2(in, worker::kRequestFd) < 0 ||
        dup2(out, worker::kResponseFd) < 0) {
        _exit(kExecFailedStatus);
    }
    close(in);
    close(out);

    if (limits.HasCpuLimit()) {
        auto seconds = static_cast<rlim_t>((limits.cpuTime.count() + 999) / 1000);
        struct rlimit cpu;
        cpu.rlim_cur = seconds;
        cpu.rlim_max = seconds + 1;
        setrlimit(RLIMIT_CPU, &cpu);
    }
    if (limits.memoryBytes > 0) {
        struct rlimit mem;
        mem.rlim_cur = static_cast<rlim_t>(limits.memoryBytes);
        mem.rlim_max = static_cast<rlim_t>(limits.memoryBytes);
        setrlimit(RLIMIT_AS, &mem);
    }

    signal(SIGPIPE, SIG_DFL);
    execl(workerPath.c_str(), workerPath.c_str(), static_cast<char*>(nullptr));
    _exit(kExecFailedStatus);
}

/// Translate how a worker ended into an error.
RuntimeError classifyExit(const WorkerProcess& worker, int status, const ResourceLimits& limits) {
    if (worker.KilledByHost()) {
        return limitExceeded("wall_clock", "wall-clock limit exceeded; worker killed");
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        bool cpuSpent = limits.HasCpuLimit() && worker.CpuTime() >= limits.cpuTime;
        if (sig == SIGXCPU || (sig == SIGKILL && cpuSpent)) {
            return limitExceeded("cpu_time", "CPU time limit exceeded");
        }
        return RuntimeError(ErrorCode::IsolationFailure,
                            "worker terminated by signal " + std::to_string(sig));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == kExecFailedStatus) {
        return RuntimeError(ErrorCode::IsolationFailure, "worker could not be started");
    }
    return RuntimeError(ErrorCode::IsolationFailure,
                        "worker exited unexpectedly with status " +
                            std::to_string(WIFEXITED(status) ? WEXITSTATUS(status) : -1));
}

/// Wait for the next non-event response, forwarding events to @p sink.
/// Kills the worker on a wall-clock breach; classifies a dead worker.
RuntimeResult<YAML::Node> awaitResponse(WorkerProcess& worker, const ResourceLimits& limits,
                                        const std::string& extensionId, const EventSink& sink) {
    std::optional<Clock::time_point> deadline;
    if (limits.HasWallClockLimit()) {
        deadline = Clock::now() + limits.wallClock;
    }

    for (;;) {
        auto message = worker.Receive(deadline);
        if (message.hasError()) {
            const auto& error = message.error();
            if (error.code() == ErrorCode::ResourceLimitExceeded) {
                worker.Kill();
                return RuntimeResult<YAML::Node>::err(classifyExit(worker, 0, limits));
            }
            int status = worker.Reap(kExitGrace);
            return RuntimeResult<YAML::Node>::err(classifyExit(worker, status, limits));
        }

        auto& node = message.value();
        auto type = node["type"].as<std::string>("");
        if (type == worker::kEvent) {
            if (sink) {
                Event event;
                event.type = node["event_type"].as<std::string>("");
                event.source = extensionId;
                event.payload = node["payload"];
                sink(event);
            }
            continue;
        }
        if (type == worker::kError) {
            auto error = worker::DecodeError(node);
            if (error.code() == ErrorCode::ResourceLimitExceeded) {
                worker.Kill();
            }
            return RuntimeResult<YAML::Node>::err(std::move(error));
        }
        return message;
    }
}

/// Stream producer backed by a live worker.  Each Next() sends `next`
/// and waits for one chunk under the wall-clock limit.
class WorkerStreamProducer final : public ChunkProducer {
public:
    WorkerStreamProducer(std::unique_ptr<WorkerProcess> worker, ResourceLimits limits,
                         std::string extensionId, EventSink sink)
        : worker_(std::move(worker)),
          limits_(limits),
          extensionId_(std::move(extensionId)),
          sink_(std::move(sink)) {}

    ChunkResult Next() override {
        if (!worker_) {
            return ChunkResult::ok(std::nullopt);
        }
        if (auto sent = worker_->Send(worker::Message(worker::kNext)); sent.hasError()) {
            int status = worker_->Reap(kExitGrace);
            auto error = classifyExit(*worker_, status, limits_);
            worker_.reset();
            return ChunkResult::err(std::move(error));
        }

        auto response = awaitResponse(*worker_, limits_, extensionId_, sink_);
        if (response.hasError()) {
            worker_.reset();
            return ChunkResult::err(response.error());
        }

        auto& node = response.value();
        auto type = node["type"].as<std::string>("");
        if (type == worker::kChunk) {
            return ChunkResult::ok(std::optional<YAML::Node>(node["value"]));
        }
        if (type == worker::kEnd) {
            worker_->Reap(kExitGrace);
            worker_.reset();
            return ChunkResult::ok(std::nullopt);
        }
        worker_.reset();
        return ChunkResult::err(RuntimeError(ErrorCode::IsolationFailure,
                                             "unexpected worker message '" + type + "'"));
    }

    void Release() override {
        if (!worker_) {
            return;
        }
        if (auto sent = worker_->Send(worker::Message(worker::kTerminate)); sent.hasError()) {
            CPR_LOG_DEBUG(LogCategory::Isolation,
                          "terminate not delivered to worker of '" + extensionId_ +
                              "': " + std::string(sent.error().message()));
        }
        worker_.reset();
    }

private:
    std::unique_ptr<WorkerProcess> worker_;
    ResourceLimits limits_;
    std::string extensionId_;
    EventSink sink_;
};

/// Fields shared by every request that instantiates the extension.
YAML::Node sessionRequest(const char* type, const IsolatedInvocation& invocation) {
    auto request = worker::Message(type);
    request["extension_id"] = invocation.extensionId;
    request["version"] = invocation.version;
    request["library"] = invocation.library.string();
    request["symbol"] = invocation.factorySymbol;
    request["extension_dir"] = invocation.extensionDir.string();
    request["state_root"] = invocation.stateRoot.string();
    request["grant"] = invocation.grant;
    request["actions"] = invocation.declaredActions;
    return request;
}

}  // namespace

// ── WorkerProcess ───────────────────────────────────────────────────────

RuntimeResult<std::unique_ptr<WorkerProcess>> WorkerProcess::Spawn(
    const std::filesystem::path& workerPath, const ResourceLimits& limits) {
    using SpawnResult = RuntimeResult<std::unique_ptr<WorkerProcess>>;

    if (!std::filesystem::exists(workerPath)) {
        return SpawnResult::err(RuntimeError(ErrorCode::IsolationFailure,
                                             "worker executable not found: " + workerPath.string()));
    }

    int request[2];
    int response[2];
    if (pipe2(request, O_CLOEXEC) != 0) {
        return SpawnResult::err(RuntimeError(ErrorCode::IsolationFailure,
                                             std::string("pipe failed: ") + std::strerror(errno)));
    }
    if (pipe2(response, O_CLOEXEC) != 0) {
        close(request[0]);
        close(request[1]);
        return SpawnResult::err(RuntimeError(ErrorCode::IsolationFailure,
                                             std::string("pipe failed: ") + std::strerror(errno)));
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {request[0], request[1], response[0], response[1]}) {
            close(fd);
        }
        return SpawnResult::err(RuntimeError(ErrorCode::IsolationFailure,
                                             std::string("fork failed: ") + std::strerror(errno)));
    }
    if (pid == 0) {
        execWorker(workerPath, limits, request[0], response[1]);
    }

    close(request[0]);
    close(response[1]);
    CPR_LOG_DEBUG(LogCategory::Isolation, "spawned worker pid " + std::to_string(pid));
    return SpawnResult::ok(
        std::unique_ptr<WorkerProcess>(new WorkerProcess(pid, request[1], response[0])));
}

WorkerProcess::~WorkerProcess() {
    Reap(kExitGrace);
}

RuntimeResult<void> WorkerProcess::Send(const YAML::Node& message) {
    if (toWorker_ < 0) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::IsolationFailure, "worker request pipe closed"));
    }
    return worker::WriteFrame(toWorker_, message);
}

RuntimeResult<YAML::Node> WorkerProcess::Receive(std::optional<Clock::time_point> deadline) {
    if (fromWorker_ < 0) {
        return RuntimeResult<YAML::Node>::err(
            RuntimeError(ErrorCode::IsolationFailure, "worker response pipe closed"));
    }
    return worker::ReadFrame(fromWorker_, deadline);
}

void WorkerProcess::Kill() {
    if (reaped_) {
        return;
    }
    killedByHost_ = true;
    kill(pid_, SIGKILL);
    closePipes();
    waitFor(0);
    CPR_LOG_WARN(LogCategory::Isolation, "killed worker pid " + std::to_string(pid_));
}

int WorkerProcess::Reap(std::chrono::milliseconds grace) {
    if (reaped_) {
        return status_;
    }
    // EOF on the request pipe tells a well-behaved worker to exit.
    closePipes();

    auto until = Clock::now() + grace;
    while (!waitFor(WNOHANG)) {
        if (Clock::now() >= until) {
            kill(pid_, SIGKILL);
            waitFor(0);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return status_;
}

bool WorkerProcess::waitFor(int options) {
    for (;;) {
        pid_t r = wait4(pid_, &status_, options, &usage_);
        if (r == pid_ || (r < 0 && errno != EINTR)) {
            reaped_ = true;
            return true;
        }
        if (r == 0) {
            return false;  // WNOHANG and still running
        }
    }
}

std::chrono::milliseconds WorkerProcess::CpuTime() const noexcept {
    auto millis = [](const timeval& tv) {
        return static_cast<int64_t>(tv.tv_sec) * 1000 + static_cast<int64_t>(tv.tv_usec) / 1000;
    };
    return std::chrono::milliseconds(millis(usage_.ru_utime) + millis(usage_.ru_stime));
}

void WorkerProcess::closePipes() {
    if (toWorker_ >= 0) {
        close(toWorker_);
        toWorker_ = -1;
    }
    if (fromWorker_ >= 0) {
        close(fromWorker_);
        fromWorker_ = -1;
    }
}

// ── IsolatedExecutor ────────────────────────────────────────────────────

IsolatedExecutor::IsolatedExecutor(std::filesystem::path workerPath)
    : workerPath_(std::move(workerPath)) {
    // A worker dying mid-write must surface as EPIPE, not kill the host.
    signal(SIGPIPE, SIG_IGN);
}

RuntimeResult<ActionOutput> IsolatedExecutor::Invoke(const IsolatedInvocation& invocation,
                                                     EventSink sink) {
    auto spawned = WorkerProcess::Spawn(workerPath_, invocation.limits);
    if (spawned.hasError()) {
        return RuntimeResult<ActionOutput>::err(spawned.error());
    }
    auto worker = std::move(spawned).value();

    auto request = sessionRequest(worker::kInvoke, invocation);
    request["action"] = invocation.action;
    request["input"] = invocation.input;

    if (auto sent = worker->Send(request); sent.hasError()) {
        int status = worker->Reap(kExitGrace);
        return RuntimeResult<ActionOutput>::err(classifyExit(*worker, status, invocation.limits));
    }

    auto response = awaitResponse(*worker, invocation.limits, invocation.extensionId, sink);
    if (response.hasError()) {
        return RuntimeResult<ActionOutput>::err(response.error());
    }

    auto& node = response.value();
    auto type = node["type"].as<std::string>("");
    if (type == worker::kValue) {
        return RuntimeResult<ActionOutput>::ok(ActionOutput::Value(node["value"]));
    }
    if (type == worker::kStream) {
        return RuntimeResult<ActionOutput>::ok(ActionOutput::Stream(
            std::make_unique<WorkerStreamProducer>(std::move(worker), invocation.limits,
                                                   invocation.extensionId, std::move(sink))));
    }
    return RuntimeResult<ActionOutput>::err(RuntimeError(
        ErrorCode::IsolationFailure, "unexpected worker message '" + type + "'"));
}

RuntimeResult<void> IsolatedExecutor::RunHooks(const IsolatedInvocation& invocation,
                                               IsolatedHookStage stage, EventSink sink) {
    auto spawned = WorkerProcess::Spawn(workerPath_, invocation.limits);
    if (spawned.hasError()) {
        return RuntimeResult<void>::err(spawned.error());
    }
    auto worker = std::move(spawned).value();

    auto request = sessionRequest(worker::kLifecycle, invocation);
    request["stage"] = stage == IsolatedHookStage::Start ? "start" : "initialize";
    if (auto sent = worker->Send(request); sent.hasError()) {
        int status = worker->Reap(kExitGrace);
        return RuntimeResult<void>::err(classifyExit(*worker, status, invocation.limits));
    }

    auto response = awaitResponse(*worker, invocation.limits, invocation.extensionId, sink);
    if (response.hasError()) {
        return RuntimeResult<void>::err(response.error());
    }
    worker->Reap(kExitGrace);
    return RuntimeResult<void>::ok();
}

RuntimeResult<std::vector<std::string>> IsolatedExecutor::Describe(
    const std::filesystem::path& library, const std::string& factorySymbol,
    const ResourceLimits& limits) {
    using DescribeResult = RuntimeResult<std::vector<std::string>>;

    auto spawned = WorkerProcess::Spawn(workerPath_, limits);
    if (spawned.hasError()) {
        return DescribeResult::err(spawned.error());
    }
    auto worker = std::move(spawned).value();

    auto request = worker::Message(worker::kDescribe);
    request["library"] = library.string();
    request["symbol"] = factorySymbol;
    if (auto sent = worker->Send(request); sent.hasError()) {
        int status = worker->Reap(kExitGrace);
        return DescribeResult::err(classifyExit(*worker, status, limits));
    }

    auto response = awaitResponse(*worker, limits, {}, {});
    if (response.hasError()) {
        return DescribeResult::err(response.error());
    }
    try {
        return DescribeResult::ok(response.value()["value"].as<std::vector<std::string>>());
    } catch (const YAML::Exception& e) {
        return DescribeResult::err(RuntimeError(
            ErrorCode::IsolationFailure, std::string("malformed describe reply: ") + e.what()));
    }
}

}  // namespace cpr::plugin
