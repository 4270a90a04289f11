/// @file extension_runtime.cpp
/// @brief ExtensionRuntime implementation: component wiring, scan and invocation.

#include "cpr/plugin/extension_runtime.hpp"

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/runtime_logger.hpp"

using cpr::foundation::ConfigManager;
using cpr::foundation::ErrorCode;
using cpr::foundation::LogCategory;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

constexpr const char* kWorkerExecutable = "cpr_extension_worker";

}  // namespace

// ── RuntimeOptions ──────────────────────────────────────────────────────

RuntimeOptions RuntimeOptions::FromConfig(const ConfigManager& config) {
    RuntimeOptions opts;

    auto dirs = config.get<std::vector<std::string>>("runtime.plugin_dirs");
    if (dirs) {
        for (const auto& d : dirs.value()) {
            opts.pluginDirs.emplace_back(d);
        }
    }

    auto stateDir = config.get<std::string>("runtime.state_dir");
    if (stateDir) {
        opts.stateDir = stateDir.value();
    }

    auto policy = config.get<std::string>("runtime.policy_file");
    if (policy && !policy.value().empty()) {
        opts.policyFile = std::filesystem::path(policy.value());
    }

    auto worker = config.get<std::string>("runtime.worker_path");
    if (worker) {
        opts.workerPath = worker.value();
    }

    auto idle = config.get<int64_t>("runtime.stream_idle_timeout_ms");
    if (idle && idle.value() > 0) {
        opts.streamIdleTimeout = std::chrono::milliseconds(idle.value());
    }

    auto threads = config.get<unsigned int>("runtime.discovery_threads");
    if (threads && threads.value() > 0) {
        opts.discoveryThreads = threads.value();
    }

    return opts;
}

// ── Construction / destruction ──────────────────────────────────────────

ExtensionRuntime::ExtensionRuntime(RuntimeOptions options) : options_(std::move(options)) {}

ExtensionRuntime::~ExtensionRuntime() {
    Shutdown();
}

std::filesystem::path ExtensionRuntime::DefaultWorkerPath() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return kWorkerExecutable;
    }
    return self.parent_path() / kWorkerExecutable;
}

RuntimeResult<void> ExtensionRuntime::Init() {
    if (initialized_) {
        return RuntimeResult<void>::ok();
    }

    store_ = std::make_unique<StateStore>(options_.stateDir);
    if (auto r = store_->Init(); r.hasError()) {
        CPR_LOG_ERROR(LogCategory::Core, "state storage unavailable: " + r.error().describe());
        return r;
    }

    HostPolicy policy;
    if (options_.policyFile) {
        auto loaded = HostPolicy::Load(*options_.policyFile);
        if (loaded.hasError()) {
            CPR_LOG_ERROR(LogCategory::Security, loaded.error().describe());
            return RuntimeResult<void>::err(loaded.error());
        }
        policy = std::move(loaded).value();
        CPR_LOG_INFO(LogCategory::Security,
                     "loaded host policy from " + options_.policyFile->string());
    } else {
        CPR_LOG_WARN(LogCategory::Security,
                     "no host policy configured; all extensions run trusted without limits");
    }

    auto workerPath = options_.workerPath.empty() ? DefaultWorkerPath() : options_.workerPath;

    scheduler_ = std::make_unique<cpr::foundation::JobScheduler>(options_.discoveryThreads);
    isolation_ = std::make_unique<IsolatedExecutor>(std::move(workerPath));
    supervisor_ = std::make_unique<StreamSupervisor>(options_.streamIdleTimeout);
    security_ = std::make_unique<SecurityManager>(std::move(policy), bus_, *supervisor_,
                                                  *isolation_, store_->Root());
    lifecycle_ = std::make_unique<LifecycleManager>(registry_, loader_, *isolation_, *security_,
                                                    *store_, bus_, services_);
    supervisor_->Start();

    initialized_ = true;
    CPR_LOG_INFO(LogCategory::Core, "extension runtime initialized (state: " +
                                        store_->Root().string() + ")");
    return RuntimeResult<void>::ok();
}

RuntimeResult<void> ExtensionRuntime::requireInit() const {
    if (!initialized_) {
        return RuntimeResult<void>::err(
            RuntimeError(ErrorCode::InvalidArgument, "extension runtime is not initialized"));
    }
    return RuntimeResult<void>::ok();
}

// ── Scan ────────────────────────────────────────────────────────────────

RuntimeResult<ScanReport> ExtensionRuntime::Scan() {
    if (auto ready = requireInit(); ready.hasError()) {
        return RuntimeResult<ScanReport>::err(ready.error());
    }

    ScanReport report;
    report.discovery = Discovery(scheduler_.get()).Scan(options_.pluginDirs);

    for (auto& found : report.discovery.accepted) {
        const auto id = found.manifest.id;

        if (auto existing = registry_.Find(id);
            existing && existing->state.load() != LifecycleState::Unloaded) {
            if (existing->extensionDir == found.directory) {
                report.unchanged.push_back(id);
                continue;
            }
            CPR_LOG_WARN(LogCategory::Discovery,
                         "duplicate extension id '" + id + "': keeping " +
                             existing->manifest.version + " at " + existing->extensionDir.string() +
                             ", ignoring " + found.manifest.version + " at " +
                             found.directory.string());
            report.discovery.duplicates.push_back({id, existing->manifest.version,
                                                   existing->extensionDir, found.manifest.version,
                                                   found.directory});
            continue;
        }

        auto registered = lifecycle_->Register(found.manifest, found.directory, found.manifestPath);
        if (registered.hasError()) {
            CPR_LOG_WARN(LogCategory::Discovery, registered.error().describe());
            continue;
        }
        report.registered.push_back(id);
    }
    return RuntimeResult<ScanReport>::ok(std::move(report));
}

// ── Lifecycle pass-throughs ─────────────────────────────────────────────

RuntimeResult<void> ExtensionRuntime::Initialize(std::string_view id) {
    if (auto ready = requireInit(); ready.hasError()) {
        return ready;
    }
    return lifecycle_->Initialize(id);
}

RuntimeResult<void> ExtensionRuntime::Start(std::string_view id) {
    if (auto ready = requireInit(); ready.hasError()) {
        return ready;
    }
    return lifecycle_->Start(id);
}

RuntimeResult<void> ExtensionRuntime::Stop(std::string_view id) {
    if (auto ready = requireInit(); ready.hasError()) {
        return ready;
    }
    return lifecycle_->Stop(id);
}

RuntimeResult<void> ExtensionRuntime::Unload(std::string_view id) {
    if (auto ready = requireInit(); ready.hasError()) {
        return ready;
    }
    return lifecycle_->Unload(id);
}

RuntimeResult<void> ExtensionRuntime::Uninstall(std::string_view id) {
    if (auto ready = requireInit(); ready.hasError()) {
        return ready;
    }
    return lifecycle_->Uninstall(id);
}

BatchReport ExtensionRuntime::InitializeAll() {
    return initialized_ ? lifecycle_->InitializeAll() : BatchReport{};
}

BatchReport ExtensionRuntime::StartAll() {
    return initialized_ ? lifecycle_->StartAll() : BatchReport{};
}

// ── Invocation ──────────────────────────────────────────────────────────

RuntimeResult<InvocationResult> ExtensionRuntime::Invoke(std::string_view id,
                                                         const std::string& action,
                                                         const YAML::Node& input) {
    if (auto ready = requireInit(); ready.hasError()) {
        return RuntimeResult<InvocationResult>::err(ready.error());
    }
    auto entry = registry_.Find(id);
    if (!entry) {
        return RuntimeResult<InvocationResult>::err(
            RuntimeError(ErrorCode::ExtensionNotFound, "extension not found: " + std::string(id)));
    }
    return security_->Invoke(entry, action, input);
}

// ── Shutdown ────────────────────────────────────────────────────────────

void ExtensionRuntime::Shutdown() {
    if (!initialized_) {
        return;
    }
    lifecycle_->Shutdown();
    supervisor_->Stop();
    initialized_ = false;
    CPR_LOG_INFO(LogCategory::Core, "extension runtime shut down");
    cpr::foundation::RuntimeLogger::instance().flush();
}

}  // namespace cpr::plugin
