/// @file main.cpp
/// @brief Isolated extension worker entry point.
///
/// Spawned by IsolatedExecutor with the request pipe on fd 3 and the
/// response pipe on fd 4.  Runs exactly one request (describe, lifecycle
/// or invoke) and exits.  CPU and memory ceilings were applied by the host before
/// exec; the host also enforces the wall clock.

#include <cstdlib>
#include <iostream>
#include <memory>
#include <new>
#include <set>

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/service_locator.hpp"
#include "cpr/plugin/event_bus.hpp"
#include "cpr/plugin/extension.hpp"
#include "cpr/plugin/extension_context.hpp"
#include "cpr/plugin/extension_export.hpp"
#include "cpr/plugin/loader.hpp"
#include "cpr/plugin/state_store.hpp"
#include "cpr/plugin/worker_protocol.hpp"

using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;

namespace worker = cpr::plugin::worker;

namespace {

constexpr int kProtocolFailure = 2;

RuntimeError memoryExceeded() {
    return RuntimeError(ErrorCode::ResourceLimitExceeded, "memory limit exceeded",
                        std::string("memory"));
}

bool reply(const YAML::Node& message) {
    auto sent = worker::WriteFrame(worker::kResponseFd, message);
    if (sent.hasError()) {
        std::cerr << "worker: " << sent.error().message() << "\n";
        return false;
    }
    return true;
}

int replyError(const RuntimeError& error) {
    return reply(worker::ErrorMessage(error)) ? EXIT_FAILURE : kProtocolFailure;
}

cpr::plugin::EntryReference entryFrom(const YAML::Node& request) {
    cpr::plugin::EntryReference ref;
    ref.kind = cpr::plugin::EntryReference::Kind::SharedLibrary;
    ref.libraryPath = request["library"].as<std::string>();
    ref.factorySymbol = request["symbol"].as<std::string>(CPR_EXTENSION_FACTORY_SYMBOL);
    return ref;
}

int handleDescribe(const YAML::Node& request) {
    cpr::plugin::Manifest manifest;
    manifest.id = "describe";

    cpr::plugin::ExtensionLoader loader;
    auto instance = loader.Instantiate(entryFrom(request), manifest);
    if (instance.hasError()) {
        return replyError(instance.error());
    }

    auto message = worker::Message(worker::kValue);
    message["value"] = instance.value()->SupportedActions();
    return reply(message) ? EXIT_SUCCESS : kProtocolFailure;
}

/// Hosts one extension instance for the duration of one invocation.
class WorkerSession {
public:
    explicit WorkerSession(const YAML::Node& request)
        : request_(request),
          extensionId_(request["extension_id"].as<std::string>()),
          store_(request["state_root"].as<std::string>()) {}

    ~WorkerSession() { shutdown(); }

    WorkerSession(const WorkerSession&) = delete;
    WorkerSession& operator=(const WorkerSession&) = delete;

    int Run() {
        if (auto ready = start(); ready.hasError()) {
            return replyError(ready.error());
        }

        cpr::plugin::ActionRequest action{request_["action"].as<std::string>(),
                                          request_["input"]};
        cpr::plugin::ActionContext actx(extensionId_, action.action);

        auto output = [&]() -> cpr::foundation::RuntimeResult<cpr::plugin::ActionOutput> {
            try {
                return instance_->Dispatch(action, actx);
            } catch (const std::bad_alloc&) {
                return cpr::foundation::RuntimeResult<cpr::plugin::ActionOutput>::err(
                    memoryExceeded());
            } catch (const std::exception& e) {
                return cpr::foundation::fail<cpr::plugin::ActionOutput>(
                    ErrorCode::ActionFailed, std::string("action threw: ") + e.what());
            }
        }();
        if (output.hasError()) {
            return replyError(output.error());
        }

        if (!output.value().IsStream()) {
            auto message = worker::Message(worker::kValue);
            message["value"] = output.value().value();
            shutdown();
            return reply(message) ? EXIT_SUCCESS : kProtocolFailure;
        }

        auto producer = output.value().TakeProducer();
        if (!reply(worker::Message(worker::kStream))) {
            producer->Release();
            return kProtocolFailure;
        }
        int rc = serveStream(*producer);
        producer->Release();
        return rc;
    }

    /// Run OnInitialize (and OnStart for the "start" stage), then tear down.
    int RunHooks() {
        bool throughStart = request_["stage"].as<std::string>("start") == "start";
        if (auto ready = start(throughStart); ready.hasError()) {
            return replyError(ready.error());
        }
        shutdown();
        auto message = worker::Message(worker::kValue);
        message["value"] = throughStart ? "started" : "initialized";
        return reply(message) ? EXIT_SUCCESS : kProtocolFailure;
    }

private:
    cpr::foundation::RuntimeResult<void> start(bool throughStart = true) {
        if (auto init = store_.Init(); init.hasError()) {
            return init;
        }

        cpr::plugin::Manifest manifest;
        manifest.id = extensionId_;
        for (const auto& name : request_["actions"].as<std::vector<std::string>>(
                 std::vector<std::string>{})) {
            cpr::plugin::ActionSpec spec;
            spec.name = name;
            manifest.actions.push_back(std::move(spec));
        }

        auto instance = loader_.Instantiate(entryFrom(request_), manifest);
        if (instance.hasError()) {
            return cpr::foundation::RuntimeResult<void>::err(instance.error());
        }
        instance_ = std::move(instance).value();

        auto tokens = request_["grant"].as<std::vector<std::string>>(std::vector<std::string>{});
        grant_ = cpr::plugin::PermissionGrant(std::set<std::string>(tokens.begin(), tokens.end()));
        state_ = std::make_unique<cpr::plugin::StateHandle>(store_, extensionId_);
        events_ = std::make_unique<cpr::plugin::EventHandle>(bus_, extensionId_, grant_);
        events_->SetForwarder([](const cpr::plugin::Event& event) {
            auto message = worker::Message(worker::kEvent);
            message["event_type"] = event.type;
            message["payload"] = event.payload;
            reply(message);
        });
        // The worker lives for one request; host events never reach it.
        events_->DisableSubscriptions("extension '" + extensionId_ +
                                      "' is isolated and cannot subscribe to host events");

        context_.extensionId = extensionId_;
        context_.version = request_["version"].as<std::string>("");
        context_.extensionDir = request_["extension_dir"].as<std::string>("");
        context_.state = state_.get();
        context_.events = events_.get();
        context_.grant = &grant_;
        context_.services = &services_;

        try {
            if (!instance_->OnInitialize(context_)) {
                return cpr::foundation::fail<void>(ErrorCode::ExtensionInitFailed,
                                                   "OnInitialize returned false");
            }
            initialized_ = true;
            if (!throughStart) {
                return cpr::foundation::RuntimeResult<void>::ok();
            }
            if (!instance_->OnStart()) {
                return cpr::foundation::fail<void>(ErrorCode::ExtensionStartFailed,
                                                   "OnStart returned false");
            }
            started_ = true;
        } catch (const std::bad_alloc&) {
            return cpr::foundation::RuntimeResult<void>::err(memoryExceeded());
        } catch (const std::exception& e) {
            return cpr::foundation::fail<void>(ErrorCode::ExtensionInitFailed,
                                               std::string("hook threw: ") + e.what());
        }
        return cpr::foundation::RuntimeResult<void>::ok();
    }

    int serveStream(cpr::plugin::ChunkProducer& producer) {
        for (;;) {
            auto request = worker::ReadFrame(worker::kRequestFd);
            if (request.hasError()) {
                return EXIT_SUCCESS;  // host went away
            }
            auto type = request.value()["type"].as<std::string>("");
            if (type != worker::kNext) {
                return EXIT_SUCCESS;
            }

            cpr::plugin::ChunkResult chunk = [&]() -> cpr::plugin::ChunkResult {
                try {
                    return producer.Next();
                } catch (const std::bad_alloc&) {
                    return cpr::plugin::ChunkResult::err(memoryExceeded());
                } catch (const std::exception& e) {
                    return cpr::plugin::ChunkResult::err(RuntimeError(
                        ErrorCode::StreamConsumptionFailed, std::string("producer threw: ") + e.what()));
                }
            }();

            if (chunk.hasError()) {
                return replyError(chunk.error());
            }
            if (!chunk.value()) {
                shutdown();
                return reply(worker::Message(worker::kEnd)) ? EXIT_SUCCESS : kProtocolFailure;
            }
            auto message = worker::Message(worker::kChunk);
            message["value"] = *chunk.value();
            if (!reply(message)) {
                return kProtocolFailure;
            }
        }
    }

    /// Run the stop and unload hooks once.
    void shutdown() {
        if (!instance_ || finished_) {
            return;
        }
        finished_ = true;
        try {
            if (started_) {
                instance_->OnStop();
            }
            if (initialized_) {
                instance_->OnUnload();
            }
        } catch (const std::exception& e) {
            std::cerr << "worker: shutdown hook threw: " << e.what() << "\n";
        }
    }

    YAML::Node request_;
    std::string extensionId_;
    cpr::plugin::StateStore store_;
    cpr::plugin::EventBus bus_;
    cpr::foundation::ServiceLocator services_;
    cpr::plugin::PermissionGrant grant_;
    std::unique_ptr<cpr::plugin::StateHandle> state_;
    std::unique_ptr<cpr::plugin::EventHandle> events_;
    cpr::plugin::ExtensionContext context_;
    cpr::plugin::ExtensionLoader loader_;
    cpr::plugin::ExtensionPtr instance_;
    bool initialized_ = false;
    bool started_ = false;
    bool finished_ = false;
};

}  // namespace

int main() {
    auto request = worker::ReadFrame(worker::kRequestFd);
    if (request.hasError()) {
        std::cerr << "worker: " << request.error().message() << "\n";
        return kProtocolFailure;
    }

    try {
        auto type = request.value()["type"].as<std::string>("");
        if (type == worker::kDescribe) {
            return handleDescribe(request.value());
        }
        if (type == worker::kInvoke) {
            WorkerSession session(request.value());
            return session.Run();
        }
        if (type == worker::kLifecycle) {
            WorkerSession session(request.value());
            return session.RunHooks();
        }
        std::cerr << "worker: unexpected request '" << type << "'\n";
        return kProtocolFailure;
    } catch (const std::bad_alloc&) {
        return replyError(memoryExceeded());
    } catch (const YAML::Exception& e) {
        return replyError(RuntimeError(ErrorCode::IsolationFailure,
                                       std::string("malformed request: ") + e.what()));
    }
}
