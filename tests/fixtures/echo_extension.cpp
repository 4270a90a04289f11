/// @file echo_extension.cpp
/// @brief Shared-library extension used by the loader, security and
///        isolation tests.
///
/// Actions:
///   echo        return the input unchanged
///   count       stream the integers [0, n)
///   fail_after  stream n chunks, then fail
///   slow        sleep for `ms` milliseconds, then return "done"
///   burn        spin the CPU for `ms` milliseconds
///   alloc       allocate and touch `mb` MiB
///   big         return a string of `bytes` characters
///   publish     publish "echo.published" with the input as payload
///   save / load persist and read `key` through the state handle
///   subscribe   subscribe to `pattern` and report the outcome
///   crash       abort the process, or raise `signal` when given
///
/// A `refuse-init` or `refuse-start` file in the extension directory makes
/// the matching hook return false.

#include "cpr/plugin/extension_export.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;
using namespace cpr::plugin;

namespace {

using Output = RuntimeResult<ActionOutput>;

int intField(const YAML::Node& input, const char* key, int fallback) {
    if (input && input.IsMap() && input[key]) {
        return input[key].as<int>();
    }
    return fallback;
}

double threadCpuMillis() {
    timespec ts{};
    clock_gettime(CLOCK_THREAD_CPUTIME_ID, &ts);
    return static_cast<double>(ts.tv_sec) * 1000.0 + static_cast<double>(ts.tv_nsec) / 1.0e6;
}

class EchoExtension : public IExtension {
public:
    std::vector<std::string> SupportedActions() const override {
        return {"echo", "count", "fail_after", "slow", "burn", "alloc",
                "big",  "publish", "save", "load", "subscribe", "crash"};
    }

    bool OnInitialize(ExtensionContext& ctx) override {
        ctx_ = ctx;
        return !std::filesystem::exists(ctx.extensionDir / "refuse-init");
    }

    bool OnStart() override {
        return !std::filesystem::exists(ctx_.extensionDir / "refuse-start");
    }

    Output Dispatch(const ActionRequest& request, ActionContext& ctx) override {
        const auto& action = request.action;
        const auto& input = request.input;

        if (action == "echo") {
            return Output::ok(ActionOutput::Value(YAML::Clone(input)));
        }
        if (action == "count") {
            int n = intField(input, "n", 3);
            auto i = std::make_shared<int>(0);
            return Output::ok(ActionOutput::Stream(MakeGenerator([i, n]() -> ChunkResult {
                if (*i >= n) {
                    return ChunkResult::ok(std::nullopt);
                }
                return ChunkResult::ok(YAML::Node((*i)++));
            })));
        }
        if (action == "fail_after") {
            int n = intField(input, "n", 1);
            auto i = std::make_shared<int>(0);
            return Output::ok(ActionOutput::Stream(MakeGenerator([i, n]() -> ChunkResult {
                if (*i >= n) {
                    return ChunkResult::err(RuntimeError(ErrorCode::ActionFailed, "producer broke"));
                }
                return ChunkResult::ok(YAML::Node((*i)++));
            })));
        }
        if (action == "slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(intField(input, "ms", 100)));
            return Output::ok(ActionOutput::Value(YAML::Node("done")));
        }
        if (action == "burn") {
            double until = threadCpuMillis() + intField(input, "ms", 100);
            volatile unsigned long sink = 0;
            while (threadCpuMillis() < until) {
                for (int k = 0; k < 10000; ++k) {
                    sink = sink + static_cast<unsigned long>(k);
                }
                if (ctx.DeadlineExceeded()) {
                    break;
                }
            }
            return Output::ok(ActionOutput::Value(YAML::Node("burned")));
        }
        if (action == "alloc") {
            auto bytes = static_cast<std::size_t>(intField(input, "mb", 1)) * 1024 * 1024;
            std::vector<char> block(bytes, 'x');
            return Output::ok(ActionOutput::Value(YAML::Node(block.size())));
        }
        if (action == "big") {
            return Output::ok(ActionOutput::Value(
                YAML::Node(std::string(static_cast<std::size_t>(intField(input, "bytes", 1024)), 'a'))));
        }
        if (action == "publish") {
            if (ctx_.events == nullptr) {
                return Output::err(RuntimeError(ErrorCode::ActionFailed, "no event handle"));
            }
            auto published = ctx_.events->Publish("echo.published", YAML::Clone(input));
            if (!published) {
                return Output::err(published.error());
            }
            return Output::ok(ActionOutput::Value(YAML::Node("published")));
        }
        if (action == "save") {
            auto saved = ctx_.state->Save(input["key"].as<std::string>(), input["value"]);
            if (!saved) {
                return Output::err(saved.error());
            }
            return Output::ok(ActionOutput::Value(YAML::Node("saved")));
        }
        if (action == "load") {
            auto loaded = ctx_.state->Load(input["key"].as<std::string>());
            if (!loaded) {
                return Output::err(loaded.error());
            }
            return Output::ok(ActionOutput::Value(std::move(loaded).value()));
        }
        if (action == "subscribe") {
            auto subscribed = ctx_.events->Subscribe(input["pattern"].as<std::string>("*"),
                                                     [](const Event&) {});
            if (!subscribed) {
                return Output::err(subscribed.error());
            }
            return Output::ok(ActionOutput::Value(YAML::Node("subscribed")));
        }
        if (action == "crash") {
            if (int sig = intField(input, "signal", 0); sig != 0) {
                std::raise(sig);
            }
            std::abort();
        }
        return Output::err(RuntimeError(ErrorCode::ActionNotFound, "unknown action " + action));
    }

private:
    ExtensionContext ctx_;
};

}  // namespace

CPR_EXTENSION_EXPORT(EchoExtension)
