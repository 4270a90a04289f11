#pragma once

/// @file extension.hpp
/// @brief IExtension: the capability interface every extension implements.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/types.hpp"
#include "cpr/plugin/action_stream.hpp"
#include "cpr/plugin/extension_context.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cpr::plugin {

/// Extension API version.  Libraries built against a different version
/// are rejected by the loader.
constexpr uint32_t kExtensionApiVersion = 1;

/// One action invocation as seen by the extension.
struct ActionRequest {
    std::string action;
    YAML::Node input;
};

/// Per-invocation context: identity and the cooperative deadline.
class ActionContext {
public:
    ActionContext(std::string extensionId, std::string action,
                  std::optional<cpr::foundation::Clock::time_point> deadline = std::nullopt)
        : extensionId_(std::move(extensionId)), action_(std::move(action)), deadline_(deadline) {}

    /// True once the wall-clock limit for this invocation has passed.
    /// Long-running in-process actions should poll this and stop early.
    [[nodiscard]] bool DeadlineExceeded() const {
        return deadline_ && cpr::foundation::Clock::now() >= *deadline_;
    }

    [[nodiscard]] const std::optional<cpr::foundation::Clock::time_point>& Deadline() const noexcept {
        return deadline_;
    }

    [[nodiscard]] const std::string& ExtensionId() const noexcept { return extensionId_; }
    [[nodiscard]] const std::string& Action() const noexcept { return action_; }

private:
    std::string extensionId_;
    std::string action_;
    std::optional<cpr::foundation::Clock::time_point> deadline_;
};

/// What Dispatch() hands back: a terminal value or a chunk producer.
class ActionOutput {
public:
    static ActionOutput Value(YAML::Node value) {
        ActionOutput out;
        out.value_ = std::move(value);
        return out;
    }

    static ActionOutput Stream(std::unique_ptr<ChunkProducer> producer) {
        ActionOutput out;
        out.producer_ = std::move(producer);
        return out;
    }

    [[nodiscard]] bool IsStream() const noexcept { return producer_ != nullptr; }
    [[nodiscard]] const YAML::Node& value() const noexcept { return value_; }

    /// Take ownership of the producer (nullptr for values).
    [[nodiscard]] std::unique_ptr<ChunkProducer> TakeProducer() { return std::move(producer_); }

private:
    YAML::Node value_;
    std::unique_ptr<ChunkProducer> producer_;
};

/// Abstract base class for extensions.
///
/// Whether loaded from a shared library or registered statically, every
/// extension implements this interface.  The runtime drives the hooks in
/// order:
///
///   OnInitialize() → OnStart() → Dispatch()* → OnStop() → [OnStart() ...] → OnUnload()
///
/// Hooks may throw; the runtime converts exceptions into errors and moves
/// the extension to the ERROR state.
class IExtension {
public:
    virtual ~IExtension() = default;

    /// Names of all actions this instance can dispatch.  Must cover every
    /// action the manifest declares.
    [[nodiscard]] virtual std::vector<std::string> SupportedActions() const = 0;

    /// Called once after permissions are granted.
    /// @param ctx  Injected state, events, grant and host services.
    /// @return true on success, false to fail initialization.
    virtual bool OnInitialize(ExtensionContext& ctx) = 0;

    /// Called when the extension starts (and again on restart after stop).
    virtual bool OnStart() { return true; }

    /// Called when the extension stops.
    virtual void OnStop() {}

    /// Called just before the instance is destroyed.
    virtual void OnUnload() {}

    /// Run one action.
    virtual cpr::foundation::RuntimeResult<ActionOutput>
    Dispatch(const ActionRequest& request, ActionContext& ctx) = 0;
};

}  // namespace cpr::plugin
