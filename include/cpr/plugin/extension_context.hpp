#pragma once

/// @file extension_context.hpp
/// @brief Capabilities injected into an extension: state, events, grant, services.

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/service_locator.hpp"
#include "cpr/plugin/event_bus.hpp"
#include "cpr/plugin/state_store.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cpr::plugin {

/// Permission needed to publish events through an EventHandle.
inline constexpr const char* kPermissionEventsPublish = "events.publish";

/// Permission needed to subscribe through an EventHandle.
inline constexpr const char* kPermissionEventsSubscribe = "events.subscribe";

/// Host-authorized subset of an extension's declared permissions.
///
/// Computed once when the extension is initialized; immutable for that
/// activation.
class PermissionGrant {
public:
    PermissionGrant() = default;
    explicit PermissionGrant(std::set<std::string> tokens) : tokens_(std::move(tokens)) {}

    [[nodiscard]] bool Allows(std::string_view token) const {
        return tokens_.count(std::string(token)) > 0;
    }

    /// True if every token in @p required is granted.
    [[nodiscard]] bool AllowsAll(const std::vector<std::string>& required) const {
        for (const auto& t : required) {
            if (!Allows(t)) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] const std::set<std::string>& Tokens() const noexcept { return tokens_; }

private:
    std::set<std::string> tokens_;
};

/// Per-extension bridge to the host event bus.
///
/// Publishes with the extension id as source and tracks the extension's
/// subscriptions so the runtime can drop them on stop or unload.
/// Types under "extension." are reserved for the runtime.
class EventHandle {
public:
    /// Publisher used in place of a bus (the isolated worker forwards to the host).
    using Forwarder = std::function<void(const Event&)>;

    EventHandle(EventBus& bus, std::string extensionId, const PermissionGrant& grant);

    ~EventHandle();

    EventHandle(const EventHandle&) = delete;
    EventHandle& operator=(const EventHandle&) = delete;

    /// Publish an event. Requires the `events.publish` grant.
    [[nodiscard]] cpr::foundation::RuntimeResult<void> Publish(std::string type,
                                                               YAML::Node payload = {});

    /// Subscribe to a type pattern. Requires the `events.subscribe` grant.
    /// Fails with SubscriptionUnavailable once subscriptions are disabled.
    [[nodiscard]] cpr::foundation::RuntimeResult<SubscriptionId>
    Subscribe(std::string pattern, EventHandler handler, SubscribeOptions options = {});

    void Unsubscribe(SubscriptionId id);

    /// Drop every subscription made through this handle.
    void UnsubscribeAll();

    [[nodiscard]] std::size_t SubscriptionCount() const;

    /// Also hand every published event to @p forwarder.
    void SetForwarder(Forwarder forwarder);

    /// Reject every later Subscribe call with @p reason.
    void DisableSubscriptions(std::string reason);

    [[nodiscard]] const std::string& ExtensionId() const noexcept { return extensionId_; }

private:
    EventBus& bus_;
    std::string extensionId_;
    const PermissionGrant& grant_;
    Forwarder forwarder_;
    std::optional<std::string> subscriptionsDisabled_;
    mutable std::mutex mutex_;
    std::vector<SubscriptionId> subscriptions_;
};

/// Runtime context passed to an extension's OnInitialize hook.
///
/// The pointed-to objects are owned by the runtime and stay valid until
/// the extension is unloaded.
struct ExtensionContext {
    std::string extensionId;
    std::string version;
    std::filesystem::path extensionDir;
    StateHandle* state = nullptr;
    EventHandle* events = nullptr;
    const PermissionGrant* grant = nullptr;
    cpr::foundation::ServiceLocator* services = nullptr;
};

}  // namespace cpr::plugin
