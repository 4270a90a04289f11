/// @file extension_context.cpp
/// @brief EventHandle: permission-checked, source-stamped bus access for one extension.

#include "cpr/plugin/extension_context.hpp"

#include <algorithm>

#include "cpr/foundation/error_code.hpp"

using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

EventHandle::EventHandle(EventBus& bus, std::string extensionId, const PermissionGrant& grant)
    : bus_(bus), extensionId_(std::move(extensionId)), grant_(grant) {}

EventHandle::~EventHandle() {
    UnsubscribeAll();
}

RuntimeResult<void> EventHandle::Publish(std::string type, YAML::Node payload) {
    if (!grant_.Allows(kPermissionEventsPublish)) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::PermissionDenied,
            "extension '" + extensionId_ + "' lacks permission " + kPermissionEventsPublish));
    }
    if (type.empty() || type.starts_with("extension.")) {
        return RuntimeResult<void>::err(RuntimeError(
            ErrorCode::PermissionDenied, "event type '" + type + "' is reserved or empty"));
    }

    Event event;
    event.type = std::move(type);
    event.source = extensionId_;
    event.payload = std::move(payload);

    Forwarder forwarder;
    {
        std::lock_guard lock(mutex_);
        forwarder = forwarder_;
    }
    if (forwarder) {
        forwarder(event);
    }
    bus_.Publish(event);
    return RuntimeResult<void>::ok();
}

RuntimeResult<SubscriptionId> EventHandle::Subscribe(std::string pattern, EventHandler handler,
                                                     SubscribeOptions options) {
    if (!grant_.Allows(kPermissionEventsSubscribe)) {
        return RuntimeResult<SubscriptionId>::err(RuntimeError(
            ErrorCode::PermissionDenied,
            "extension '" + extensionId_ + "' lacks permission " + kPermissionEventsSubscribe));
    }
    {
        std::lock_guard lock(mutex_);
        if (subscriptionsDisabled_) {
            return RuntimeResult<SubscriptionId>::err(
                RuntimeError(ErrorCode::SubscriptionUnavailable, *subscriptionsDisabled_));
        }
    }
    auto id = bus_.Subscribe(std::move(pattern), std::move(handler), std::move(options));
    std::lock_guard lock(mutex_);
    subscriptions_.push_back(id);
    return RuntimeResult<SubscriptionId>::ok(id);
}

void EventHandle::Unsubscribe(SubscriptionId id) {
    {
        std::lock_guard lock(mutex_);
        auto it = std::find(subscriptions_.begin(), subscriptions_.end(), id);
        if (it == subscriptions_.end()) {
            return;
        }
        subscriptions_.erase(it);
    }
    bus_.Unsubscribe(id);
}

void EventHandle::UnsubscribeAll() {
    std::vector<SubscriptionId> ids;
    {
        std::lock_guard lock(mutex_);
        ids.swap(subscriptions_);
    }
    for (auto id : ids) {
        bus_.Unsubscribe(id);
    }
}

std::size_t EventHandle::SubscriptionCount() const {
    std::lock_guard lock(mutex_);
    return subscriptions_.size();
}

void EventHandle::SetForwarder(Forwarder forwarder) {
    std::lock_guard lock(mutex_);
    forwarder_ = std::move(forwarder);
}

void EventHandle::DisableSubscriptions(std::string reason) {
    std::lock_guard lock(mutex_);
    subscriptionsDisabled_ = std::move(reason);
}

}  // namespace cpr::plugin
