/// @file event_bus.cpp
/// @brief EventBus subscription management and delivery.

#include "cpr/plugin/event_bus.hpp"

#include <algorithm>
#include <exception>

#include "cpr/foundation/runtime_logger.hpp"

using cpr::foundation::LogCategory;

namespace cpr::plugin {

bool EventBus::Matches(std::string_view pattern, std::string_view type) {
    if (pattern == "*") {
        return true;
    }
    if (pattern.size() >= 2 && pattern.ends_with(".*")) {
        auto prefix = pattern.substr(0, pattern.size() - 1);  // keep the dot
        return type.size() > prefix.size() && type.starts_with(prefix);
    }
    return pattern == type;
}

SubscriptionId EventBus::Subscribe(std::string pattern, EventHandler handler,
                                   SubscribeOptions options) {
    std::lock_guard lock(mutex_);

    SubscriptionId id(nextId_++);
    HandlerEntry entry{id, std::move(pattern), options.priority,
                       std::move(options.sourceFilter), std::make_shared<Slot>(std::move(handler))};

    // Insert after every entry with priority >= ours to stay stable.
    auto pos = std::find_if(handlers_.begin(), handlers_.end(), [&](const HandlerEntry& e) {
        return e.priority < entry.priority;
    });
    handlers_.insert(pos, std::move(entry));
    return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
    std::shared_ptr<Slot> removed;
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(handlers_.begin(), handlers_.end(),
                               [id](const HandlerEntry& e) { return e.id == id; });
        if (it == handlers_.end()) {
            return;
        }
        removed = std::move(it->slot);
        handlers_.erase(it);
    }
    retire(*removed);
}

void EventBus::UnsubscribeAll() {
    std::vector<HandlerEntry> removed;
    {
        std::lock_guard lock(mutex_);
        removed.swap(handlers_);
    }
    for (auto& entry : removed) {
        retire(*entry.slot);
    }
}

void EventBus::retire(Slot& slot) {
    auto self = std::this_thread::get_id();
    std::unique_lock lock(slot.mutex);
    slot.active = false;
    slot.idle.wait(lock, [&] {
        return std::all_of(slot.running.begin(), slot.running.end(),
                           [self](std::thread::id t) { return t == self; });
    });
}

bool EventBus::deliver(const HandlerEntry& entry, const Event& event) {
    auto& slot = *entry.slot;
    auto self = std::this_thread::get_id();
    {
        std::lock_guard lock(slot.mutex);
        if (!slot.active) {
            return false;
        }
        slot.running.push_back(self);
    }

    bool ok = false;
    try {
        slot.handler(event);
        ok = true;
    } catch (const std::exception& e) {
        CPR_LOG_ERROR(LogCategory::Events,
                      "handler " + std::to_string(entry.id.value()) + " for '" + event.type +
                          "' threw: " + e.what());
    } catch (...) {
        CPR_LOG_ERROR(LogCategory::Events,
                      "handler " + std::to_string(entry.id.value()) + " for '" + event.type +
                          "' threw a non-standard exception");
    }

    {
        std::lock_guard lock(slot.mutex);
        slot.running.erase(std::find(slot.running.begin(), slot.running.end(), self));
    }
    slot.idle.notify_all();
    return ok;
}

std::size_t EventBus::Publish(const Event& event) {
    // Snapshot so handlers may subscribe/unsubscribe during delivery.
    std::vector<HandlerEntry> snapshot;
    {
        std::lock_guard lock(mutex_);
        for (const auto& entry : handlers_) {
            if (!Matches(entry.pattern, event.type)) {
                continue;
            }
            if (entry.sourceFilter && *entry.sourceFilter != event.source) {
                continue;
            }
            snapshot.push_back(entry);
        }
    }

    std::size_t delivered = 0;
    for (const auto& entry : snapshot) {
        if (deliver(entry, event)) {
            ++delivered;
        }
    }
    return delivered;
}

std::size_t EventBus::Publish(std::string type, std::string source, YAML::Node payload) {
    Event event;
    event.type = std::move(type);
    event.source = std::move(source);
    event.payload = std::move(payload);
    return Publish(event);
}

std::size_t EventBus::HandlerCount() const {
    std::lock_guard lock(mutex_);
    return handlers_.size();
}

std::size_t EventBus::HandlerCountFor(std::string_view type) const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        handlers_.begin(), handlers_.end(),
        [&](const HandlerEntry& e) { return Matches(e.pattern, type); }));
}

} // namespace cpr::plugin
