#pragma once

/// @file event_bus.hpp
/// @brief Host-wide event bus with string event types, priority ordering
///        and source filtering.

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cpr/foundation/types.hpp"

namespace cpr::plugin {

using cpr::foundation::SubscriptionId;

/// Source name used for events emitted by the runtime itself.
inline constexpr const char* kRuntimeEventSource = "runtime";

/// An event published on the bus.
struct Event {
    std::string type;     ///< Dotted type, e.g. "extension.started".
    std::string source;   ///< Publisher: an extension id or "runtime".
    YAML::Node payload;
    cpr::foundation::Clock::time_point timestamp = cpr::foundation::Clock::now();
};

using EventHandler = std::function<void(const Event&)>;

/// Options for a subscription.
struct SubscribeOptions {
    /// Higher priority handlers run first.
    int32_t priority = 0;

    /// Deliver only events whose source equals this value.
    std::optional<std::string> sourceFilter;
};

/// Event bus shared by the runtime and all extensions.
///
/// Subscriptions use a type pattern: an exact type, "*" for everything,
/// or "prefix.*" for every type below a prefix.  Handlers run
/// synchronously on the publishing thread in priority order (higher
/// first, subscription order within a priority).  A handler that throws
/// is logged and skipped; delivery to the remaining handlers continues.
///
/// Unsubscribe returns only once no other thread is still running the
/// removed handler, so whatever the handler captured may be destroyed
/// right after.  A handler may unsubscribe itself.
///
/// Usage:
/// @code
///   EventBus bus;
///   auto id = bus.Subscribe("extension.*", [](const Event& e) { ... },
///                           {.priority = 10});
///   bus.Publish({"extension.started", "runtime", payload});
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Subscribe @p handler to events matching @p pattern.
    SubscriptionId Subscribe(std::string pattern, EventHandler handler,
                             SubscribeOptions options = {});

    /// Remove a subscription and wait for its in-flight deliveries on
    /// other threads. Unknown ids are ignored.
    void Unsubscribe(SubscriptionId id);

    /// Remove all subscriptions, waiting as Unsubscribe does.
    void UnsubscribeAll();

    /// Deliver @p event to every matching handler.
    /// @return Number of handlers that ran without throwing.
    std::size_t Publish(const Event& event);

    /// Convenience overload stamping the current time.
    std::size_t Publish(std::string type, std::string source, YAML::Node payload = {});

    /// Total number of active subscriptions.
    [[nodiscard]] std::size_t HandlerCount() const;

    /// Number of subscriptions that would receive an event of @p type.
    [[nodiscard]] std::size_t HandlerCountFor(std::string_view type) const;

    /// True if @p pattern selects @p type.
    [[nodiscard]] static bool Matches(std::string_view pattern, std::string_view type);

private:
    /// Handler plus the threads currently inside it.
    struct Slot {
        explicit Slot(EventHandler h) : handler(std::move(h)) {}

        EventHandler handler;
        std::mutex mutex;
        std::condition_variable idle;
        bool active = true;
        std::vector<std::thread::id> running;
    };

    struct HandlerEntry {
        SubscriptionId id;
        std::string pattern;
        int32_t priority = 0;
        std::optional<std::string> sourceFilter;
        std::shared_ptr<Slot> slot;
    };

    /// Deactivate @p slot and block until only the calling thread runs it.
    static void retire(Slot& slot);

    /// Run @p entry's handler unless it was retired. Returns false if skipped.
    static bool deliver(const HandlerEntry& entry, const Event& event);

    /// Handlers kept sorted by priority (descending), then subscription order.
    std::vector<HandlerEntry> handlers_;
    uint64_t nextId_ = 1;
    mutable std::mutex mutex_;
};

} // namespace cpr::plugin
