#pragma once

/// @file event_bus.hpp
/// @brief Topic-keyed publish/subscribe bus that every runtime component
/// reports state changes through.
///
/// Publishing is synchronous with priority ordering and per-subscriber
/// failure isolation. The bus belongs to one runtime and is used from the
/// thread that drives it.

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nrt::event {

/// Unique identifier for a subscription.
using SubscriptionId = uint64_t;

/// Type-erased subscriber callback.
using RawHandler = std::function<void(const std::any&)>;

/// Topic-keyed event bus.
///
/// Handlers are invoked in priority order (lower value = earlier). Within
/// the same priority, handlers run in subscription order. Publish iterates
/// a snapshot, so handlers may subscribe or unsubscribe while being called.
/// A handler that throws is logged and does not stop the others.
///
/// Usage:
/// @code
///   EventBus bus;
///
///   auto id = bus.Subscribe<AttributeChanged>(
///       topics::kAttributeChanged,
///       [](const AttributeChanged& e) { /* react */ });
///
///   bus.Publish(topics::kAttributeChanged, AttributeChanged{...});
///
///   bus.Unsubscribe(id);
/// @endcode
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // -- Subscribe ------------------------------------------------------------

    /// Subscribe a type-erased handler to @p topic.
    SubscriptionId Subscribe(std::string_view topic, RawHandler handler,
                             int32_t priority = 0);

    /// Subscribe a handler expecting payloads of type P.
    ///
    /// A payload of another type raises std::bad_any_cast inside the
    /// handler's failure boundary and is logged.
    template <typename P>
    SubscriptionId Subscribe(std::string_view topic,
                             std::function<void(const P&)> handler,
                             int32_t priority = 0) {
        return Subscribe(
            topic,
            RawHandler([fn = std::move(handler)](const std::any& payload) {
                fn(std::any_cast<const P&>(payload));
            }),
            priority);
    }

    // -- Unsubscribe ----------------------------------------------------------

    /// Remove a subscription. Unknown ids are ignored.
    void Unsubscribe(SubscriptionId id);

    void UnsubscribeAll();

    // -- Publish --------------------------------------------------------------

    /// Deliver @p payload to every current subscriber of @p topic.
    void PublishRaw(std::string_view topic, const std::any& payload);

    template <typename P>
    void Publish(std::string_view topic, const P& payload) {
        PublishRaw(topic, std::any(payload));
    }

    /// Publish a topic with no payload.
    void Publish(std::string_view topic) { PublishRaw(topic, std::any{}); }

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] std::size_t HandlerCount() const;

    [[nodiscard]] std::size_t HandlerCountFor(std::string_view topic) const;

private:
    struct HandlerEntry {
        SubscriptionId id = 0;
        int32_t priority = 0;
        RawHandler handler;
    };

    /// Stable sort keeps subscription order within one priority.
    static void sortHandlers(std::vector<HandlerEntry>& handlers) {
        std::stable_sort(handlers.begin(), handlers.end(),
                         [](const HandlerEntry& a, const HandlerEntry& b) {
                             return a.priority < b.priority;
                         });
    }

    /// topic -> sorted handlers.
    std::unordered_map<std::string, std::vector<HandlerEntry>> handlers_;

    /// subscription id -> topic.
    std::unordered_map<SubscriptionId, std::string> subscriptionTopics_;

    SubscriptionId nextId_ = 1;
};

} // namespace nrt::event
