/// @file event_bus.cpp
/// @brief EventBus dispatch and subscription bookkeeping.

#include "nrt/event/event_bus.hpp"

#include <exception>

#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::event {

using foundation::LogCategory;

SubscriptionId EventBus::Subscribe(std::string_view topic, RawHandler handler,
                                   int32_t priority) {
    auto id = nextId_++;
    std::string key(topic);

    HandlerEntry entry;
    entry.id = id;
    entry.priority = priority;
    entry.handler = std::move(handler);

    auto& handlers = handlers_[key];
    handlers.push_back(std::move(entry));
    sortHandlers(handlers);

    subscriptionTopics_.insert_or_assign(id, std::move(key));
    return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
    auto topicIt = subscriptionTopics_.find(id);
    if (topicIt == subscriptionTopics_.end()) {
        return;
    }

    auto handlersIt = handlers_.find(topicIt->second);
    if (handlersIt != handlers_.end()) {
        std::erase_if(handlersIt->second,
                      [id](const HandlerEntry& e) { return e.id == id; });
        if (handlersIt->second.empty()) {
            handlers_.erase(handlersIt);
        }
    }

    subscriptionTopics_.erase(topicIt);
}

void EventBus::UnsubscribeAll() {
    handlers_.clear();
    subscriptionTopics_.clear();
}

void EventBus::PublishRaw(std::string_view topic, const std::any& payload) {
    auto it = handlers_.find(std::string(topic));
    if (it == handlers_.end()) {
        return;
    }
    std::vector<HandlerEntry> snapshot = it->second;

    for (const auto& entry : snapshot) {
        try {
            entry.handler(payload);
        } catch (const std::exception& e) {
            NRT_LOG_ERROR(LogCategory::Events,
                          "Subscriber " + std::to_string(entry.id) + " of '" +
                              std::string(topic) + "' failed: " + e.what());
        }
    }
}

std::size_t EventBus::HandlerCount() const {
    std::size_t count = 0;
    for (const auto& [_, handlers] : handlers_) {
        count += handlers.size();
    }
    return count;
}

std::size_t EventBus::HandlerCountFor(std::string_view topic) const {
    auto it = handlers_.find(std::string(topic));
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace nrt::event
