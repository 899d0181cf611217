#pragma once

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "../utils/log.h"

namespace hm {

// Type-safe event bus for decoupled subsystem communication.
// Owned by the application and handed to the services that publish.
// THREADING CONTRACT: one thread (the session thread) - no internal synchronization
class EventBus {
public:
    // Subscription token - caller holds this to keep handler alive
    using SubscriptionId = std::shared_ptr<void>;

    // Subscribe to events of type EventType
    // Returns a subscription token - handler remains active while token is alive
    template <typename EventType, typename Handler>
    SubscriptionId subscribe(Handler&& handler) {
        // Wrap handler in a shared_ptr to manage lifetime
        auto handlerFunc = std::make_shared<std::function<void(const EventType&)>>(
            std::forward<Handler>(handler));

        // Store a weak_ptr to the handler in the handlers map
        auto typeIndex = std::type_index(typeid(EventType));
        m_handlers[typeIndex].push_back(handlerFunc);

        // Return the shared_ptr (as shared_ptr<void>) so caller controls lifetime
        return handlerFunc;
    }

    // Publish an event to all subscribed handlers
    // Handlers are invoked synchronously in registration order
    // Exception in one handler does not prevent others from running
    template <typename EventType>
    void publish(const EventType& event) {
        auto typeIndex = std::type_index(typeid(EventType));
        auto it = m_handlers.find(typeIndex);
        if (it == m_handlers.end()) {
            return; // No subscribers
        }

        // Lock all handlers upfront so a handler dropping its own (or another)
        // subscription during dispatch does not invalidate the iteration
        std::vector<std::shared_ptr<std::function<void(const EventType&)>>> lockedHandlers;
        for (auto& weakHandler : it->second) {
            auto locked = weakHandler.lock();
            if (locked) {
                lockedHandlers.push_back(
                    std::static_pointer_cast<std::function<void(const EventType&)>>(locked));
            }
        }

        for (auto& handler : lockedHandlers) {
            try {
                (*handler)(event);
            } catch (const std::exception& e) {
                log::errorf("EventBus", "Handler exception: %s", e.what());
            }
        }

        // Clean up expired weak_ptrs. Look the list up again: a handler may
        // have subscribed during dispatch and rehashed the map.
        auto again = m_handlers.find(typeIndex);
        if (again != m_handlers.end()) {
            auto& list = again->second;
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [](const std::weak_ptr<void>& wp) { return wp.expired(); }),
                       list.end());
        }
    }

    // Number of live handlers for EventType
    template <typename EventType>
    std::size_t subscriberCount() const {
        auto it = m_handlers.find(std::type_index(typeid(EventType)));
        if (it == m_handlers.end()) {
            return 0;
        }
        return static_cast<std::size_t>(
            std::count_if(it->second.begin(), it->second.end(),
                          [](const std::weak_ptr<void>& wp) { return !wp.expired(); }));
    }

private:
    // Internal storage: type_index -> list of weak_ptr to handlers
    std::unordered_map<std::type_index, std::vector<std::weak_ptr<void>>> m_handlers;
};

} // namespace hm
