/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe bus between the peer core and its observers
 *
 * WHY THIS FILE EXISTS:
 * The network manager and the session never call into the UI. They emit
 * discrete events (a candidate was found, the channel opened, a message
 * arrived) and whoever renders the session subscribes to the types it cares
 * about. No observer ever receives a mutable handle to session internals.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<ChannelStatusChangedEvent>([](const ChannelStatusChangedEvent& e) { ... });
 * bus.emit(ChannelStatusChangedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace peerlink::events {

/**
 * @brief Type-safe event bus
 *
 * DELIVERY:
 * - Handlers run synchronously on the emitting thread, in subscription order
 * - A handler may subscribe or unsubscribe while an event is being delivered;
 *   the change takes effect from the next emit
 * - A throwing handler is logged and skipped, later handlers still run
 */
class EventBus {
public:
    using SubscriptionId = size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     *
     * RETURNS:
     * Subscription ID for unsubscribe<EventType>()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const SubscriptionId id = next_id_++;
        subscriptions_[key<EventType>()].push_back(
            Subscription{id, std::make_shared<TypedHandler<EventType>>(std::move(handler))});
        return id;
    }

    /// Unknown IDs are ignored.
    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto found = subscriptions_.find(key<EventType>());
        if (found == subscriptions_.end()) {
            return;
        }
        auto& list = found->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   list.end());
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * Handlers are snapshotted under a shared lock and invoked without it,
     * so a handler may emit, subscribe or unsubscribe.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        for (const auto& handler : snapshot(key<EventType>())) {
            try {
                handler->invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = subscriptions_.find(key<EventType>());
        return found == subscriptions_.end() ? 0 : found->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscriptions_.clear();
    }

private:
    struct Handler {
        virtual ~Handler() = default;
        virtual void invoke(const void* event) const = 0;
    };

    template<typename EventType>
    struct TypedHandler : Handler {
        explicit TypedHandler(std::function<void(const EventType&)> f) : fn(std::move(f)) {}

        void invoke(const void* event) const override {
            // Stored under key<EventType>(), so the cast cannot mismatch.
            fn(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> fn;
    };

    struct Subscription {
        SubscriptionId id;
        std::shared_ptr<const Handler> handler;
    };

    template<typename EventType>
    static std::type_index key() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<const Handler>> snapshot(std::type_index type) const {
        std::vector<std::shared_ptr<const Handler>> handlers;
        std::shared_lock lock(mutex_);
        auto found = subscriptions_.find(type);
        if (found != subscriptions_.end()) {
            handlers.reserve(found->second.size());
            for (const auto& subscription : found->second) {
                handlers.push_back(subscription.handler);
            }
        }
        return handlers;
    }

    std::unordered_map<std::type_index, std::vector<Subscription>> subscriptions_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace peerlink::events
