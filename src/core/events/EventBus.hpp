/**
 * @file EventBus.hpp
 * @brief Typed publish/subscribe channel between the backend and windows.
 *
 * Topics carry no payload. Window-scoped topics are delivered only to the
 * subscribers of that window; global topics to global subscribers.
 */

#pragma once

#include "core/types/Lifecycle.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace trremote::core {

/**
 * @brief Events exchanged between the backend and the presentation layer.
 */
enum class Topic : int {
    ExitRequested = 0, ///< Backend asks a window to flush its state (window scoped)
    FrontendDone = 1,  ///< Window confirms the flush (window scoped)
    ListenerStart = 2  ///< Request to re-arm the single-instance listener (global)
};

[[nodiscard]] std::string toString(Topic topic);

/**
 * @brief Thread-safe publish/subscribe bus with typed topics.
 *
 * Handlers run synchronously on the publishing thread, outside the bus lock,
 * so a handler may publish, subscribe or unsubscribe.
 */
class EventBus {
public:
    using Handler = std::function<void()>;
    using SubscriptionId = uint64_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribes to a global topic.
     * @return Identifier to pass to unsubscribe().
     */
    SubscriptionId subscribe(Topic topic, Handler handler);

    /**
     * @brief Subscribes to a topic scoped to one window.
     * @return Identifier to pass to unsubscribe().
     */
    SubscriptionId subscribe(Topic topic, WindowId window, Handler handler);

    /**
     * @brief Removes a subscription. Unknown identifiers are ignored.
     * @return True if a subscription was removed.
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Publishes a global event.
     * @return Number of handlers invoked.
     */
    size_t publish(Topic topic);

    /**
     * @brief Publishes an event to the subscribers of one window.
     * @return Number of handlers invoked.
     */
    size_t publish(Topic topic, WindowId window);

    /**
     * @brief Counts the live subscriptions of a topic, any scope.
     */
    [[nodiscard]] size_t subscriberCount(Topic topic) const;

private:
    struct Subscription {
        Topic topic;
        std::optional<WindowId> window;
        Handler handler;
    };

    SubscriptionId add(Topic topic, std::optional<WindowId> window, Handler handler);
    size_t dispatch(Topic topic, std::optional<WindowId> window);

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscription> subscriptions_;
    SubscriptionId nextId_{1};
};

} // namespace trremote::core
