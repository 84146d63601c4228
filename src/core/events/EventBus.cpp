#include "core/events/EventBus.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace trremote::core {

std::string toString(Topic topic) {
    switch (topic) {
    case Topic::ExitRequested:
        return "exit-requested";
    case Topic::FrontendDone:
        return "frontend-done";
    case Topic::ListenerStart:
        return "listener-start";
    }
    return "unknown";
}

EventBus::SubscriptionId EventBus::subscribe(Topic topic, Handler handler) {
    return add(topic, std::nullopt, std::move(handler));
}

EventBus::SubscriptionId EventBus::subscribe(Topic topic, WindowId window, Handler handler) {
    return add(topic, window, std::move(handler));
}

EventBus::SubscriptionId EventBus::add(Topic topic, std::optional<WindowId> window,
                                       Handler handler) {
    std::lock_guard lock(mutex_);
    auto id = nextId_++;
    subscriptions_.emplace(id, Subscription{topic, window, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

size_t EventBus::publish(Topic topic) {
    return dispatch(topic, std::nullopt);
}

size_t EventBus::publish(Topic topic, WindowId window) {
    return dispatch(topic, window);
}

size_t EventBus::dispatch(Topic topic, std::optional<WindowId> window) {
    std::vector<std::pair<SubscriptionId, Handler>> targets;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, subscription] : subscriptions_) {
            if (subscription.topic == topic && subscription.window == window) {
                targets.emplace_back(id, subscription.handler);
            }
        }
    }

    spdlog::debug("Publishing {} to {} subscriber(s)", toString(topic), targets.size());

    size_t delivered = 0;
    for (auto& [id, handler] : targets) {
        {
            // Skip handlers removed by an earlier handler of this dispatch
            std::lock_guard lock(mutex_);
            if (!subscriptions_.contains(id)) {
                continue;
            }
        }
        if (handler) {
            handler();
            ++delivered;
        }
    }
    return delivered;
}

size_t EventBus::subscriberCount(Topic topic) const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, subscription] : subscriptions_) {
        if (subscription.topic == topic) {
            ++count;
        }
    }
    return count;
}

} // namespace trremote::core
