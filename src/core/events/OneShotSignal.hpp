#pragma once

#include <functional>
#include <mutex>
#include <utility>

namespace trremote::core {

/**
 * @brief Single-use signal: the action runs on the first fire() only.
 *
 * Thread-safe. Used to turn a repeatable event into exactly one
 * notification, e.g. the first acknowledgement of an exit request.
 */
class OneShotSignal {
public:
    using Action = std::function<void()>;

    explicit OneShotSignal(Action action) : action_(std::move(action)) {}

    OneShotSignal(const OneShotSignal&) = delete;
    OneShotSignal& operator=(const OneShotSignal&) = delete;

    /**
     * @brief Fires the signal.
     * @return True if this call ran the action, false if it had already fired.
     */
    bool fire() {
        Action action;
        {
            std::lock_guard lock(mutex_);
            if (fired_) {
                return false;
            }
            fired_ = true;
            action = std::move(action_);
            action_ = nullptr;
        }
        if (action) {
            action();
        }
        return true;
    }

    /**
     * @brief Consumes the signal without running the action.
     * @return True if the signal had not fired yet.
     */
    bool cancel() {
        std::lock_guard lock(mutex_);
        if (fired_) {
            return false;
        }
        fired_ = true;
        action_ = nullptr;
        return true;
    }

    [[nodiscard]] bool fired() const {
        std::lock_guard lock(mutex_);
        return fired_;
    }

private:
    mutable std::mutex mutex_;
    Action action_;
    bool fired_{false};
};

} // namespace trremote::core
