#pragma once

#include "app/WindowHost.hpp"
#include "core/events/EventBus.hpp"
#include "core/events/OneShotSignal.hpp"
#include "core/types/Lifecycle.hpp"

#include <QObject>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace trremote::app {

/**
 * @brief Runs the exit handshake between the backend and a window.
 *
 * A close attempt publishes ExitRequested for the window and waits, without
 * blocking the event loop, for the window's first FrontendDone. Only then is
 * the window destroyed and are the callers' continuations run.
 *
 * By default the wait is unbounded. A positive acknowledgement timeout makes
 * the coordinator force the close when a window never answers.
 */
class ShutdownCoordinator : public QObject {
    Q_OBJECT

public:
    using Continuation = std::function<void()>;

    ShutdownCoordinator(core::EventBus& bus, WindowHost& windows,
                        std::chrono::milliseconds ackTimeout = std::chrono::milliseconds(0),
                        QObject* parent = nullptr);
    ~ShutdownCoordinator() override;

    /**
     * @brief Closes the current window through the exit handshake.
     * @param onClosed Run once the window is gone; immediately if there is
     *        no window. Joins the attempt already in flight for the window,
     *        if any.
     */
    void closeWindow(Continuation onClosed = {});

    /**
     * @brief Returns the handshake state of a window's close attempt.
     * @return Idle if no attempt is in flight for the window.
     */
    [[nodiscard]] core::HandshakeState handshakeState(core::WindowId id) const;

    [[nodiscard]] size_t pendingAttempts() const { return attempts_.size(); }

    void setAckTimeout(std::chrono::milliseconds timeout) { ackTimeout_ = timeout; }

signals:
    void handshakeStateChanged(core::WindowId id, core::HandshakeState state);

private:
    struct Attempt {
        core::HandshakeState state{core::HandshakeState::Idle};
        core::EventBus::SubscriptionId ackSubscription{0};
        std::shared_ptr<core::OneShotSignal> ack;
        std::vector<Continuation> continuations;
    };

    void onAcknowledged(core::WindowId id, bool forced);
    void onAckTimeout(core::WindowId id);
    void onWindowDestroyed(core::WindowId id);
    void setState(core::WindowId id, Attempt& attempt, core::HandshakeState state);
    static void runContinuations(std::vector<Continuation> continuations);

    core::EventBus& bus_;
    WindowHost& windows_;
    std::chrono::milliseconds ackTimeout_;
    std::map<core::WindowId, Attempt> attempts_;
};

} // namespace trremote::app
