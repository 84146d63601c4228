#pragma once

#include "core/events/EventBus.hpp"
#include "core/services/IInstanceChannel.hpp"
#include "core/types/ArgumentBatch.hpp"
#include "core/types/Lifecycle.hpp"
#include "infrastructure/poller/PollerSupervisor.hpp"

#include <QCoreApplication>
#include <QEvent>
#include <QObject>
#include <optional>

namespace trremote::app {

class WindowHost;
class ShutdownCoordinator;

/**
 * @brief Drives the process from launch to exit.
 *
 * Resolves the instance role, starts the listener, the main window and the
 * poller on a primary, and runs the ordered shutdown: window handshake,
 * listener, poller, then exit.
 */
class LifecycleOrchestrator : public QObject {
    Q_OBJECT

public:
    LifecycleOrchestrator(core::IInstanceChannel& channel, infra::PollerSupervisor& poller,
                          WindowHost& windows, ShutdownCoordinator& shutdown,
                          core::EventBus& bus, QObject* parent = nullptr);
    ~LifecycleOrchestrator() override;

    /**
     * @brief Runs start-up with the arguments of this launch.
     * @param batch Arguments from the command line.
     * @return Exited on a secondary instance, Degraded if the listener could
     *         not be started, Active otherwise.
     */
    core::LifecycleState start(const core::ArgumentBatch& batch);

    /**
     * @brief Starts the orderly shutdown. Ignored once shutdown has begun.
     */
    void requestQuit();

    /**
     * @brief Asks for the single-instance listener to be re-armed.
     */
    void restartListener();

    /**
     * @brief Routes generic quit requests of @p app through requestQuit().
     *
     * QEvent::Quit (platform quit, session end, QCoreApplication::quit())
     * is swallowed until the orchestrator reaches Exited, so the window
     * handshake and the listener/poller shutdown always run first.
     */
    void interceptQuitRequests(QCoreApplication* app);

    bool eventFilter(QObject* watched, QEvent* event) override;

    /**
     * @brief Whether a main window may be created in the current state.
     */
    [[nodiscard]] bool canShowWindow() const { return state_ == core::LifecycleState::Active; }

    [[nodiscard]] core::LifecycleState state() const { return state_; }

    [[nodiscard]] std::optional<core::InstanceRole> role() const { return channel_.role(); }

    /**
     * @brief Primary starts with the tray icon only, no window.
     */
    void setStartMinimized(bool startMinimized) { startMinimized_ = startMinimized; }

    /**
     * @brief Window close button hides the window instead of quitting.
     */
    void setCloseToTray(bool closeToTray) { closeToTray_ = closeToTray; }

signals:
    void stateChanged(core::LifecycleState state);
    void argumentsReceived(const core::ArgumentBatch& batch);

    /**
     * @brief Emitted once the shutdown sequence is complete.
     */
    void exitRequested(int exitCode);

private:
    void onBatch(const core::ArgumentBatch& batch);
    void deliverBatch(const core::ArgumentBatch& batch);
    void onCloseRequested();
    void finishShutdown();
    void setState(core::LifecycleState state);

    core::IInstanceChannel& channel_;
    infra::PollerSupervisor& poller_;
    WindowHost& windows_;
    ShutdownCoordinator& shutdown_;
    core::EventBus& bus_;

    core::LifecycleState state_{core::LifecycleState::Starting};
    core::EventBus::SubscriptionId listenerSubscription_{0};
    bool startMinimized_{false};
    bool closeToTray_{true};
};

} // namespace trremote::app
