#include "app/LifecycleOrchestrator.hpp"

#include "app/ShutdownCoordinator.hpp"
#include "app/WindowHost.hpp"

#include <spdlog/spdlog.h>

namespace trremote::app {

LifecycleOrchestrator::LifecycleOrchestrator(core::IInstanceChannel& channel,
                                             infra::PollerSupervisor& poller,
                                             WindowHost& windows, ShutdownCoordinator& shutdown,
                                             core::EventBus& bus, QObject* parent)
    : QObject(parent), channel_(channel), poller_(poller), windows_(windows),
      shutdown_(shutdown), bus_(bus) {
    windows_.setCloseRequestHandler([this]() { onCloseRequested(); });
}

LifecycleOrchestrator::~LifecycleOrchestrator() {
    if (listenerSubscription_ != 0) {
        bus_.unsubscribe(listenerSubscription_);
    }
    windows_.setCloseRequestHandler({});
}

core::LifecycleState LifecycleOrchestrator::start(const core::ArgumentBatch& batch) {
    if (state_ != core::LifecycleState::Starting) {
        spdlog::warn("Lifecycle already started (state {})", core::toString(state_));
        return state_;
    }

    const auto role = channel_.tryBind();
    spdlog::info("Running as {} instance", core::toString(role));

    if (role == core::InstanceRole::Secondary) {
        if (auto error = channel_.send(batch)) {
            spdlog::warn("Could not forward {} argument(s) to the running instance: {} ({})",
                         batch.size(), error->message, error->codeToString());
        } else {
            spdlog::info("Forwarded {} argument(s) to the running instance", batch.size());
        }
        setState(core::LifecycleState::Exited);
        return state_;
    }

    if (auto error = channel_.listen([this](const core::ArgumentBatch& b) { onBatch(b); })) {
        spdlog::warn("Single-instance listener unavailable, running degraded: {} ({})",
                     error->message, error->codeToString());
        setState(core::LifecycleState::Degraded);
        return state_;
    }

    // Our own arguments take the same path as forwarded ones
    if (auto error = channel_.send(batch)) {
        spdlog::warn("Could not queue own arguments: {}", error->message);
    }

    listenerSubscription_ = bus_.subscribe(core::Topic::ListenerStart, [this]() {
        QMetaObject::invokeMethod(
            this,
            [this]() {
                spdlog::info("Re-arming single-instance listener");
                channel_.start();
            },
            Qt::AutoConnection);
    });

    setState(core::LifecycleState::Active);

    if (!startMinimized_) {
        windows_.createWindow();
    }
    poller_.start();

    return state_;
}

void LifecycleOrchestrator::requestQuit() {
    if (state_ == core::LifecycleState::ShuttingDown || state_ == core::LifecycleState::Exited) {
        spdlog::debug("Quit already in progress");
        return;
    }

    spdlog::info("Shutting down");
    setState(core::LifecycleState::ShuttingDown);

    if (listenerSubscription_ != 0) {
        bus_.unsubscribe(listenerSubscription_);
        listenerSubscription_ = 0;
    }

    shutdown_.closeWindow([this]() { finishShutdown(); });
}

void LifecycleOrchestrator::restartListener() {
    bus_.publish(core::Topic::ListenerStart);
}

void LifecycleOrchestrator::onBatch(const core::ArgumentBatch& batch) {
    // The current window is on its way out; open the batch in its successor
    if (state_ == core::LifecycleState::Active && windows_.hasWindow() &&
        shutdown_.handshakeState(windows_.currentId()) != core::HandshakeState::Idle) {
        spdlog::debug("Window {} is closing, deferring {} received argument(s)",
                      windows_.currentId(), batch.size());
        shutdown_.closeWindow([this, batch]() { deliverBatch(batch); });
        return;
    }

    deliverBatch(batch);
}

void LifecycleOrchestrator::deliverBatch(const core::ArgumentBatch& batch) {
    if (state_ != core::LifecycleState::Active) {
        spdlog::info("Dropping {} argument(s) received in state {}", batch.size(),
                     core::toString(state_));
        return;
    }

    auto* window = windows_.createWindow();
    if (!window) {
        spdlog::warn("No window available for {} received argument(s)", batch.size());
        return;
    }

    if (!batch.empty()) {
        spdlog::info("Opening {} received argument(s)", batch.size());
        window->openArguments(batch);
    }
    window->focusWindow();

    emit argumentsReceived(batch);
}

void LifecycleOrchestrator::interceptQuitRequests(QCoreApplication* app) {
    app->installEventFilter(this);
}

bool LifecycleOrchestrator::eventFilter(QObject* watched, QEvent* event) {
    if (event->type() == QEvent::Quit && state_ != core::LifecycleState::Exited) {
        spdlog::info("Quit requested by the platform");
        requestQuit();
        return true;
    }
    return QObject::eventFilter(watched, event);
}

void LifecycleOrchestrator::onCloseRequested() {
    if (closeToTray_) {
        shutdown_.closeWindow();
    } else {
        requestQuit();
    }
}

void LifecycleOrchestrator::finishShutdown() {
    channel_.stop();
    poller_.stop();
    windows_.seal();

    setState(core::LifecycleState::Exited);
    spdlog::info("Shutdown complete");
    emit exitRequested(0);
}

void LifecycleOrchestrator::setState(core::LifecycleState state) {
    if (state_ == state) {
        return;
    }
    spdlog::debug("Lifecycle: {} -> {}", core::toString(state_), core::toString(state));
    state_ = state;
    emit stateChanged(state);
}

} // namespace trremote::app
