#include "app/ShutdownCoordinator.hpp"

#include <QTimer>
#include <spdlog/spdlog.h>

namespace trremote::app {

ShutdownCoordinator::ShutdownCoordinator(core::EventBus& bus, WindowHost& windows,
                                         std::chrono::milliseconds ackTimeout, QObject* parent)
    : QObject(parent), bus_(bus), windows_(windows), ackTimeout_(ackTimeout) {
    connect(&windows_, &WindowHost::windowDestroyed, this,
            &ShutdownCoordinator::onWindowDestroyed);
}

ShutdownCoordinator::~ShutdownCoordinator() {
    for (auto& [id, attempt] : attempts_) {
        attempt.ack->cancel();
        bus_.unsubscribe(attempt.ackSubscription);
    }
}

void ShutdownCoordinator::closeWindow(Continuation onClosed) {
    if (!windows_.hasWindow()) {
        if (onClosed) {
            onClosed();
        }
        return;
    }

    const core::WindowId id = windows_.currentId();

    auto existing = attempts_.find(id);
    if (existing != attempts_.end()) {
        spdlog::debug("Close of window {} already in progress", id);
        existing->second.continuations.push_back(std::move(onClosed));
        return;
    }

    Attempt& attempt = attempts_[id];
    attempt.continuations.push_back(std::move(onClosed));

    // The receiver exists before the request goes out, so even a synchronous
    // answer is seen. The first answer wins; the rest are dropped.
    attempt.ack = std::make_shared<core::OneShotSignal>([this, id]() {
        QMetaObject::invokeMethod(
            this, [this, id]() { onAcknowledged(id, false); }, Qt::QueuedConnection);
    });
    auto ack = attempt.ack;
    attempt.ackSubscription = bus_.subscribe(core::Topic::FrontendDone, id, [ack, id]() {
        if (!ack->fire()) {
            spdlog::debug("Ignoring repeated frontend-done from window {}", id);
        }
    });

    setState(id, attempt, core::HandshakeState::Requested);

    if (ackTimeout_.count() > 0) {
        QTimer::singleShot(ackTimeout_, this, [this, id]() { onAckTimeout(id); });
    }

    spdlog::info("Requesting exit of window {}", id);
    if (bus_.publish(core::Topic::ExitRequested, id) == 0) {
        spdlog::warn("Window {} has no exit-requested handler, waiting for acknowledgement", id);
    }
}

core::HandshakeState ShutdownCoordinator::handshakeState(core::WindowId id) const {
    auto it = attempts_.find(id);
    return it != attempts_.end() ? it->second.state : core::HandshakeState::Idle;
}

void ShutdownCoordinator::onAcknowledged(core::WindowId id, bool forced) {
    auto it = attempts_.find(id);
    if (it == attempts_.end() || it->second.state != core::HandshakeState::Requested) {
        return;
    }

    setState(id, it->second, core::HandshakeState::Acknowledged);
    bus_.unsubscribe(it->second.ackSubscription);

    if (forced) {
        spdlog::warn("Closing window {} without acknowledgement", id);
    } else {
        spdlog::debug("Window {} acknowledged exit request", id);
    }

    auto continuations = std::move(it->second.continuations);
    attempts_.erase(it);

    if (windows_.currentId() == id) {
        windows_.destroyWindow();
    }

    runContinuations(std::move(continuations));
}

void ShutdownCoordinator::onAckTimeout(core::WindowId id) {
    auto it = attempts_.find(id);
    if (it == attempts_.end() || !it->second.ack->cancel()) {
        return;
    }

    spdlog::warn("Window {} did not acknowledge the exit request within {} ms", id,
                 ackTimeout_.count());
    onAcknowledged(id, true);
}

void ShutdownCoordinator::onWindowDestroyed(core::WindowId id) {
    auto it = attempts_.find(id);
    if (it == attempts_.end() || it->second.state != core::HandshakeState::Requested) {
        return;
    }

    spdlog::warn("Window {} disappeared before acknowledging the exit request", id);
    it->second.ack->cancel();
    bus_.unsubscribe(it->second.ackSubscription);

    auto continuations = std::move(it->second.continuations);
    attempts_.erase(it);
    emit handshakeStateChanged(id, core::HandshakeState::Idle);

    runContinuations(std::move(continuations));
}

void ShutdownCoordinator::setState(core::WindowId id, Attempt& attempt,
                                   core::HandshakeState state) {
    attempt.state = state;
    emit handshakeStateChanged(id, state);
}

void ShutdownCoordinator::runContinuations(std::vector<Continuation> continuations) {
    for (auto& continuation : continuations) {
        if (continuation) {
            continuation();
        }
    }
}

} // namespace trremote::app
