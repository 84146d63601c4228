#include "app/WindowHost.hpp"

#include <spdlog/spdlog.h>

namespace trremote::app {

WindowHost::WindowHost(Factory factory, QObject* parent)
    : QObject(parent), factory_(std::move(factory)) {}

WindowHost::~WindowHost() {
    if (window_) {
        QObject::disconnect(destroyedConnection_);
        window_.reset();
    }
}

core::IAppWindow* WindowHost::createWindow() {
    if (sealed_) {
        spdlog::warn("Window requested after shutdown started, ignoring");
        return nullptr;
    }
    if (window_) {
        return window_.get();
    }

    const core::WindowId id = nextId_++;
    window_ = factory_ ? factory_(id) : nullptr;
    if (!window_) {
        spdlog::error("Failed to construct main window");
        return nullptr;
    }
    windowId_ = id;

    window_->setCloseRequestHandler([this]() {
        if (closeRequestHandler_) {
            closeRequestHandler_();
        }
    });

    // Windows that are QObjects can be deleted behind our back (e.g. by Qt itself)
    if (auto* object = dynamic_cast<QObject*>(window_.get())) {
        destroyedConnection_ = connect(object, &QObject::destroyed, this,
                                       [this, id]() { onWindowObjectDestroyed(id); });
    }

    setVisibility(core::WindowVisibility::Created);
    window_->showWindow();
    setVisibility(core::WindowVisibility::Visible);
    window_->focusWindow();

    spdlog::info("Main window {} created", id);
    return window_.get();
}

void WindowHost::destroyWindow() {
    if (!window_) {
        return;
    }

    const auto id = windowId_;
    QObject::disconnect(destroyedConnection_);
    window_.reset();

    setVisibility(core::WindowVisibility::Hidden);
    spdlog::info("Main window {} destroyed", id);
    emit windowDestroyed(id);
}

void WindowHost::seal() {
    destroyWindow();
    sealed_ = true;
    setVisibility(core::WindowVisibility::Closed);
}

void WindowHost::setCloseRequestHandler(std::function<void()> handler) {
    closeRequestHandler_ = std::move(handler);
}

void WindowHost::setVisibility(core::WindowVisibility visibility) {
    if (visibility_ == visibility) {
        return;
    }
    visibility_ = visibility;
    emit visibilityChanged(visibility);
}

void WindowHost::onWindowObjectDestroyed(core::WindowId id) {
    if (!window_ || windowId_ != id) {
        return;
    }

    // The object is already being deleted; give up ownership without deleting again
    QObject::disconnect(destroyedConnection_);
    (void)window_.release();

    spdlog::warn("Main window {} was destroyed externally", id);
    setVisibility(core::WindowVisibility::Hidden);
    emit windowDestroyed(id);
}

} // namespace trremote::app
