#include "app/TrayController.hpp"

#include "app/LifecycleOrchestrator.hpp"
#include "app/ShutdownCoordinator.hpp"
#include "app/WindowHost.hpp"

#include <spdlog/spdlog.h>

namespace trremote::app {

TrayController::TrayController(core::ITrayIcon& tray, WindowHost& windows,
                               ShutdownCoordinator& shutdown, LifecycleOrchestrator& lifecycle,
                               QObject* parent)
    : QObject(parent), tray_(tray), windows_(windows), shutdown_(shutdown),
      lifecycle_(lifecycle) {
    tray_.setActionHandler([this](core::ITrayIcon::Action action) { onAction(action); });

    // Direct connection: the label changes in the same step as the window
    connect(&windows_, &WindowHost::visibilityChanged, this,
            &TrayController::onVisibilityChanged, Qt::DirectConnection);

    onVisibilityChanged(windows_.visibility());
    tray_.setToolTip("TrRemote");
}

void TrayController::toggle() {
    if (windows_.hasWindow()) {
        spdlog::debug("Tray: hiding main window");
        shutdown_.closeWindow();
        return;
    }

    if (!lifecycle_.canShowWindow()) {
        spdlog::info("Tray: window unavailable in state {}", core::toString(lifecycle_.state()));
        return;
    }

    spdlog::debug("Tray: showing main window");
    windows_.createWindow();
}

void TrayController::quit() {
    spdlog::info("Tray: quit requested");
    lifecycle_.requestQuit();
}

void TrayController::updateStatus(const core::PollSnapshot& snapshot) {
    if (snapshot.success) {
        tray_.setToolTip(fmt::format("TrRemote - connected to {}", snapshot.endpoint));
    } else {
        tray_.setToolTip(fmt::format("TrRemote - {}", snapshot.errorMessage));
    }
}

std::string TrayController::labelFor(core::WindowVisibility visibility) {
    return visibility == core::WindowVisibility::Visible ? "Hide" : "Show";
}

void TrayController::onAction(core::ITrayIcon::Action action) {
    switch (action) {
    case core::ITrayIcon::Action::Toggle:
    case core::ITrayIcon::Action::PrimaryClick:
        toggle();
        break;
    case core::ITrayIcon::Action::Quit:
        quit();
        break;
    }
}

void TrayController::onVisibilityChanged(core::WindowVisibility visibility) {
    toggleLabel_ = labelFor(visibility);
    tray_.setToggleLabel(toggleLabel_);
}

} // namespace trremote::app
