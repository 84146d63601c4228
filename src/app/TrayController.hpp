#pragma once

#include "core/services/ITrayIcon.hpp"
#include "core/types/Lifecycle.hpp"
#include "core/types/PollerTypes.hpp"

#include <QObject>
#include <string>

namespace trremote::app {

class WindowHost;
class ShutdownCoordinator;
class LifecycleOrchestrator;

/**
 * @brief Routes tray icon gestures and keeps the tray menu in sync with the window.
 */
class TrayController : public QObject {
    Q_OBJECT

public:
    TrayController(core::ITrayIcon& tray, WindowHost& windows, ShutdownCoordinator& shutdown,
                   LifecycleOrchestrator& lifecycle, QObject* parent = nullptr);

    /**
     * @brief Hides the window if one exists, otherwise creates a new one.
     */
    void toggle();

    /**
     * @brief Starts the orderly application shutdown.
     */
    void quit();

    /**
     * @brief Shows the outcome of a poll cycle in the icon's tooltip.
     */
    void updateStatus(const core::PollSnapshot& snapshot);

    [[nodiscard]] const std::string& toggleLabel() const { return toggleLabel_; }

    static std::string labelFor(core::WindowVisibility visibility);

private:
    void onAction(core::ITrayIcon::Action action);
    void onVisibilityChanged(core::WindowVisibility visibility);

    core::ITrayIcon& tray_;
    WindowHost& windows_;
    ShutdownCoordinator& shutdown_;
    LifecycleOrchestrator& lifecycle_;
    std::string toggleLabel_;
};

} // namespace trremote::app
