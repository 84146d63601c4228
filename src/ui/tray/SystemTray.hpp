#pragma once

#include "core/services/ITrayIcon.hpp"

#include <QAction>
#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>
#include <memory>

namespace trremote::ui {

/**
 * @brief Tray icon backed by QSystemTrayIcon.
 */
class SystemTray : public QObject, public core::ITrayIcon {
    Q_OBJECT

public:
    explicit SystemTray(QObject* parent = nullptr);
    ~SystemTray() override;

    void setActionHandler(ActionHandler handler) override;
    void setToggleLabel(const std::string& label) override;
    void setToolTip(const std::string& text) override;
    void show() override;

private slots:
    void onActivated(QSystemTrayIcon::ActivationReason reason);

private:
    void dispatch(Action action);

    std::unique_ptr<QMenu> menu_;
    QSystemTrayIcon* trayIcon_{nullptr};
    QAction* toggleAction_{nullptr};
    QAction* quitAction_{nullptr};
    ActionHandler handler_;
};

} // namespace trremote::ui
