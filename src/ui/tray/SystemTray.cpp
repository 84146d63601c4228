#include "ui/tray/SystemTray.hpp"

#include <QApplication>
#include <QStyle>
#include <spdlog/spdlog.h>

namespace trremote::ui {

SystemTray::SystemTray(QObject* parent) : QObject(parent), menu_(std::make_unique<QMenu>()) {
    trayIcon_ = new QSystemTrayIcon(this);
    trayIcon_->setIcon(QApplication::style()->standardIcon(QStyle::SP_ArrowDown));
    trayIcon_->setToolTip("TrRemote");

    toggleAction_ = menu_->addAction("Hide");
    menu_->addSeparator();
    quitAction_ = menu_->addAction("Quit");

    connect(toggleAction_, &QAction::triggered, this, [this]() { dispatch(Action::Toggle); });
    connect(quitAction_, &QAction::triggered, this, [this]() { dispatch(Action::Quit); });

    trayIcon_->setContextMenu(menu_.get());

    connect(trayIcon_, &QSystemTrayIcon::activated, this, &SystemTray::onActivated);

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        spdlog::warn("No system tray available on this desktop");
    }
}

SystemTray::~SystemTray() {
    trayIcon_->setContextMenu(nullptr);
}

void SystemTray::setActionHandler(ActionHandler handler) {
    handler_ = std::move(handler);
}

void SystemTray::setToggleLabel(const std::string& label) {
    toggleAction_->setText(QString::fromStdString(label));
}

void SystemTray::setToolTip(const std::string& text) {
    trayIcon_->setToolTip(QString::fromStdString(text));
}

void SystemTray::show() {
    trayIcon_->show();
}

void SystemTray::onActivated(QSystemTrayIcon::ActivationReason reason) {
    if (reason == QSystemTrayIcon::Trigger) {
        dispatch(Action::PrimaryClick);
    }
}

void SystemTray::dispatch(Action action) {
    if (handler_) {
        handler_(action);
    }
}

} // namespace trremote::ui
