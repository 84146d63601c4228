#pragma once

#include "app/CommandHandler.hpp"
#include "core/events/EventBus.hpp"
#include "core/services/IAppWindow.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/poller/PollerSupervisor.hpp"

#include <QAction>
#include <QLabel>
#include <QListWidget>
#include <QMainWindow>
#include <QTimer>

namespace trremote::ui {

class MainWindow : public QMainWindow, public core::IAppWindow {
    Q_OBJECT

public:
    MainWindow(core::WindowId id, core::EventBus& bus, infra::ConfigManager& config,
               app::CommandHandler& commands, infra::PollerSupervisor& poller,
               QWidget* parent = nullptr);
    ~MainWindow() override;

    [[nodiscard]] core::WindowId id() const override { return id_; }
    void showWindow() override;
    void focusWindow() override;
    void openArguments(const core::ArgumentBatch& batch) override;
    void setCloseRequestHandler(std::function<void()> handler) override;

signals:
    void quitRequested();
    void listenerRestartRequested();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onOpenTorrent();
    void onOpenExternally();
    void onConnectionSettings();
    void onRestartListener();
    void updateStatusBar();

private:
    void setupUi();
    void setupMenuBar();
    void setupStatusBar();

    void onExitRequested();
    void addEntry(const std::string& target);
    void saveWindowState();
    void restoreWindowState();

    core::WindowId id_;
    core::EventBus& bus_;
    infra::ConfigManager& config_;
    app::CommandHandler& commands_;
    infra::PollerSupervisor& poller_;

    core::EventBus::SubscriptionId exitSubscription_{0};
    std::function<void()> closeHandler_;

    QListWidget* torrentList_{nullptr};
    QLabel* statusLabel_{nullptr};
    QLabel* endpointLabel_{nullptr};
    QTimer* statusTimer_{nullptr};

    QAction* openAction_{nullptr};
    QAction* openExternallyAction_{nullptr};
    QAction* quitAction_{nullptr};
};

} // namespace trremote::ui
