#pragma once

#include "app/CommandHandler.hpp"
#include "app/CommandLine.hpp"
#include "app/LifecycleOrchestrator.hpp"
#include "app/ShutdownCoordinator.hpp"
#include "app/TrayController.hpp"
#include "app/WindowHost.hpp"
#include "core/events/EventBus.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/ipc/LocalInstanceChannel.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/poller/PollerSupervisor.hpp"
#include "infrastructure/rpc/TransmissionRpcService.hpp"
#include "ui/tray/SystemTray.hpp"

#include <QApplication>
#include <memory>

namespace trremote::app {

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    LifecycleOrchestrator& lifecycle() { return *lifecycle_; }

private:
    void initializeLogging();
    void initializeComponents();

    std::unique_ptr<QApplication> qtApp_;
    CommandLineOptions options_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<core::EventBus> bus_;
    std::unique_ptr<infra::LocalInstanceChannel> channel_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::shared_ptr<infra::TransmissionRpcService> rpcService_;
    std::unique_ptr<infra::PollerSupervisor> poller_;
    std::unique_ptr<CommandHandler> commands_;

    std::unique_ptr<WindowHost> windowHost_;
    std::unique_ptr<ShutdownCoordinator> shutdown_;
    std::unique_ptr<LifecycleOrchestrator> lifecycle_;
    std::unique_ptr<ui::SystemTray> tray_;
    std::unique_ptr<TrayController> trayController_;
};

} // namespace trremote::app
