#include "app/Application.hpp"

#include "ui/windows/MainWindow.hpp"

#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace trremote::app {

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QApplication>(argc, argv);
    qtApp_->setApplicationName("TrRemote");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("TrRemote");

    // The tray keeps the process alive while no window exists
    qtApp_->setQuitOnLastWindowClosed(false);

    options_ = parseCommandLine(qtApp_->arguments());
    if (options_.helpRequested || options_.versionRequested || !options_.ok()) {
        return;
    }

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    if (poller_) {
        poller_->stop();
    }

    if (asioContext_) {
        asioContext_->stop();
    }

    if (config_) {
        spdlog::info("Application shutting down...");
    }
}

void Application::initializeLogging() {
    auto dataDir =
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation).toStdString();
    std::filesystem::create_directories(dataDir);

    auto logPath = std::filesystem::path(dataDir) / "trremote.log";

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("trremote", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("TrRemote {} starting...", qtApp_->applicationVersion().toStdString());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    auto configDir = options_.configDir.value_or(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation).toStdString());
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    const auto& cfg = config_->config();

    auto level = spdlog::level::from_str(cfg.logLevel);
    if (level == spdlog::level::off && cfg.logLevel != "off") {
        spdlog::warn("Unknown log level '{}', using info", cfg.logLevel);
        level = spdlog::level::info;
    }
    spdlog::default_logger()->sinks().front()->set_level(level);

    bus_ = std::make_unique<core::EventBus>();

    // Single-instance channel
    channel_ = std::make_unique<infra::LocalInstanceChannel>(
        QString::fromStdString(cfg.instanceKey), QString(),
        std::chrono::milliseconds(cfg.instanceConnectTimeoutMs));

    // Asio context
    asioContext_ = std::make_unique<infra::AsioContext>(1);
    asioContext_->start();

    // Background poller
    rpcService_ = std::make_shared<infra::TransmissionRpcService>();
    poller_ = std::make_unique<infra::PollerSupervisor>(*asioContext_, rpcService_);
    if (auto error = poller_->configure(cfg.poller)) {
        spdlog::warn("Configured poller target rejected: {}", *error);
    }

    commands_ = std::make_unique<CommandHandler>(*poller_);

    // Window, shutdown handshake and lifecycle
    windowHost_ = std::make_unique<WindowHost>(
        [this](core::WindowId id) -> std::unique_ptr<core::IAppWindow> {
            auto window =
                std::make_unique<ui::MainWindow>(id, *bus_, *config_, *commands_, *poller_);
            QObject::connect(window.get(), &ui::MainWindow::quitRequested, lifecycle_.get(),
                             &LifecycleOrchestrator::requestQuit, Qt::QueuedConnection);
            QObject::connect(window.get(), &ui::MainWindow::listenerRestartRequested,
                             lifecycle_.get(), &LifecycleOrchestrator::restartListener);
            return window;
        });

    shutdown_ = std::make_unique<ShutdownCoordinator>(
        *bus_, *windowHost_, std::chrono::milliseconds(cfg.shutdownAckTimeoutMs));

    lifecycle_ = std::make_unique<LifecycleOrchestrator>(*channel_, *poller_, *windowHost_,
                                                         *shutdown_, *bus_);
    lifecycle_->setStartMinimized(cfg.startMinimized);
    lifecycle_->setCloseToTray(cfg.closeToTray);
    lifecycle_->interceptQuitRequests(qtApp_.get());

    QObject::connect(lifecycle_.get(), &LifecycleOrchestrator::exitRequested, qtApp_.get(),
                     [](int exitCode) { QCoreApplication::exit(exitCode); },
                     Qt::QueuedConnection);

    // Tray
    tray_ = std::make_unique<ui::SystemTray>();
    trayController_ =
        std::make_unique<TrayController>(*tray_, *windowHost_, *shutdown_, *lifecycle_);

    poller_->setSnapshotCallback([this](const core::PollSnapshot& snapshot) {
        QMetaObject::invokeMethod(
            trayController_.get(),
            [this, snapshot]() { trayController_->updateStatus(snapshot); },
            Qt::QueuedConnection);
    });

    spdlog::info("Application components initialized");
}

int Application::run() {
    if (options_.helpRequested) {
        std::cout << options_.helpText;
        return 0;
    }

    if (options_.versionRequested) {
        std::cout << qtApp_->applicationName().toStdString() << ' '
                  << qtApp_->applicationVersion().toStdString() << '\n';
        return 0;
    }

    if (!options_.ok()) {
        std::cerr << options_.errorText << "\n\n" << options_.helpText;
        return 1;
    }

    const auto state = lifecycle_->start(options_.batch);
    if (state == core::LifecycleState::Exited) {
        return 0;
    }

    tray_->show();

    return qtApp_->exec();
}

} // namespace trremote::app
