#include "ui/windows/MainWindow.hpp"

#include <QCloseEvent>
#include <QFileDialog>
#include <QInputDialog>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>
#include <QVBoxLayout>
#include <spdlog/spdlog.h>

namespace trremote::ui {

MainWindow::MainWindow(core::WindowId id, core::EventBus& bus, infra::ConfigManager& config,
                       app::CommandHandler& commands, infra::PollerSupervisor& poller,
                       QWidget* parent)
    : QMainWindow(parent), id_(id), bus_(bus), config_(config), commands_(commands),
      poller_(poller) {
    setWindowTitle("TrRemote");
    setMinimumSize(640, 400);

    setupUi();
    setupMenuBar();
    setupStatusBar();

    // The request may be published from any thread
    exitSubscription_ = bus_.subscribe(core::Topic::ExitRequested, id_, [this]() {
        QMetaObject::invokeMethod(this, [this]() { onExitRequested(); }, Qt::AutoConnection);
    });

    statusTimer_ = new QTimer(this);
    connect(statusTimer_, &QTimer::timeout, this, &MainWindow::updateStatusBar);
    statusTimer_->start(1000);
}

MainWindow::~MainWindow() {
    bus_.unsubscribe(exitSubscription_);
}

void MainWindow::setupUi() {
    auto* centralWidget = new QWidget(this);
    setCentralWidget(centralWidget);

    auto* mainLayout = new QVBoxLayout(centralWidget);
    mainLayout->setContentsMargins(0, 0, 0, 0);

    torrentList_ = new QListWidget(this);
    torrentList_->setSelectionMode(QAbstractItemView::SingleSelection);
    mainLayout->addWidget(torrentList_);

    connect(torrentList_, &QListWidget::itemSelectionChanged, this,
            [this]() { openExternallyAction_->setEnabled(torrentList_->currentItem() != nullptr); });
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");

    openAction_ = fileMenu->addAction("&Open Torrent...", this, &MainWindow::onOpenTorrent);
    openAction_->setShortcut(QKeySequence::Open);

    openExternallyAction_ =
        fileMenu->addAction("Open &Externally", this, &MainWindow::onOpenExternally);
    openExternallyAction_->setEnabled(false);

    fileMenu->addSeparator();

    quitAction_ = fileMenu->addAction("&Quit", this, &MainWindow::quitRequested);
    quitAction_->setShortcut(QKeySequence::Quit);

    auto* toolsMenu = menuBar()->addMenu("&Tools");
    toolsMenu->addAction("&Connection...", this, &MainWindow::onConnectionSettings);
    toolsMenu->addAction("&Restart Instance Listener", this, &MainWindow::onRestartListener);
}

void MainWindow::setupStatusBar() {
    statusLabel_ = new QLabel("Not connected", this);
    endpointLabel_ = new QLabel(this);

    statusBar()->addWidget(statusLabel_, 1);
    statusBar()->addPermanentWidget(endpointLabel_);
}

void MainWindow::showWindow() {
    restoreWindowState();
    show();
}

void MainWindow::focusWindow() {
    if (isMinimized()) {
        showNormal();
    }
    raise();
    activateWindow();
}

void MainWindow::openArguments(const core::ArgumentBatch& batch) {
    for (const auto& target : batch.paths) {
        addEntry(target);
    }
}

void MainWindow::setCloseRequestHandler(std::function<void()> handler) {
    closeHandler_ = std::move(handler);
}

void MainWindow::closeEvent(QCloseEvent* event) {
    // Closing is decided by the owner; the window is destroyed, never hidden
    event->ignore();
    if (closeHandler_) {
        closeHandler_();
    }
}

void MainWindow::onOpenTorrent() {
    const QStringList files = QFileDialog::getOpenFileNames(
        this, "Open Torrent", QString(), "Torrent files (*.torrent);;All files (*)");

    for (const auto& file : files) {
        addEntry(file.toStdString());
    }
}

void MainWindow::onOpenExternally() {
    auto* item = torrentList_->currentItem();
    if (!item) {
        return;
    }

    auto result = commands_.shellOpen(item->data(Qt::UserRole).toString().toStdString());
    if (!result.success) {
        QMessageBox::warning(this, "Open Externally", QString::fromStdString(result.errorMessage));
    }
}

void MainWindow::onConnectionSettings() {
    auto current = poller_.config();
    core::PollerConfig config = current ? *current : config_.config().poller;

    bool ok = false;
    const QString host = QInputDialog::getText(this, "Connection", "Daemon host:",
                                               QLineEdit::Normal,
                                               QString::fromStdString(config.host), &ok);
    if (!ok) {
        return;
    }

    const int port = QInputDialog::getInt(this, "Connection", "RPC port:", config.port, 1, 65535,
                                          1, &ok);
    if (!ok) {
        return;
    }

    auto j = config.toJson();
    j["host"] = host.trimmed().toStdString();
    j["port"] = port;

    auto result = commands_.setPollerConfig(j);
    if (!result.success) {
        QMessageBox::warning(this, "Connection", QString::fromStdString(result.errorMessage));
        return;
    }

    config_.config().poller = core::PollerConfig::fromJson(j);
    config_.save();
    statusLabel_->setText("Connecting...");
}

void MainWindow::onRestartListener() {
    emit listenerRestartRequested();
    statusBar()->showMessage("Instance listener restarted", 3000);
}

void MainWindow::updateStatusBar() {
    auto snapshot = poller_.snapshot();
    if (!snapshot) {
        return;
    }

    endpointLabel_->setText(QString::fromStdString(snapshot->endpoint));

    if (!snapshot->success) {
        statusLabel_->setText(QString("Error: %1").arg(QString::fromStdString(snapshot->errorMessage)));
        return;
    }

    const auto& data = snapshot->data;
    if (!data.is_object()) {
        statusLabel_->setText("Connected");
        return;
    }

    try {
        const int active = data.value("activeTorrentCount", 0);
        const int total = data.value("torrentCount", 0);
        const int64_t down = data.value("downloadSpeed", int64_t{0});
        const int64_t up = data.value("uploadSpeed", int64_t{0});

        statusLabel_->setText(QString("%1 of %2 torrents active | down %3 KiB/s | up %4 KiB/s")
                                  .arg(active)
                                  .arg(total)
                                  .arg(down / 1024)
                                  .arg(up / 1024));
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("Unexpected session stats: {}", e.what());
        statusLabel_->setText("Connected");
    }
}

void MainWindow::onExitRequested() {
    spdlog::debug("Window {} flushing state before exit", id_);
    saveWindowState();
    bus_.publish(core::Topic::FrontendDone, id_);
}

void MainWindow::addEntry(const std::string& target) {
    QString label = QString::fromStdString(target);

    const QUrl url = app::CommandHandler::toUrl(target);
    if (url.isLocalFile()) {
        auto result = commands_.readFile(url.toLocalFile().toStdString());
        if (result.success) {
            label += QString(" (%1 bytes)").arg(result.data["size"].get<qint64>());
        } else {
            label += QString(" (%1)").arg(QString::fromStdString(result.errorMessage));
        }
    }

    auto* item = new QListWidgetItem(label, torrentList_);
    item->setData(Qt::UserRole, QString::fromStdString(target));
    torrentList_->setCurrentItem(item);
}

void MainWindow::saveWindowState() {
    auto& config = config_.config();

    auto geom = geometry();
    config.windowX = geom.x();
    config.windowY = geom.y();
    config.windowWidth = geom.width();
    config.windowHeight = geom.height();

    config_.save();
}

void MainWindow::restoreWindowState() {
    const auto& config = config_.config();
    setGeometry(config.windowX, config.windowY, config.windowWidth, config.windowHeight);
}

} // namespace trremote::ui
