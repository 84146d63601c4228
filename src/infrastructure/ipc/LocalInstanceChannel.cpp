#include "infrastructure/ipc/LocalInstanceChannel.hpp"

#include <QDataStream>
#include <QDir>
#include <QStandardPaths>
#include <spdlog/spdlog.h>

#include <limits>

namespace trremote::infra {

namespace {

constexpr auto STREAM_VERSION = QDataStream::Qt_6_0;

QString resolveLockPath(const QString& key, const QString& lockDir) {
    QString dir = lockDir;
    if (dir.isEmpty()) {
        dir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (dir.isEmpty()) {
        dir = QDir::tempPath();
    }
    QDir().mkpath(dir);
    return QDir(dir).filePath(key + ".lock");
}

constexpr std::chrono::milliseconds DEFAULT_IO_TIMEOUT{1000};

} // namespace

LocalInstanceChannel::LocalInstanceChannel(const QString& key, const QString& lockDir,
                                           std::chrono::milliseconds ioTimeout, QObject* parent)
    : QObject(parent), key_(key), lockPath_(resolveLockPath(key, lockDir)), ioTimeout_(ioTimeout),
      lockFile_(lockPath_) {
    // Only a dead owner makes the lock stale; a long-running primary does not
    lockFile_.setStaleLockTime(0);

    // QLocalSocket waits forever on a negative timeout
    if (ioTimeout_.count() <= 0 || ioTimeout_.count() > std::numeric_limits<int>::max()) {
        spdlog::warn("Instance channel timeout of {} ms out of range, using {} ms",
                     ioTimeout_.count(), DEFAULT_IO_TIMEOUT.count());
        ioTimeout_ = DEFAULT_IO_TIMEOUT;
    }
}

LocalInstanceChannel::~LocalInstanceChannel() {
    std::lock_guard lock(mutex_);
    closeServerLocked();
    if (lockHeld_) {
        lockFile_.unlock();
        lockHeld_ = false;
    }
}

core::InstanceRole LocalInstanceChannel::tryBind() {
    std::lock_guard lock(mutex_);
    if (role_) {
        return *role_;
    }

    if (lockFile_.tryLock(0)) {
        lockHeld_ = true;
        role_ = core::InstanceRole::Primary;
        spdlog::info("Acquired instance lock {}", lockPath_.toStdString());
    } else {
        role_ = core::InstanceRole::Secondary;
        if (lockFile_.error() == QLockFile::LockFailedError) {
            spdlog::info("Another instance owns {}", lockPath_.toStdString());
        } else {
            spdlog::warn("Could not create instance lock {} (error {}), acting as secondary",
                         lockPath_.toStdString(), static_cast<int>(lockFile_.error()));
        }
    }
    return *role_;
}

std::optional<core::ChannelError> LocalInstanceChannel::listen(BatchHandler handler) {
    std::lock_guard lock(mutex_);
    if (!role_) {
        return core::ChannelError{core::ChannelErrorCode::NotBound, "tryBind() was not called"};
    }
    if (*role_ != core::InstanceRole::Primary) {
        return core::ChannelError{core::ChannelErrorCode::NotPrimary,
                                  "only the primary instance can listen"};
    }
    if (state_ == core::ListenerState::Listening) {
        handler_ = std::move(handler);
        return std::nullopt;
    }

    handler_ = std::move(handler);

    QString errorString;
    if (!startServerLocked(&errorString)) {
        closeServerLocked();
        state_ = core::ListenerState::Stopped;
        return core::ChannelError{core::ChannelErrorCode::ListenFailed, errorString.toStdString()};
    }

    state_ = core::ListenerState::Listening;
    spdlog::info("Single instance listener started on {}", server_->fullServerName().toStdString());
    return std::nullopt;
}

std::optional<core::ChannelError> LocalInstanceChannel::send(const core::ArgumentBatch& batch) {
    std::optional<core::InstanceRole> role;
    core::ListenerState state;
    {
        std::lock_guard lock(mutex_);
        role = role_;
        state = state_;
    }

    if (!role) {
        return core::ChannelError{core::ChannelErrorCode::NotBound, "tryBind() was not called"};
    }

    if (*role == core::InstanceRole::Secondary) {
        return sendToPrimary(batch);
    }

    if (state != core::ListenerState::Listening) {
        spdlog::debug("Listener not running, dropping {} local argument(s)", batch.size());
        return std::nullopt;
    }
    if (batch.empty()) {
        return std::nullopt;
    }

    // Queued so the batch is seen after the caller finished its current step
    QMetaObject::invokeMethod(
        this, [this, batch]() { deliver(batch); }, Qt::QueuedConnection);
    return std::nullopt;
}

std::optional<core::ChannelError>
LocalInstanceChannel::sendToPrimary(const core::ArgumentBatch& batch) {
    const int timeoutMs = static_cast<int>(ioTimeout_.count());

    QLocalSocket socket;
    socket.connectToServer(key_);
    if (!socket.waitForConnected(timeoutMs)) {
        return core::ChannelError{core::ChannelErrorCode::NoListener,
                                  socket.errorString().toStdString()};
    }

    QByteArray frame;
    {
        QDataStream out(&frame, QIODevice::WriteOnly);
        out.setVersion(STREAM_VERSION);
        out << QByteArray::fromStdString(batch.serialize());
    }

    if (socket.write(frame) != frame.size()) {
        return core::ChannelError{core::ChannelErrorCode::WriteFailed,
                                  socket.errorString().toStdString()};
    }
    while (socket.bytesToWrite() > 0) {
        if (!socket.waitForBytesWritten(timeoutMs)) {
            return core::ChannelError{core::ChannelErrorCode::WriteFailed,
                                      socket.errorString().toStdString()};
        }
    }

    socket.disconnectFromServer();
    if (socket.state() != QLocalSocket::UnconnectedState) {
        socket.waitForDisconnected(timeoutMs);
    }

    spdlog::debug("Forwarded {} argument(s) to primary instance", batch.size());
    return std::nullopt;
}

void LocalInstanceChannel::start() {
    std::lock_guard lock(mutex_);
    if (role_ != core::InstanceRole::Primary) {
        spdlog::debug("Ignoring listener start on a non-primary instance");
        return;
    }
    if (state_ == core::ListenerState::Listening) {
        return;
    }
    if (!handler_) {
        spdlog::warn("Listener start requested before listen()");
        return;
    }

    if (!lockHeld_) {
        if (!lockFile_.tryLock(0)) {
            spdlog::warn("Cannot restart listener: instance lock is owned by another process");
            return;
        }
        lockHeld_ = true;
    }

    QString errorString;
    if (!startServerLocked(&errorString)) {
        closeServerLocked();
        spdlog::warn("Failed to restart single instance listener: {}",
                     errorString.toStdString());
        return;
    }

    state_ = core::ListenerState::Listening;
    spdlog::info("Single instance listener restarted");
}

void LocalInstanceChannel::stop() {
    std::lock_guard lock(mutex_);
    if (role_ != core::InstanceRole::Primary) {
        return;
    }

    closeServerLocked();
    if (lockHeld_) {
        lockFile_.unlock();
        lockHeld_ = false;
    }

    if (state_ != core::ListenerState::Stopped) {
        state_ = core::ListenerState::Stopped;
        spdlog::info("Single instance listener stopped");
    }
}

core::ListenerState LocalInstanceChannel::listenerState() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<core::InstanceRole> LocalInstanceChannel::role() const {
    std::lock_guard lock(mutex_);
    return role_;
}

bool LocalInstanceChannel::startServerLocked(QString* errorString) {
    // We own the lock, so any socket left under this name belongs to a dead primary
    QLocalServer::removeServer(key_);

    server_ = std::make_unique<QLocalServer>();
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    if (!server_->listen(key_)) {
        *errorString = server_->errorString();
        return false;
    }

    connect(server_.get(), &QLocalServer::newConnection, this,
            &LocalInstanceChannel::onNewConnection);
    return true;
}

void LocalInstanceChannel::closeServerLocked() {
    if (!server_) {
        return;
    }
    server_->close();
    server_.reset();
    QLocalServer::removeServer(key_);
}

void LocalInstanceChannel::onNewConnection() {
    QLocalServer* server = nullptr;
    {
        std::lock_guard lock(mutex_);
        server = server_.get();
    }
    if (!server) {
        return;
    }

    while (auto* socket = server->nextPendingConnection()) {
        socket->setParent(this);

        connect(socket, &QLocalSocket::readyRead, this,
                [this, socket]() { drainConnection(socket); });
        connect(socket, &QLocalSocket::disconnected, this, [this, socket]() {
            drainConnection(socket);
            socket->deleteLater();
        });

        if (socket->bytesAvailable() > 0) {
            drainConnection(socket);
        }
    }
}

void LocalInstanceChannel::drainConnection(QLocalSocket* socket) {
    QDataStream stream(socket);
    stream.setVersion(STREAM_VERSION);

    for (;;) {
        stream.startTransaction();
        QByteArray payload;
        stream >> payload;
        if (!stream.commitTransaction()) {
            // Incomplete frame, wait for more data
            return;
        }

        auto batch = core::ArgumentBatch::deserialize(payload.toStdString());
        if (!batch) {
            spdlog::warn("Discarding malformed argument batch ({} bytes)", payload.size());
            continue;
        }

        spdlog::info("Received {} argument(s) from another instance", batch->size());
        deliver(*batch);
    }
}

void LocalInstanceChannel::deliver(const core::ArgumentBatch& batch) {
    BatchHandler handler;
    {
        std::lock_guard lock(mutex_);
        if (state_ != core::ListenerState::Listening) {
            spdlog::debug("Listener stopped, dropping {} argument(s)", batch.size());
            return;
        }
        handler = handler_;
    }

    if (handler) {
        handler(batch);
    }
}

} // namespace trremote::infra
