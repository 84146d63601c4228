#pragma once

#include "core/services/IInstanceChannel.hpp"

#include <QLocalServer>
#include <QLocalSocket>
#include <QLockFile>
#include <QObject>
#include <chrono>
#include <memory>
#include <mutex>

namespace trremote::infra {

/**
 * @brief Single-instance channel backed by a lock file and a local socket.
 *
 * The lock file (created with O_EXCL by QLockFile) arbitrates which process
 * is primary. The primary then serves a QLocalServer under the same key;
 * secondaries connect and write one length-prefixed frame per batch.
 *
 * Lives on the thread that runs its event loop; listener state is guarded by
 * one mutex so senders and the restart path observe a consistent state.
 */
class LocalInstanceChannel : public QObject, public core::IInstanceChannel {
    Q_OBJECT

public:
    /**
     * @brief Constructs a channel for the given key.
     * @param key Application-specific endpoint name.
     * @param lockDir Directory holding "<key>.lock"; empty selects the user
     *        runtime directory.
     * @param ioTimeout Bound for every blocking connect/write on the send path.
     * @param parent Optional parent QObject.
     */
    explicit LocalInstanceChannel(const QString& key, const QString& lockDir = {},
                                  std::chrono::milliseconds ioTimeout = std::chrono::milliseconds(1000),
                                  QObject* parent = nullptr);
    ~LocalInstanceChannel() override;

    core::InstanceRole tryBind() override;
    std::optional<core::ChannelError> listen(BatchHandler handler) override;
    std::optional<core::ChannelError> send(const core::ArgumentBatch& batch) override;
    void start() override;
    void stop() override;

    [[nodiscard]] core::ListenerState listenerState() const override;
    [[nodiscard]] std::optional<core::InstanceRole> role() const override;

    [[nodiscard]] QString key() const { return key_; }
    [[nodiscard]] std::chrono::milliseconds ioTimeout() const { return ioTimeout_; }
    [[nodiscard]] QString lockFilePath() const { return lockPath_; }

private slots:
    void onNewConnection();

private:
    bool startServerLocked(QString* errorString);
    void closeServerLocked();
    void drainConnection(QLocalSocket* socket);
    void deliver(const core::ArgumentBatch& batch);
    std::optional<core::ChannelError> sendToPrimary(const core::ArgumentBatch& batch);

    QString key_;
    QString lockPath_;
    std::chrono::milliseconds ioTimeout_;
    QLockFile lockFile_;
    std::unique_ptr<QLocalServer> server_;

    mutable std::mutex mutex_;
    std::optional<core::InstanceRole> role_;
    core::ListenerState state_{core::ListenerState::Unbound};
    bool lockHeld_{false};
    BatchHandler handler_;
};

} // namespace trremote::infra
