/**
 * @file IInstanceChannel.hpp
 * @brief Interface for single-instance arbitration and argument forwarding.
 *
 * All process-boundary concerns of the application live behind this
 * interface: claiming the per-session instance lock, accepting connections
 * from later launches and sending arguments to the running instance.
 */

#pragma once

#include "core/types/ArgumentBatch.hpp"
#include "core/types/Lifecycle.hpp"

#include <functional>
#include <optional>
#include <string>

namespace trremote::core {

/**
 * @brief Failure categories reported by the channel.
 */
enum class ChannelErrorCode : int {
    NotBound = 0,     ///< tryBind() has not been called
    NotPrimary = 1,   ///< Operation requires the primary role
    ListenFailed = 2, ///< Local server could not be started
    NoListener = 3,   ///< No primary accepted the connection
    WriteFailed = 4   ///< Connection established but the payload was not written
};

/**
 * @brief Error value returned by channel operations.
 */
struct ChannelError {
    ChannelErrorCode code{ChannelErrorCode::NotBound}; ///< Failure category
    std::string message;                               ///< Human-readable detail for logs

    [[nodiscard]] std::string codeToString() const {
        switch (code) {
        case ChannelErrorCode::NotBound:
            return "NotBound";
        case ChannelErrorCode::NotPrimary:
            return "NotPrimary";
        case ChannelErrorCode::ListenFailed:
            return "ListenFailed";
        case ChannelErrorCode::NoListener:
            return "NoListener";
        case ChannelErrorCode::WriteFailed:
            return "WriteFailed";
        }
        return "Unknown";
    }
};

/**
 * @brief Per-session single-instance endpoint.
 *
 * Operations that can fail return std::nullopt on success and a
 * ChannelError otherwise; none of them throws.
 */
class IInstanceChannel {
public:
    /**
     * @brief Called on the owner's thread for every batch received.
     */
    using BatchHandler = std::function<void(const ArgumentBatch&)>;

    virtual ~IInstanceChannel() = default;

    /**
     * @brief Claims the endpoint without blocking.
     * @return Primary if this process now owns it, Secondary otherwise.
     *
     * The role is decided by the first call; later calls return it again.
     */
    virtual InstanceRole tryBind() = 0;

    /**
     * @brief Starts accepting batches from secondary instances.
     * @param handler Receives every forwarded batch.
     * @return Error if the listener could not be started. The listener is
     *         then torn down and the process stays a degraded primary.
     */
    virtual std::optional<ChannelError> listen(BatchHandler handler) = 0;

    /**
     * @brief Transmits a batch to the listening primary.
     * @param batch Arguments to forward.
     * @return Error if the batch could not be delivered.
     *
     * On a primary the batch goes to its own handler when listening and is
     * dropped silently otherwise.
     */
    virtual std::optional<ChannelError> send(const ArgumentBatch& batch) = 0;

    /**
     * @brief Re-arms a stopped listener. No effect while listening.
     */
    virtual void start() = 0;

    /**
     * @brief Stops listening and releases the endpoint. Idempotent.
     */
    virtual void stop() = 0;

    [[nodiscard]] virtual ListenerState listenerState() const = 0;
    [[nodiscard]] virtual std::optional<InstanceRole> role() const = 0;
};

} // namespace trremote::core
