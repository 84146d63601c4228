#pragma once

#include "core/services/IRemoteService.hpp"
#include "core/types/PollerTypes.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace trremote::infra {

/**
 * @brief Owns the recurring background poll and its snapshot cache.
 *
 * One poll runs at a time on the AsioContext. A cycle reads the current
 * configuration once, when it starts, and uses that object until it
 * finishes, so configure() never exposes a half-applied configuration.
 *
 * The supervisor is independent of the window lifecycle: it keeps polling
 * while no window exists.
 */
class PollerSupervisor {
public:
    using SnapshotCallback = std::function<void(const core::PollSnapshot&)>;

    /**
     * @brief Delay before re-checking when no configuration has been set.
     */
    static constexpr std::chrono::milliseconds IDLE_RECHECK{1000};

    /**
     * @brief Constructs a stopped supervisor.
     * @param context Context whose workers run the poll timer.
     * @param service Remote service queried on every cycle.
     */
    PollerSupervisor(AsioContext& context, std::shared_ptr<core::IRemoteService> service);

    /**
     * @brief Stops polling.
     */
    ~PollerSupervisor();

    PollerSupervisor(const PollerSupervisor&) = delete;
    PollerSupervisor& operator=(const PollerSupervisor&) = delete;

    /**
     * @brief Replaces the configuration used by subsequent cycles.
     * @param config New configuration.
     * @return Error description if the configuration is invalid or rejected
     *         by the remote service; the previous configuration is kept then.
     */
    std::optional<std::string> configure(const core::PollerConfig& config);

    /**
     * @brief Starts polling. Calling it while running has no effect.
     */
    void start();

    /**
     * @brief Stops polling. The result of a cycle in flight is discarded.
     */
    void stop();

    [[nodiscard]] bool isRunning() const;

    /**
     * @brief Returns the configuration the next cycle will use.
     * @return Shared immutable configuration, or nullptr if none was set.
     */
    [[nodiscard]] std::shared_ptr<const core::PollerConfig> config() const;

    /**
     * @brief Returns the result of the most recent completed cycle.
     */
    [[nodiscard]] std::optional<core::PollSnapshot> snapshot() const;

    /**
     * @brief Number of poll cycles started since construction.
     */
    [[nodiscard]] uint64_t cycleCount() const { return cycles_; }

    /**
     * @brief Sets a callback invoked on a worker thread after every cycle.
     */
    void setSnapshotCallback(SnapshotCallback callback);

private:
    struct Run {
        explicit Run(asio::io_context& ctx) : timer(ctx) {}

        asio::steady_timer timer;
        std::atomic<bool> active{true};
    };

    void scheduleCycle(const std::shared_ptr<Run>& run, std::chrono::milliseconds delay);
    void runCycle(const std::shared_ptr<Run>& run);
    void completeCycle(const std::shared_ptr<Run>& run,
                       const std::shared_ptr<const core::PollerConfig>& config, uint64_t cycle,
                       core::PollSnapshot snapshot);

    AsioContext& context_;
    std::shared_ptr<core::IRemoteService> service_;

    mutable std::mutex configMutex_;
    std::shared_ptr<const core::PollerConfig> config_;

    mutable std::mutex runMutex_;
    std::shared_ptr<Run> run_;

    mutable std::mutex snapshotMutex_;
    std::optional<core::PollSnapshot> snapshot_;
    SnapshotCallback callback_;

    std::atomic<uint64_t> cycles_{0};
};

} // namespace trremote::infra
