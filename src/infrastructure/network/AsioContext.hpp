#pragma once

#include <asio.hpp>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace trremote::infra {

/**
 * @brief Asio io_context driven by a small pool of worker threads.
 *
 * Background work of the application (the poller's recurring timer) runs
 * here so the Qt event loop is never blocked by it. The context is owned by
 * the application and injected where needed.
 */
class AsioContext {
public:
    /**
     * @brief Creates the context; no thread runs before start().
     * @param threadCount Number of worker threads, at least one.
     */
    explicit AsioContext(size_t threadCount = 1);

    /**
     * @brief Stops the context and joins the workers.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the worker threads. No effect if already running.
     */
    void start();

    /**
     * @brief Stops the io_context and joins the workers.
     *
     * Pending handlers are dropped; the context can be started again.
     * Must not be called from one of the workers (it cannot join itself);
     * such a call is logged and ignored.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /**
     * @brief Whether the calling thread is one of the workers.
     */
    [[nodiscard]] bool isWorkerThread() const;

    asio::io_context& getContext() { return ioContext_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

private:
    void runWorker(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::vector<std::thread::id> workerIds_;
    mutable std::mutex workersMutex_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace trremote::infra
