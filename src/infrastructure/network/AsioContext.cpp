#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace trremote::infra {

AsioContext::AsioContext(size_t threadCount) : threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    std::lock_guard lock(workersMutex_);
    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { runWorker(i); });
        workerIds_.push_back(threads_.back().get_id());
    }

    spdlog::debug("Background context running with {} worker(s)", threadCount_);
}

void AsioContext::stop() {
    if (isWorkerThread()) {
        spdlog::error("Background context cannot be stopped from one of its own workers");
        return;
    }
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    std::vector<std::thread> threads;
    {
        std::lock_guard lock(workersMutex_);
        threads.swap(threads_);
        workerIds_.clear();
    }
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    ioContext_.restart();
    spdlog::debug("Background context stopped");
}

bool AsioContext::isWorkerThread() const {
    std::lock_guard lock(workersMutex_);
    return std::find(workerIds_.begin(), workerIds_.end(), std::this_thread::get_id()) !=
           workerIds_.end();
}

void AsioContext::runWorker(size_t index) {
    spdlog::debug("Background worker {} started", index);

    // A throwing handler must not take the whole pool down
    for (;;) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            spdlog::error("Unhandled exception in background worker {}: {}", index, e.what());
        }
    }

    spdlog::debug("Background worker {} stopped", index);
}

} // namespace trremote::infra
