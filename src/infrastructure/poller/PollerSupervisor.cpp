#include "infrastructure/poller/PollerSupervisor.hpp"

#include <spdlog/spdlog.h>

namespace trremote::infra {

PollerSupervisor::PollerSupervisor(AsioContext& context,
                                   std::shared_ptr<core::IRemoteService> service)
    : context_(context), service_(std::move(service)) {}

PollerSupervisor::~PollerSupervisor() {
    stop();
}

std::optional<std::string> PollerSupervisor::configure(const core::PollerConfig& config) {
    if (auto error = config.validationError()) {
        spdlog::warn("Rejected poller configuration: {}", *error);
        return error;
    }

    try {
        if (auto error = service_->apply(config)) {
            spdlog::warn("Remote service rejected configuration for {}: {}", config.endpoint(),
                         *error);
            return error;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to apply poller configuration: {}", e.what());
        return std::string(e.what());
    }

    auto next = std::make_shared<const core::PollerConfig>(config);
    {
        std::lock_guard lock(configMutex_);
        config_ = std::move(next);
    }

    spdlog::info("Poller configured for {} every {}s", config.endpoint(), config.intervalSeconds);
    return std::nullopt;
}

void PollerSupervisor::start() {
    std::shared_ptr<Run> run;
    {
        std::lock_guard lock(runMutex_);
        if (run_) {
            return;
        }
        run_ = std::make_shared<Run>(context_.getContext());
        run = run_;
    }

    spdlog::info("Poller started");
    scheduleCycle(run, std::chrono::milliseconds(0));
}

void PollerSupervisor::stop() {
    std::lock_guard lock(runMutex_);
    if (!run_) {
        return;
    }

    run_->active = false;
    run_->timer.cancel();
    run_.reset();
    spdlog::info("Poller stopped");
}

bool PollerSupervisor::isRunning() const {
    std::lock_guard lock(runMutex_);
    return run_ != nullptr;
}

std::shared_ptr<const core::PollerConfig> PollerSupervisor::config() const {
    std::lock_guard lock(configMutex_);
    return config_;
}

std::optional<core::PollSnapshot> PollerSupervisor::snapshot() const {
    std::lock_guard lock(snapshotMutex_);
    return snapshot_;
}

void PollerSupervisor::setSnapshotCallback(SnapshotCallback callback) {
    std::lock_guard lock(snapshotMutex_);
    callback_ = std::move(callback);
}

void PollerSupervisor::scheduleCycle(const std::shared_ptr<Run>& run,
                                     std::chrono::milliseconds delay) {
    std::lock_guard lock(runMutex_);
    if (!run->active) {
        return;
    }

    run->timer.expires_after(delay);
    run->timer.async_wait([this, run](const asio::error_code& ec) {
        if (ec || !run->active) {
            return;
        }
        runCycle(run);
    });
}

void PollerSupervisor::runCycle(const std::shared_ptr<Run>& run) {
    auto cycleConfig = config();
    if (!cycleConfig) {
        scheduleCycle(run, IDLE_RECHECK);
        return;
    }

    const uint64_t cycle = ++cycles_;
    spdlog::debug("Poll cycle {} against {}", cycle, cycleConfig->endpoint());

    try {
        service_->pollAsync(*cycleConfig, [this, run, cycleConfig, cycle](core::PollSnapshot result) {
            completeCycle(run, cycleConfig, cycle, std::move(result));
        });
    } catch (const std::exception& e) {
        core::PollSnapshot failed;
        failed.success = false;
        failed.errorMessage = e.what();
        completeCycle(run, cycleConfig, cycle, std::move(failed));
    }
}

void PollerSupervisor::completeCycle(const std::shared_ptr<Run>& run,
                                     const std::shared_ptr<const core::PollerConfig>& config,
                                     uint64_t cycle, core::PollSnapshot snapshot) {
    if (!run->active) {
        spdlog::debug("Discarding result of poll cycle {} after stop", cycle);
        return;
    }

    snapshot.cycle = cycle;
    if (snapshot.endpoint.empty()) {
        snapshot.endpoint = config->endpoint();
    }
    if (snapshot.timestamp == std::chrono::system_clock::time_point{}) {
        snapshot.timestamp = std::chrono::system_clock::now();
    }
    if (!snapshot.success) {
        spdlog::debug("Poll cycle {} failed: {}", cycle, snapshot.errorMessage);
    }

    SnapshotCallback callback;
    {
        std::lock_guard lock(snapshotMutex_);
        snapshot_ = snapshot;
        callback = callback_;
    }

    if (callback) {
        try {
            callback(snapshot);
        } catch (const std::exception& e) {
            spdlog::error("Snapshot callback failed: {}", e.what());
        }
    }

    // The interval of the newest configuration decides when the next cycle runs
    auto current = this->config();
    int intervalSeconds = current ? current->intervalSeconds : config->intervalSeconds;
    scheduleCycle(run, std::chrono::seconds(intervalSeconds));
}

} // namespace trremote::infra
