#include <catch2/catch_test_macros.hpp>

#include "core/services/IRemoteService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/poller/PollerSupervisor.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace trremote::core;
using namespace trremote::infra;

namespace {

class FakeRemoteService : public IRemoteService {
public:
    std::optional<std::string> apply(const PollerConfig& config) override {
        if (throwOnApply) {
            throw std::runtime_error("service exploded");
        }
        if (rejectApply) {
            return std::string("rejected by daemon");
        }
        std::lock_guard lock(mutex_);
        applied_.push_back(config);
        return std::nullopt;
    }

    void pollAsync(const PollerConfig& config, PollCallback callback) override {
        {
            std::lock_guard lock(mutex_);
            polled_.push_back(config);
            if (deferCallbacks) {
                pending_.push_back(std::move(callback));
                return;
            }
        }

        PollSnapshot snapshot;
        snapshot.success = true;
        snapshot.data = {{"host", config.host}};
        callback(snapshot);
    }

    std::vector<PollerConfig> polled() const {
        std::lock_guard lock(mutex_);
        return polled_;
    }

    size_t appliedCount() const {
        std::lock_guard lock(mutex_);
        return applied_.size();
    }

    void completePending(bool success) {
        std::vector<PollCallback> pending;
        {
            std::lock_guard lock(mutex_);
            pending.swap(pending_);
        }
        for (auto& callback : pending) {
            PollSnapshot snapshot;
            snapshot.success = success;
            snapshot.errorMessage = success ? "" : "connection refused";
            callback(snapshot);
        }
    }

    size_t pendingCount() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

    std::atomic<bool> rejectApply{false};
    std::atomic<bool> throwOnApply{false};
    std::atomic<bool> deferCallbacks{false};

private:
    mutable std::mutex mutex_;
    std::vector<PollerConfig> applied_;
    std::vector<PollerConfig> polled_;
    std::vector<PollCallback> pending_;
};

PollerConfig makeConfig(const std::string& host, int intervalSeconds = 1) {
    PollerConfig config;
    config.host = host;
    config.username = "user-" + host;
    config.intervalSeconds = intervalSeconds;
    return config;
}

template <typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

TEST_CASE("PollerSupervisor configuration", "[PollerSupervisor]") {
    AsioContext context(1);
    auto service = std::make_shared<FakeRemoteService>();
    PollerSupervisor poller(context, service);

    SECTION("Starts without configuration") {
        REQUIRE(poller.config() == nullptr);
        REQUIRE_FALSE(poller.snapshot().has_value());
        REQUIRE_FALSE(poller.isRunning());
    }

    SECTION("Valid configuration is applied and swapped in") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha")).has_value());
        REQUIRE(service->appliedCount() == 1);
        REQUIRE(poller.config() != nullptr);
        REQUIRE(poller.config()->host == "alpha");
    }

    SECTION("Invalid configuration is rejected before the service sees it") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha")).has_value());

        auto invalid = makeConfig("beta");
        invalid.port = 0;
        auto error = poller.configure(invalid);

        REQUIRE(error.has_value());
        REQUIRE(service->appliedCount() == 1);
        REQUIRE(poller.config()->host == "alpha");
    }

    SECTION("Service rejection keeps the previous configuration") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha")).has_value());

        service->rejectApply = true;
        auto error = poller.configure(makeConfig("beta"));

        REQUIRE(error.has_value());
        REQUIRE(*error == "rejected by daemon");
        REQUIRE(poller.config()->host == "alpha");
    }

    SECTION("Service exceptions become errors") {
        service->throwOnApply = true;
        auto error = poller.configure(makeConfig("alpha"));

        REQUIRE(error.has_value());
        REQUIRE(poller.config() == nullptr);
    }
}

TEST_CASE("PollerSupervisor cycles", "[PollerSupervisor]") {
    AsioContext context(2);
    context.start();

    auto service = std::make_shared<FakeRemoteService>();
    PollerSupervisor poller(context, service);

    SECTION("First cycle runs immediately and is cached") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha")).has_value());

        std::atomic<int> callbacks{0};
        poller.setSnapshotCallback([&callbacks](const PollSnapshot&) { ++callbacks; });

        poller.start();
        REQUIRE(waitFor([&]() { return poller.snapshot().has_value(); }));

        auto snapshot = poller.snapshot();
        REQUIRE(snapshot->cycle == 1);
        REQUIRE(snapshot->success);
        REQUIRE(snapshot->endpoint == "http://alpha:9091/transmission/rpc");
        REQUIRE(snapshot->data["host"] == "alpha");
        REQUIRE(snapshot->timestamp != std::chrono::system_clock::time_point{});
        REQUIRE(callbacks >= 1);

        poller.stop();
    }

    SECTION("start is idempotent") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha", 5)).has_value());

        poller.start();
        poller.start();
        REQUIRE(poller.isRunning());

        REQUIRE(waitFor([&]() { return poller.cycleCount() >= 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        REQUIRE(poller.cycleCount() == 1);

        poller.stop();
        poller.stop();
        REQUIRE_FALSE(poller.isRunning());
    }

    SECTION("Without configuration no cycle runs until one is set") {
        poller.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        REQUIRE(poller.cycleCount() == 0);

        REQUIRE_FALSE(poller.configure(makeConfig("late")).has_value());
        REQUIRE(waitFor([&]() { return poller.cycleCount() >= 1; }));
        REQUIRE(service->polled().front().host == "late");

        poller.stop();
    }

    SECTION("Results arriving after stop are discarded") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha")).has_value());
        service->deferCallbacks = true;

        std::atomic<int> callbacks{0};
        poller.setSnapshotCallback([&callbacks](const PollSnapshot&) { ++callbacks; });

        poller.start();
        REQUIRE(waitFor([&]() { return service->pendingCount() == 1; }));

        poller.stop();
        service->completePending(true);

        REQUIRE_FALSE(poller.snapshot().has_value());
        REQUIRE(callbacks == 0);
    }

    SECTION("Failed polls are cached as failures") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha")).has_value());
        service->deferCallbacks = true;

        poller.start();
        REQUIRE(waitFor([&]() { return service->pendingCount() == 1; }));
        service->completePending(false);

        auto snapshot = poller.snapshot();
        REQUIRE(snapshot.has_value());
        REQUIRE_FALSE(snapshot->success);
        REQUIRE(snapshot->errorMessage == "connection refused");

        poller.stop();
    }

    SECTION("Poller can be restarted after stop") {
        REQUIRE_FALSE(poller.configure(makeConfig("alpha", 5)).has_value());

        poller.start();
        REQUIRE(waitFor([&]() { return poller.cycleCount() == 1; }));
        poller.stop();

        poller.start();
        REQUIRE(waitFor([&]() { return poller.cycleCount() == 2; }));
        poller.stop();
    }
}

TEST_CASE("PollerSupervisor swaps configuration atomically", "[PollerSupervisor]") {
    AsioContext context(2);
    context.start();

    auto service = std::make_shared<FakeRemoteService>();
    PollerSupervisor poller(context, service);
    REQUIRE_FALSE(poller.configure(makeConfig("host-0")).has_value());

    poller.start();

    std::atomic<bool> done{false};
    std::atomic<bool> tornRead{false};
    std::thread writer([&]() {
        int n = 1;
        while (!done) {
            if (poller.configure(makeConfig("host-" + std::to_string(n++))).has_value()) {
                tornRead = true;
            }
            auto current = poller.config();
            if (current->username != "user-" + current->host) {
                tornRead = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    REQUIRE(waitFor([&]() { return poller.cycleCount() >= 2; }));
    done = true;
    writer.join();
    poller.stop();

    REQUIRE_FALSE(tornRead);

    // Every cycle saw a configuration as a whole, never a mix of two
    for (const auto& config : service->polled()) {
        REQUIRE(config.username == "user-" + config.host);
    }
}
