#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace trremote::infra;
using namespace trremote::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "trremote_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const nlohmann::json& j) const {
        std::ofstream file(configDir_ / "config.json");
        file << j.dump(2);
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "trremote_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));
        REQUIRE(manager.configDir() == tempPath.string());

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets correct config path") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
    }
}

TEST_CASE("ConfigManager load operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("load writes defaults when the file does not exist") {
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.instanceKey == "TrRemote-SingleInstance");
        REQUIRE(config.instanceConnectTimeoutMs == 1000);
        REQUIRE(config.closeToTray == true);
        REQUIRE(config.startMinimized == false);
        REQUIRE(config.shutdownAckTimeoutMs == 0);
        REQUIRE(config.poller == PollerConfig{});
        REQUIRE(config.logLevel == "info");
        REQUIRE(config.windowX == 100);
        REQUIRE(config.windowY == 100);
        REQUIRE(config.windowWidth == 1024);
        REQUIRE(config.windowHeight == 700);
    }

    SECTION("load reads an existing file") {
        nlohmann::json j;
        j["instance"]["key"] = "custom-key";
        j["general"]["close_to_tray"] = false;
        j["general"]["start_minimized"] = true;
        j["shutdown"]["ack_timeout_ms"] = 3000;
        j["poller"]["host"] = "nas.local";
        j["poller"]["interval_seconds"] = 30;
        j["logging"]["level"] = "debug";
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.instanceKey == "custom-key");
        REQUIRE(config.closeToTray == false);
        REQUIRE(config.startMinimized == true);
        REQUIRE(config.shutdownAckTimeoutMs == 3000);
        REQUIRE(config.poller.host == "nas.local");
        REQUIRE(config.poller.intervalSeconds == 30);
        REQUIRE(config.poller.port == 9091);
        REQUIRE(config.logLevel == "debug");
    }

    SECTION("load handles partial config with defaults for missing fields") {
        nlohmann::json j;
        j["general"]["start_minimized"] = true;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        manager.load();

        REQUIRE(manager.config().startMinimized == true);
        REQUIRE(manager.config().closeToTray == true);
        REQUIRE(manager.config().instanceConnectTimeoutMs == 1000);
    }

    SECTION("load returns false for invalid JSON") {
        std::ofstream file(testDir.path() / "config.json");
        file << "{ invalid json content }}}";
        file.close();

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }

    SECTION("load replaces unusable instance settings with defaults") {
        nlohmann::json j;
        j["instance"]["key"] = "";
        j["instance"]["connect_timeout_ms"] = -1;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().instanceKey == "TrRemote-SingleInstance");
        REQUIRE(manager.config().instanceConnectTimeoutMs == 1000);
    }

    SECTION("load rejects zero and oversized connect timeouts") {
        nlohmann::json j;
        j["instance"]["connect_timeout_ms"] = 0;
        testDir.write(j);

        ConfigManager zero(testDir.path());
        REQUIRE(zero.load());
        REQUIRE(zero.config().instanceConnectTimeoutMs == 1000);

        j["instance"]["connect_timeout_ms"] = int64_t{1} << 40;
        testDir.write(j);

        ConfigManager huge(testDir.path());
        REQUIRE(huge.load());
        REQUIRE(huge.config().instanceConnectTimeoutMs == 1000);
    }

    SECTION("load keeps a valid connect timeout") {
        nlohmann::json j;
        j["instance"]["connect_timeout_ms"] = 250;
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().instanceConnectTimeoutMs == 250);
    }

    SECTION("load returns false for wrongly typed values") {
        nlohmann::json j;
        j["poller"]["port"] = "ninety";
        testDir.write(j);

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager save operations", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("save preserves all configuration fields") {
        ConfigManager manager(testDir.path());

        auto& config = manager.config();
        config.instanceKey = "other";
        config.instanceConnectTimeoutMs = 250;
        config.closeToTray = false;
        config.startMinimized = true;
        config.shutdownAckTimeoutMs = 1500;
        config.poller.host = "192.168.1.10";
        config.poller.port = 9092;
        config.poller.useTls = true;
        config.poller.username = "admin";
        config.logLevel = "warn";
        config.windowX = 200;
        config.windowY = 150;
        config.windowWidth = 1400;
        config.windowHeight = 900;

        REQUIRE(manager.save());

        ConfigManager manager2(testDir.path());
        REQUIRE(manager2.load());

        const auto& loaded = manager2.config();
        REQUIRE(loaded.instanceKey == "other");
        REQUIRE(loaded.instanceConnectTimeoutMs == 250);
        REQUIRE(loaded.closeToTray == false);
        REQUIRE(loaded.startMinimized == true);
        REQUIRE(loaded.shutdownAckTimeoutMs == 1500);
        REQUIRE(loaded.poller == config.poller);
        REQUIRE(loaded.logLevel == "warn");
        REQUIRE(loaded.windowX == 200);
        REQUIRE(loaded.windowY == 150);
        REQUIRE(loaded.windowWidth == 1400);
        REQUIRE(loaded.windowHeight == 900);
    }
}
