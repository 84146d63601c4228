#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <limits>

namespace trremote::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["instance"]["key"] = config_.instanceKey;
    j["instance"]["connect_timeout_ms"] = config_.instanceConnectTimeoutMs;

    j["general"]["close_to_tray"] = config_.closeToTray;
    j["general"]["start_minimized"] = config_.startMinimized;

    j["shutdown"]["ack_timeout_ms"] = config_.shutdownAckTimeoutMs;

    j["poller"] = config_.poller.toJson();

    j["logging"]["level"] = config_.logLevel;

    j["window"]["x"] = config_.windowX;
    j["window"]["y"] = config_.windowY;
    j["window"]["width"] = config_.windowWidth;
    j["window"]["height"] = config_.windowHeight;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    if (j.contains("instance")) {
        const auto& i = j["instance"];
        const AppConfig defaults;

        config_.instanceKey = i.value("key", defaults.instanceKey);
        if (config_.instanceKey.empty()) {
            spdlog::warn("Empty instance.key, using '{}'", defaults.instanceKey);
            config_.instanceKey = defaults.instanceKey;
        }

        // Non-positive waits mean "forever" to QLocalSocket
        const auto timeoutMs = i.value("connect_timeout_ms", int64_t{defaults.instanceConnectTimeoutMs});
        if (timeoutMs <= 0 || timeoutMs > std::numeric_limits<int>::max()) {
            spdlog::warn("instance.connect_timeout_ms {} out of range, using {}", timeoutMs,
                         defaults.instanceConnectTimeoutMs);
            config_.instanceConnectTimeoutMs = defaults.instanceConnectTimeoutMs;
        } else {
            config_.instanceConnectTimeoutMs = static_cast<int>(timeoutMs);
        }
    }

    if (j.contains("general")) {
        const auto& g = j["general"];
        config_.closeToTray = g.value("close_to_tray", true);
        config_.startMinimized = g.value("start_minimized", false);
    }

    if (j.contains("shutdown")) {
        config_.shutdownAckTimeoutMs = j["shutdown"].value("ack_timeout_ms", 0);
    }

    if (j.contains("poller")) {
        config_.poller = core::PollerConfig::fromJson(j["poller"]);
    }

    if (j.contains("logging")) {
        config_.logLevel = j["logging"].value("level", "info");
    }

    if (j.contains("window")) {
        const auto& w = j["window"];
        config_.windowX = w.value("x", 100);
        config_.windowY = w.value("y", 100);
        config_.windowWidth = w.value("width", 1024);
        config_.windowHeight = w.value("height", 700);
    }
}

} // namespace trremote::infra
