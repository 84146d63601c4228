#pragma once

#include "core/types/PollerTypes.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace trremote::infra {

/**
 * @brief Application start-up configuration.
 */
struct AppConfig {
    // Single instance
    std::string instanceKey{"TrRemote-SingleInstance"}; ///< Lock file and socket name.
    int instanceConnectTimeoutMs{1000};                  ///< Bound for forwarding to the primary.

    // General
    bool closeToTray{true};     ///< Window close button hides the window instead of quitting.
    bool startMinimized{false}; ///< Primary starts with no window, only the tray icon.

    // Shutdown
    int shutdownAckTimeoutMs{0}; ///< Bound on the exit handshake, 0 waits forever.

    // Poller
    core::PollerConfig poller; ///< Initial poller configuration.

    // Logging
    std::string logLevel{"info"}; ///< Console log level name understood by spdlog.

    // Window state
    int windowX{100};
    int windowY{100};
    int windowWidth{1024};
    int windowHeight{700};
};

/**
 * @brief Loads and saves the JSON configuration file.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a manager for the given directory, creating it if needed.
     * @param configDir Directory holding config.json.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if the file is missing.
     * @return True if loaded (or defaults written) successfully.
     */
    bool load();

    /**
     * @brief Writes the configuration to disk.
     * @return True if saved successfully.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }
    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace trremote::infra
