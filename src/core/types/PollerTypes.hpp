/**
 * @file PollerTypes.hpp
 * @brief Configuration and result types of the background poller.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace trremote::core {

/**
 * @brief Target, interval and credentials used by the poller.
 *
 * Instances are immutable once handed to the poller supervisor; a new
 * configuration replaces the old one as a whole.
 */
struct PollerConfig {
    std::string host{"localhost"};        ///< Daemon host name or address
    uint16_t port{9091};                  ///< Daemon RPC port
    std::string path{"/transmission/rpc"}; ///< RPC endpoint path
    bool useTls{false};                   ///< Use https instead of http
    int intervalSeconds{5};               ///< Delay between the end of a poll and the next one
    int timeoutMs{10000};                 ///< Per-request transfer timeout
    std::string username;                 ///< Optional basic auth user
    std::string password;                 ///< Optional basic auth password

    /**
     * @brief Checks the configuration for values the poller cannot use.
     * @return Description of the first problem found, or nullopt if valid.
     */
    [[nodiscard]] std::optional<std::string> validationError() const;

    /**
     * @brief Builds the RPC URL from scheme, host, port and path.
     * @return URL such as "http://localhost:9091/transmission/rpc".
     */
    [[nodiscard]] std::string endpoint() const;

    /**
     * @brief Serializes the configuration. The password is included.
     */
    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Reads a configuration, keeping defaults for absent keys.
     * @param j JSON object with snake_case keys.
     * @return Parsed configuration.
     * @throws nlohmann::json::exception if a present key has the wrong type.
     */
    static PollerConfig fromJson(const nlohmann::json& j);

    bool operator==(const PollerConfig& other) const = default;
};

/**
 * @brief Latest result of a poll cycle, as cached by the supervisor.
 */
struct PollSnapshot {
    uint64_t cycle{0};                               ///< Sequence number of the cycle, from 1
    std::chrono::system_clock::time_point timestamp; ///< When the cycle finished
    std::string endpoint;                            ///< Endpoint that was polled
    bool success{false};                             ///< Whether the remote call succeeded
    std::string errorMessage;                        ///< Failure description if !success
    nlohmann::json data;                             ///< Collaborator payload, opaque to the core
};

} // namespace trremote::core
