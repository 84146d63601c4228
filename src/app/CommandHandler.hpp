#pragma once

#include "infrastructure/poller/PollerSupervisor.hpp"

#include <QUrl>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace trremote::app {

/**
 * @brief Outcome of a presentation-layer command.
 */
struct CommandResult {
    bool success{false};
    std::string errorMessage;
    nlohmann::json data;

    static CommandResult ok(nlohmann::json data = nlohmann::json::object()) {
        return {true, {}, std::move(data)};
    }

    static CommandResult failure(std::string message) {
        return {false, std::move(message), nullptr};
    }
};

/**
 * @brief Commands the main window may invoke on the backend.
 *
 * None of the commands throws; failures are reported in the result.
 */
class CommandHandler {
public:
    using Opener = std::function<bool(const QUrl&)>;

    /**
     * @param poller Supervisor receiving new poller configurations.
     * @param opener Hands a URL to the desktop; QDesktopServices::openUrl if empty.
     */
    explicit CommandHandler(infra::PollerSupervisor& poller, Opener opener = {});

    /**
     * @brief Reads a local file, typically a .torrent.
     * @return data = {"path", "size", "contents"} with base64 contents.
     */
    [[nodiscard]] CommandResult readFile(const std::string& path) const;

    /**
     * @brief Opens a local path or URL with the desktop's default handler.
     */
    [[nodiscard]] CommandResult shellOpen(const std::string& target) const;

    /**
     * @brief Parses and applies a poller configuration.
     * @param j Object with the keys of PollerConfig::toJson().
     * @return data = the applied configuration, password omitted.
     */
    CommandResult setPollerConfig(const nlohmann::json& j);

    /**
     * @brief Converts a command-line style target into a URL.
     *
     * Strings with a URL scheme (http, magnet, ...) are kept; everything
     * else is a local path, made absolute.
     */
    static QUrl toUrl(const std::string& target);

private:
    infra::PollerSupervisor& poller_;
    Opener opener_;
};

} // namespace trremote::app
