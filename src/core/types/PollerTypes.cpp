#include "core/types/PollerTypes.hpp"

namespace trremote::core {

std::optional<std::string> PollerConfig::validationError() const {
    if (host.empty()) {
        return "host must not be empty";
    }
    if (port == 0) {
        return "port must be between 1 and 65535";
    }
    if (path.empty() || path.front() != '/') {
        return "path must start with '/'";
    }
    if (intervalSeconds <= 0) {
        return "interval must be at least one second";
    }
    if (timeoutMs <= 0) {
        return "timeout must be positive";
    }
    return std::nullopt;
}

std::string PollerConfig::endpoint() const {
    return std::string(useTls ? "https" : "http") + "://" + host + ":" + std::to_string(port) +
           path;
}

nlohmann::json PollerConfig::toJson() const {
    nlohmann::json j;
    j["host"] = host;
    j["port"] = port;
    j["path"] = path;
    j["tls"] = useTls;
    j["interval_seconds"] = intervalSeconds;
    j["timeout_ms"] = timeoutMs;
    j["username"] = username;
    j["password"] = password;
    return j;
}

PollerConfig PollerConfig::fromJson(const nlohmann::json& j) {
    PollerConfig config;
    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    config.path = j.value("path", config.path);
    config.useTls = j.value("tls", config.useTls);
    config.intervalSeconds = j.value("interval_seconds", config.intervalSeconds);
    config.timeoutMs = j.value("timeout_ms", config.timeoutMs);
    config.username = j.value("username", config.username);
    config.password = j.value("password", config.password);
    return config;
}

} // namespace trremote::core
