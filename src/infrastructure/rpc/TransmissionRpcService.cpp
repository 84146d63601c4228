#include "infrastructure/rpc/TransmissionRpcService.hpp"

#include <QByteArray>
#include <QUrl>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace trremote::infra {

namespace {

constexpr int HTTP_CONFLICT = 409;

} // namespace

TransmissionRpcService::TransmissionRpcService(QObject* parent) : QObject(parent) {}

std::optional<std::string> TransmissionRpcService::apply(const core::PollerConfig& config) {
    QUrl url(QString::fromStdString(config.endpoint()), QUrl::StrictMode);
    if (!url.isValid() || url.host().isEmpty()) {
        return "invalid RPC endpoint: " + config.endpoint();
    }

    std::lock_guard lock(sessionMutex_);
    if (sessionEndpoint_ != config.endpoint()) {
        // Session ids are per daemon
        sessionId_.clear();
        sessionEndpoint_ = config.endpoint();
    }
    return std::nullopt;
}

void TransmissionRpcService::pollAsync(const core::PollerConfig& config, PollCallback callback) {
    QMetaObject::invokeMethod(
        this,
        [this, config, callback = std::move(callback)]() mutable {
            sendRequest(config, std::move(callback), false);
        },
        Qt::QueuedConnection);
}

std::map<std::string, std::string>
TransmissionRpcService::buildHeaders(const core::PollerConfig& config) const {
    std::map<std::string, std::string> headers;
    {
        std::lock_guard lock(sessionMutex_);
        if (!sessionId_.empty()) {
            headers[SESSION_HEADER] = sessionId_;
        }
    }

    if (!config.username.empty()) {
        auto credentials =
            QByteArray::fromStdString(config.username + ":" + config.password).toBase64();
        headers["Authorization"] = "Basic " + credentials.toStdString();
    }
    return headers;
}

void TransmissionRpcService::sendRequest(const core::PollerConfig& config, PollCallback callback,
                                         bool retried) {
    nlohmann::json request;
    request["method"] = "session-stats";
    request["arguments"] = nlohmann::json::object();

    http_.postAsync(
        config.endpoint(), request.dump(), buildHeaders(config), config.timeoutMs,
        [this, config, callback, retried](const HttpResponse& response) {
            if (response.statusCode == HTTP_CONFLICT && !retried) {
                auto sessionId = response.header(SESSION_HEADER);
                bool current = false;
                if (!sessionId.empty()) {
                    std::lock_guard lock(sessionMutex_);
                    // A reply for an endpoint replaced by apply() must not leak its id
                    if (sessionEndpoint_.empty()) {
                        sessionEndpoint_ = config.endpoint();
                    }
                    current = sessionEndpoint_ == config.endpoint();
                    if (current) {
                        sessionId_ = sessionId;
                    }
                }
                if (current) {
                    spdlog::debug("Obtained RPC session id from {}", config.endpoint());
                    sendRequest(config, callback, true);
                    return;
                }
            }
            callback(parseResponse(config, response));
        });
}

core::PollSnapshot TransmissionRpcService::parseResponse(const core::PollerConfig& config,
                                                         const HttpResponse& response) {
    core::PollSnapshot snapshot;
    snapshot.endpoint = config.endpoint();
    snapshot.timestamp = std::chrono::system_clock::now();

    if (!response.success) {
        snapshot.errorMessage = response.errorMessage.empty()
                                    ? "HTTP error: " + std::to_string(response.statusCode)
                                    : response.errorMessage;
        return snapshot;
    }

    auto j = nlohmann::json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        snapshot.errorMessage = "Malformed RPC response";
        return snapshot;
    }

    auto result = j.find("result");
    if (result == j.end() || !result->is_string()) {
        snapshot.errorMessage = "RPC response without result";
        return snapshot;
    }
    if (result->get<std::string>() != "success") {
        snapshot.errorMessage = "RPC error: " + result->get<std::string>();
        return snapshot;
    }

    snapshot.success = true;
    snapshot.data = j.value("arguments", nlohmann::json::object());
    return snapshot;
}

} // namespace trremote::infra
