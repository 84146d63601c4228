#pragma once

#include "core/services/IRemoteService.hpp"
#include "infrastructure/rpc/HttpClient.hpp"

#include <QObject>
#include <mutex>
#include <string>

namespace trremote::infra {

/**
 * @brief Polls a Transmission daemon over its JSON-RPC HTTP interface.
 *
 * Each poll issues a "session-stats" request. The daemon's CSRF token
 * (X-Transmission-Session-Id) is learned from the first 409 reply and reused
 * for later requests. Requests are sent from the thread this object lives
 * on; pollAsync() may be called from any thread.
 */
class TransmissionRpcService : public QObject, public core::IRemoteService {
    Q_OBJECT

public:
    static constexpr const char* SESSION_HEADER = "X-Transmission-Session-Id";

    explicit TransmissionRpcService(QObject* parent = nullptr);
    ~TransmissionRpcService() override = default;

    std::optional<std::string> apply(const core::PollerConfig& config) override;
    void pollAsync(const core::PollerConfig& config, PollCallback callback) override;

private:
    void sendRequest(const core::PollerConfig& config, PollCallback callback, bool retried);
    std::map<std::string, std::string> buildHeaders(const core::PollerConfig& config) const;
    static core::PollSnapshot parseResponse(const core::PollerConfig& config,
                                            const HttpResponse& response);

    HttpClient http_;

    mutable std::mutex sessionMutex_;
    std::string sessionId_;
    std::string sessionEndpoint_;
};

} // namespace trremote::infra
