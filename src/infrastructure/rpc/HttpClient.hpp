#pragma once

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>

#include <functional>
#include <map>
#include <string>

namespace trremote::infra {

/**
 * @brief Response data from an HTTP request.
 */
struct HttpResponse {
    int statusCode{0};                          ///< HTTP status code, 0 if none was received
    std::string body;                           ///< Response body
    std::map<std::string, std::string> headers; ///< Response headers, names lower-cased
    std::string errorMessage;                   ///< Error message if the request failed
    bool success{false};                        ///< True for a 2xx response

    /**
     * @brief Looks up a response header.
     * @param name Header name, any case.
     * @return Header value, or an empty string if absent.
     */
    [[nodiscard]] std::string header(const std::string& name) const;
};

using HttpCallback = std::function<void(const HttpResponse&)>;

/**
 * @brief Asynchronous HTTP client on Qt's network stack.
 *
 * Must be used from the thread it lives on. The callback of every request
 * runs exactly once, on that thread.
 */
class HttpClient : public QObject {
    Q_OBJECT

public:
    explicit HttpClient(QObject* parent = nullptr);
    ~HttpClient() override = default;

    /**
     * @brief Sends a POST request.
     * @param url Target URL.
     * @param payload Request body.
     * @param headers Request headers.
     * @param timeoutMs Transfer timeout in milliseconds.
     * @param callback Called with the response or the failure.
     */
    void postAsync(const std::string& url, const std::string& payload,
                   const std::map<std::string, std::string>& headers, int timeoutMs,
                   HttpCallback callback);

private slots:
    void onRequestFinished(QNetworkReply* reply);

private:
    QNetworkAccessManager manager_;
    std::map<QNetworkReply*, HttpCallback> pendingCallbacks_;
};

} // namespace trremote::infra
