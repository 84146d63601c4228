#include "infrastructure/rpc/HttpClient.hpp"

#include <QNetworkRequest>
#include <QUrl>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace trremote::infra {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string{};
}

HttpClient::HttpClient(QObject* parent) : QObject(parent) {
    connect(&manager_, &QNetworkAccessManager::finished, this, &HttpClient::onRequestFinished);
}

void HttpClient::postAsync(const std::string& url, const std::string& payload,
                           const std::map<std::string, std::string>& headers, int timeoutMs,
                           HttpCallback callback) {
    QUrl target(QString::fromStdString(url));
    if (!target.isValid()) {
        HttpResponse response;
        response.errorMessage = "Invalid URL: " + url;
        callback(response);
        return;
    }

    QNetworkRequest request(target);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    for (const auto& [key, value] : headers) {
        request.setRawHeader(QByteArray::fromStdString(key), QByteArray::fromStdString(value));
    }
    request.setTransferTimeout(timeoutMs);

    QNetworkReply* reply = manager_.post(request, QByteArray::fromStdString(payload));
    if (!reply) {
        HttpResponse response;
        response.errorMessage = "Failed to create network request";
        callback(response);
        return;
    }

    pendingCallbacks_[reply] = std::move(callback);
    spdlog::debug("HTTP POST {}", url);
}

void HttpClient::onRequestFinished(QNetworkReply* reply) {
    auto it = pendingCallbacks_.find(reply);
    if (it == pendingCallbacks_.end()) {
        reply->deleteLater();
        return;
    }

    HttpCallback callback = std::move(it->second);
    pendingCallbacks_.erase(it);

    HttpResponse response;
    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll().toStdString();
    for (const auto& [name, value] : reply->rawHeaderPairs()) {
        response.headers[toLower(name.toStdString())] = value.toStdString();
    }

    if (reply->error() == QNetworkReply::NoError) {
        response.success = (response.statusCode >= 200 && response.statusCode < 300);
        if (!response.success) {
            response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
        }
    } else {
        response.success = false;
        response.errorMessage = reply->errorString().toStdString();
        spdlog::debug("HTTP request failed: {} (status: {})", response.errorMessage,
                      response.statusCode);
    }

    reply->deleteLater();
    callback(response);
}

} // namespace trremote::infra
