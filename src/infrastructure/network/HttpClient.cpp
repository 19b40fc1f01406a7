#include "infrastructure/network/HttpClient.hpp"

#include <QNetworkRequest>
#include <QUrl>
#include <spdlog/spdlog.h>

namespace pingscope::infra {

HttpClient::HttpClient(QObject* parent) : QObject(parent) {
    connect(&manager_, &QNetworkAccessManager::finished, this, &HttpClient::onRequestFinished);
}

HttpClient::~HttpClient() {
    // No callback may fire during teardown
    disconnect(&manager_, nullptr, this, nullptr);
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& entry : pending) {
        entry.first->abort();
    }
}

QNetworkRequest HttpClient::buildRequest(const std::string& url, const HttpHeaders& headers,
                                         int timeoutMs) const {
    QNetworkRequest request(QUrl(QString::fromStdString(url)));

    for (const auto& [key, value] : headers) {
        request.setRawHeader(QByteArray::fromStdString(key), QByteArray::fromStdString(value));
    }

    request.setTransferTimeout(timeoutMs);
    return request;
}

HttpClient::RequestId HttpClient::track(QNetworkReply* reply, const char* method,
                                        const std::string& url, HttpCallback callback) {
    if (!reply) {
        HttpResponse response;
        response.success = false;
        response.errorMessage = "Failed to create network request";
        callback(response);
        return 0;
    }

    const RequestId id = nextId_++;
    pending_[reply] = Pending{id, std::move(callback)};
    spdlog::debug("HTTP {} request #{} sent to: {}", method, id, url);
    return id;
}

HttpClient::RequestId HttpClient::getAsync(const std::string& url, const HttpHeaders& headers,
                                           int timeoutMs, HttpCallback callback) {
    QNetworkReply* reply = manager_.get(buildRequest(url, headers, timeoutMs));
    return track(reply, "GET", url, std::move(callback));
}

HttpClient::RequestId HttpClient::postAsync(const std::string& url, const std::string& payload,
                                            const HttpHeaders& headers, int timeoutMs,
                                            HttpCallback callback) {
    QNetworkRequest request = buildRequest(url, headers, timeoutMs);
    if (!request.hasRawHeader("Content-Type")) {
        request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    }

    QByteArray data = QByteArray::fromStdString(payload);
    QNetworkReply* reply = manager_.post(request, data);
    return track(reply, "POST", url, std::move(callback));
}

void HttpClient::cancel(RequestId id) {
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second.id != id) {
            continue;
        }
        QNetworkReply* reply = it->first;
        pending_.erase(it);
        // abort() emits finished synchronously; the reply is no longer tracked
        reply->abort();
        reply->deleteLater();
        spdlog::debug("HTTP request #{} cancelled", id);
        return;
    }
}

void HttpClient::onRequestFinished(QNetworkReply* reply) {
    auto it = pending_.find(reply);
    if (it == pending_.end()) {
        reply->deleteLater();
        return;
    }

    HttpCallback callback = std::move(it->second.callback);
    pending_.erase(it);

    HttpResponse response;
    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll().toStdString();

    if (reply->error() == QNetworkReply::NoError) {
        response.success = (response.statusCode >= 200 && response.statusCode < 300);
        if (!response.success) {
            response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
        }
    } else {
        response.success = false;
        response.errorMessage = reply->errorString().toStdString();
        spdlog::warn("HTTP request failed: {} (status: {})", response.errorMessage,
                     response.statusCode);
    }

    reply->deleteLater();
    callback(response);
}

} // namespace pingscope::infra
