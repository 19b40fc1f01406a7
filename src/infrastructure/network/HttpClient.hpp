#pragma once

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace pingscope::infra {

/**
 * @brief Response data from an HTTP request.
 */
struct HttpResponse {
    int statusCode{0};        ///< HTTP status code (e.g., 200, 404).
    std::string body;         ///< Response body content.
    std::string errorMessage; ///< Error message if request failed.
    bool success{false};      ///< True if request completed with a 2xx status.
};

/**
 * @brief Callback type for async HTTP request completion.
 */
using HttpCallback = std::function<void(const HttpResponse&)>;

using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief Asynchronous HTTP client using Qt's network stack.
 *
 * Provides non-blocking GET and POST requests with callback-based response
 * handling. Each request gets an identifier that can be used to abort it;
 * aborted requests never invoke their callback.
 */
class HttpClient : public QObject {
    Q_OBJECT

public:
    using RequestId = uint64_t;

    explicit HttpClient(QObject* parent = nullptr);
    ~HttpClient() override;

    /**
     * @brief Performs an asynchronous HTTP GET request.
     * @param url Target URL for the request.
     * @param headers HTTP headers to include in the request.
     * @param timeoutMs Request timeout in milliseconds.
     * @param callback Function called when the request completes.
     * @return Identifier of the request, or 0 if it could not be sent.
     */
    RequestId getAsync(const std::string& url, const HttpHeaders& headers, int timeoutMs,
                       HttpCallback callback);

    /**
     * @brief Performs an asynchronous HTTP POST request.
     * @param url Target URL for the request.
     * @param payload Request body content.
     * @param headers HTTP headers to include in the request.
     * @param timeoutMs Request timeout in milliseconds.
     * @param callback Function called when the request completes.
     * @return Identifier of the request, or 0 if it could not be sent.
     */
    RequestId postAsync(const std::string& url, const std::string& payload,
                        const HttpHeaders& headers, int timeoutMs, HttpCallback callback);

    /**
     * @brief Aborts a pending request without invoking its callback.
     */
    void cancel(RequestId id);

    [[nodiscard]] std::size_t pendingCount() const { return pending_.size(); }

private slots:
    void onRequestFinished(QNetworkReply* reply);

private:
    struct Pending {
        RequestId id{0};
        HttpCallback callback;
    };

    QNetworkRequest buildRequest(const std::string& url, const HttpHeaders& headers,
                                 int timeoutMs) const;
    RequestId track(QNetworkReply* reply, const char* method, const std::string& url,
                    HttpCallback callback);

    QNetworkAccessManager manager_;
    std::map<QNetworkReply*, Pending> pending_;
    RequestId nextId_{1};
};

} // namespace pingscope::infra
