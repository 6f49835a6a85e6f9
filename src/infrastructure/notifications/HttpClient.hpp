#pragma once

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>

#include <functional>
#include <map>
#include <string>

namespace beamstate::infra {

/**
 * @brief Response data from an HTTP request.
 */
struct HttpResponse {
    int statusCode{0};        ///< HTTP status code (e.g., 200, 400).
    std::string body;         ///< Response body content.
    std::string errorMessage; ///< Error message if request failed.
    bool success{false};      ///< True for a completed request with a 2xx status.
    bool retryable{false};    ///< Transport error, 429 or 5xx: the same request may succeed later.
};

using HttpCallback = std::function<void(const HttpResponse&)>;

/**
 * @brief Asynchronous HTTP client on Qt's network stack.
 *
 * Must be used from the thread that owns it; the callback runs on that
 * thread's event loop.
 */
class HttpClient : public QObject {
    Q_OBJECT

public:
    explicit HttpClient(std::string userAgent, QObject* parent = nullptr);
    ~HttpClient() override = default;

    /**
     * @brief Performs an asynchronous HTTP POST with a raw body.
     *
     * The callback runs exactly once, also when the request cannot be created.
     */
    void postAsync(const std::string& url, const std::string& payload,
                   const std::map<std::string, std::string>& headers, int timeoutMs,
                   HttpCallback callback);

    /**
     * @brief Posts fields as application/x-www-form-urlencoded.
     */
    void postFormAsync(const std::string& url, const std::map<std::string, std::string>& fields,
                       int timeoutMs, HttpCallback callback);

    /**
     * @brief Encodes fields as a form body, percent-encoding names and values.
     */
    static std::string encodeForm(const std::map<std::string, std::string>& fields);

    [[nodiscard]] size_t pendingCount() const { return pendingCallbacks_.size(); }

private slots:
    void onRequestFinished(QNetworkReply* reply);

private:
    QNetworkAccessManager manager_;
    std::string userAgent_;
    std::map<QNetworkReply*, HttpCallback> pendingCallbacks_;
};

} // namespace beamstate::infra
