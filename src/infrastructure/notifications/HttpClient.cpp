#include "infrastructure/notifications/HttpClient.hpp"

#include <QNetworkRequest>
#include <QUrl>
#include <spdlog/spdlog.h>

namespace beamstate::infra {

HttpClient::HttpClient(std::string userAgent, QObject* parent)
    : QObject(parent), userAgent_(std::move(userAgent)) {
    connect(&manager_, &QNetworkAccessManager::finished, this, &HttpClient::onRequestFinished);
}

std::string HttpClient::encodeForm(const std::map<std::string, std::string>& fields) {
    QByteArray body;
    for (const auto& [name, value] : fields) {
        if (!body.isEmpty()) {
            body.append('&');
        }
        body.append(QUrl::toPercentEncoding(QString::fromStdString(name)));
        body.append('=');
        body.append(QUrl::toPercentEncoding(QString::fromStdString(value)));
    }
    return body.toStdString();
}

void HttpClient::postFormAsync(const std::string& url,
                               const std::map<std::string, std::string>& fields, int timeoutMs,
                               HttpCallback callback) {
    postAsync(url, encodeForm(fields),
              {{"Content-Type", "application/x-www-form-urlencoded"}}, timeoutMs,
              std::move(callback));
}

void HttpClient::postAsync(const std::string& url, const std::string& payload,
                           const std::map<std::string, std::string>& headers, int timeoutMs,
                           HttpCallback callback) {
    QUrl target(QString::fromStdString(url));
    if (!target.isValid() || target.scheme().isEmpty()) {
        HttpResponse response;
        response.errorMessage = "invalid URL '" + url + "'";
        callback(response);
        return;
    }

    QNetworkRequest request(target);
    request.setHeader(QNetworkRequest::UserAgentHeader, QString::fromStdString(userAgent_));
    for (const auto& [key, value] : headers) {
        request.setRawHeader(QByteArray::fromStdString(key), QByteArray::fromStdString(value));
    }
    request.setTransferTimeout(timeoutMs);

    QNetworkReply* reply = manager_.post(request, QByteArray::fromStdString(payload));
    if (!reply) {
        HttpResponse response;
        response.errorMessage = "failed to create network request";
        response.retryable = true;
        callback(response);
        return;
    }

    pendingCallbacks_[reply] = std::move(callback);
    spdlog::debug("POST {} ({} bytes, {} pending)", target.host().toStdString(), payload.size(),
                  pendingCallbacks_.size());
}

void HttpClient::onRequestFinished(QNetworkReply* reply) {
    reply->deleteLater();

    auto node = pendingCallbacks_.extract(reply);
    if (node.empty()) {
        return;
    }

    HttpResponse response;
    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll().toStdString();

    if (reply->error() != QNetworkReply::NoError && response.statusCode == 0) {
        // No HTTP exchange happened: DNS, connect, TLS or transfer timeout
        response.errorMessage = reply->errorString().toStdString();
        response.retryable = true;
        spdlog::warn("POST {} failed: {}", reply->url().host().toStdString(),
                     response.errorMessage);
    } else {
        response.success = response.statusCode >= 200 && response.statusCode < 300;
        if (!response.success) {
            response.errorMessage = "HTTP " + std::to_string(response.statusCode);
            response.retryable = response.statusCode == 429 || response.statusCode >= 500;
        }
    }

    node.mapped()(response);
}

} // namespace beamstate::infra
