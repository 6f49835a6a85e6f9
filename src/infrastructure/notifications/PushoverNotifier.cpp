#include "infrastructure/notifications/PushoverNotifier.hpp"

#include <QMetaObject>
#include <QTimer>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace beamstate::infra {

namespace {

constexpr int EMERGENCY_PRIORITY = 2;
constexpr int EMERGENCY_RETRY_SECONDS = 60;
constexpr int EMERGENCY_EXPIRE_SECONDS = 3600;

} // namespace

PushoverNotifier::PushoverNotifier(PushoverSettings settings, QObject* parent)
    : QObject(parent),
      httpClient_(new HttpClient("BeamState/" BEAMSTATE_VERSION, this)),
      settings_(std::move(settings)) {}

void PushoverNotifier::configure(const std::string& token, const std::string& userKey) {
    std::lock_guard lock(mutex_);
    settings_.token = token;
    settings_.userKey = userKey;
}

bool PushoverNotifier::isConfigured() const {
    std::lock_guard lock(mutex_);
    return !settings_.token.empty() && !settings_.userKey.empty();
}

std::map<std::string, std::string> PushoverNotifier::buildFields(const std::string& token,
                                                                 const std::string& userKey,
                                                                 int priority,
                                                                 const std::string& title,
                                                                 const std::string& message) {
    priority = std::clamp(priority, -2, 2);
    std::map<std::string, std::string> fields{{"token", token},
                                              {"user", userKey},
                                              {"title", title},
                                              {"message", message},
                                              {"priority", std::to_string(priority)}};
    if (priority == EMERGENCY_PRIORITY) {
        fields["retry"] = std::to_string(EMERGENCY_RETRY_SECONDS);
        fields["expire"] = std::to_string(EMERGENCY_EXPIRE_SECONDS);
    }
    return fields;
}

void PushoverNotifier::notify(int priority, const std::string& title, const std::string& message) {
    std::map<std::string, std::string> fields;
    {
        std::lock_guard lock(mutex_);
        if (settings_.token.empty() || settings_.userKey.empty()) {
            spdlog::warn("Pushover credentials not configured, dropping notification: {}", title);
            ++failed_;
            return;
        }
        fields = buildFields(settings_.token, settings_.userKey, priority, title, message);
    }

    QMetaObject::invokeMethod(
        this, [this, fields = std::move(fields)]() mutable { send(std::move(fields), 0); },
        Qt::QueuedConnection);
}

void PushoverNotifier::send(std::map<std::string, std::string> fields, int attempt) {
    const auto title = fields["title"];
    httpClient_->postFormAsync(
        settings_.apiUrl, fields, settings_.timeoutMs,
        [this, fields, attempt, title](const HttpResponse& response) {
            if (response.success) {
                ++delivered_;
                spdlog::info("Notification sent: {}", title);
                return;
            }

            if (response.retryable && attempt < settings_.maxRetries) {
                int delayMs = settings_.retryDelayMs * (attempt + 1);
                spdlog::warn("Pushover delivery failed (attempt {}/{}): {}. Retrying in {}ms",
                             attempt + 1, settings_.maxRetries + 1, response.errorMessage,
                             delayMs);
                QTimer::singleShot(delayMs, this, [this, fields, attempt]() {
                    send(fields, attempt + 1);
                });
                return;
            }

            ++failed_;
            spdlog::error("Failed to send notification '{}': status={}, {} {}", title,
                          response.statusCode, response.errorMessage, response.body);
            emit deliveryFailed(QString::fromStdString(title),
                                QString::fromStdString(response.errorMessage));
        });
}

} // namespace beamstate::infra
