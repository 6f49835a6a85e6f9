#pragma once

#include "core/services/INotifier.hpp"
#include "infrastructure/notifications/HttpClient.hpp"

#include <QObject>

#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace beamstate::infra {

struct PushoverSettings {
    std::string apiUrl{"https://api.pushover.net/1/messages.json"};
    std::string token;
    std::string userKey;
    int timeoutMs{10000};
    int maxRetries{2};
    int retryDelayMs{2000};
};

/**
 * @brief Delivers notifications through the Pushover messages API.
 *
 * notify() may be called from any thread; the request is handed to the
 * owning Qt thread and sent from there. Failed deliveries are retried with a
 * linear backoff. Emergency priority (2) carries the retry and expire fields
 * Pushover requires for it.
 */
class PushoverNotifier : public QObject, public core::INotifier {
    Q_OBJECT

public:
    explicit PushoverNotifier(PushoverSettings settings, QObject* parent = nullptr);
    ~PushoverNotifier() override = default;

    void notify(int priority, const std::string& title, const std::string& message) override;

    void configure(const std::string& token, const std::string& userKey);
    [[nodiscard]] bool isConfigured() const;

    /**
     * @brief Builds the form fields of one message.
     */
    static std::map<std::string, std::string> buildFields(const std::string& token,
                                                          const std::string& userKey,
                                                          int priority, const std::string& title,
                                                          const std::string& message);

    [[nodiscard]] uint64_t deliveredCount() const { return delivered_; }
    [[nodiscard]] uint64_t failedCount() const { return failed_; }

signals:
    void deliveryFailed(const QString& title, const QString& error);

private:
    void send(std::map<std::string, std::string> fields, int attempt);

    HttpClient* httpClient_;
    PushoverSettings settings_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace beamstate::infra
