#pragma once

#include "core/services/INotifier.hpp"

#include <spdlog/spdlog.h>

namespace beamstate::infra {

/**
 * @brief Notifier that only writes alerts to the log. Used when Pushover is disabled.
 */
class LogNotifier : public core::INotifier {
public:
    void notify(int priority, const std::string& title, const std::string& message) override {
        if (priority >= 1) {
            spdlog::warn("[ALERT p{}] {}: {}", priority, title, message);
        } else {
            spdlog::info("[ALERT p{}] {}: {}", priority, title, message);
        }
    }
};

} // namespace beamstate::infra
