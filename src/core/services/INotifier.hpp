/**
 * @file INotifier.hpp
 * @brief Interface for delivering alert notifications.
 */

#pragma once

#include <string>

namespace beamstate::core {

/**
 * @brief Push notification delivery.
 *
 * Implementations must not block the caller on network I/O.
 */
class INotifier {
public:
    virtual ~INotifier() = default;

    /**
     * @brief Sends a notification.
     * @param priority Pushover-style priority, -2 (lowest) to 2 (emergency).
     * @param title Short title.
     * @param message Body text.
     */
    virtual void notify(int priority, const std::string& title, const std::string& message) = 0;
};

} // namespace beamstate::core
