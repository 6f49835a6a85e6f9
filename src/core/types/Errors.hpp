#pragma once

#include <stdexcept>
#include <string>

namespace beamstate::core {

/**
 * @brief Raised when an inventory change would leave the configuration inconsistent.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace beamstate::core
