#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace beamstate::app {

/**
 * @brief A request sent to the running daemon over the control channel.
 *
 * Text form, one command per message:
 *   status
 *   check <nodeId>
 *   maintenance on|off
 *   scan <cidr> [groupId]
 *   trace [limit]
 */
struct ControlCommand {
    enum class Type { Status, Check, Maintenance, Scan, Trace };

    Type type{Type::Status};
    int64_t nodeId{0};
    bool enabled{false};
    std::string cidr;
    int64_t groupId{0}; ///< Import target for scans; 0 keeps results unimported
    size_t limit{50};
};

/**
 * @brief Parses the text form.
 * @return The command, or nullopt for unknown verbs and malformed arguments.
 */
std::optional<ControlCommand> parseControlCommand(const std::string& text);

/**
 * @brief Renders a command in its text form.
 */
std::string formatControlCommand(const ControlCommand& command);

} // namespace beamstate::app
