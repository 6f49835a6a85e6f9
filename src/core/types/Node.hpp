/**
 * @file Node.hpp
 * @brief Monitored node definition, lifecycle status and effective settings.
 *
 * A node stores only the values it overrides. The settings actually used for
 * a check are resolved against the owning group at read time through
 * resolveEffective() and are never copied back into the node.
 */

#pragma once

#include "core/types/Group.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace beamstate::core {

/**
 * @brief Lifecycle status of a monitored node.
 */
enum class NodeStatus : int {
    Waiting = 0, ///< No check has completed yet
    Pending = 1, ///< Failing, but still below the retry limit
    Up = 2,      ///< Last check succeeded
    Down = 3,    ///< Failed at least max_retries consecutive checks
    Paused = 4   ///< Node or its group is disabled
};

/**
 * @brief Converts a status to its upper-case wire name (e.g. "DOWN").
 */
[[nodiscard]] std::string statusToString(NodeStatus status);

/**
 * @brief Parses a status name; unknown names map to Waiting.
 */
NodeStatus statusFromString(const std::string& str);

/**
 * @brief A monitored network device.
 */
struct Node {
    int64_t id{0};                              ///< Unique identifier for the node
    std::string name;                           ///< Display name
    std::string ip;                             ///< IPv4 address
    int64_t groupId{0};                         ///< Owning group
    std::optional<int> intervalSeconds;         ///< Check interval override
    std::optional<int> packetCount;             ///< ICMP packet count override
    std::optional<std::string> snmpCommunity;   ///< SNMP community override
    std::optional<uint16_t> snmpPort;           ///< SNMP port override
    std::optional<bool> monitorPing;            ///< Unset inherits from the group
    std::optional<bool> monitorSnmp;            ///< Unset inherits from the group
    bool enabled{true};                         ///< Disabling pauses the node
    std::optional<int> notificationPriority;    ///< Pushover priority override (-2..2)

    /**
     * @brief Validates the node configuration (address format is checked by the inventory).
     * @return True if name and address are set and all overrides are in range.
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const Node& other) const = default;
};

/**
 * @brief Settings in force for a node, resolved against its group.
 */
struct EffectiveSettings {
    int intervalSeconds{60};
    int packetCount{1};
    std::string snmpCommunity{"public"};
    uint16_t snmpPort{161};
    bool monitorPing{true};
    bool monitorSnmp{false};
    bool nodeEnabled{true};
    bool groupEnabled{true};
    std::string groupName;

    [[nodiscard]] bool enabled() const { return nodeEnabled && groupEnabled; }
    [[nodiscard]] bool anyProtocol() const { return monitorPing || monitorSnmp; }

    bool operator==(const EffectiveSettings& other) const = default;
};

/**
 * @brief Resolves a node's effective settings: the node value if set, else the group value.
 * @param node The node.
 * @param group The node's owning group.
 * @return Resolved settings; enabled only if both node and group are enabled.
 */
[[nodiscard]] EffectiveSettings resolveEffective(const Node& node, const Group& group);

} // namespace beamstate::core
