/**
 * @file Group.hpp
 * @brief Node group definition carrying the default monitoring settings.
 */

#pragma once

#include <cstdint>
#include <string>

namespace beamstate::core {

/**
 * @brief A named set of nodes sharing default monitoring settings.
 *
 * Every node belongs to exactly one group. Node-level values override the
 * group defaults; the group's enabled flag pauses all of its nodes.
 */
struct Group {
    int64_t id{0};                        ///< Unique identifier for the group
    std::string name;                     ///< Display name
    int intervalSeconds{60};              ///< Default check interval in seconds
    int packetCount{1};                   ///< Default ICMP packets per check
    std::string snmpCommunity{"public"};  ///< Default SNMP community
    uint16_t snmpPort{161};               ///< Default SNMP UDP port
    bool enabled{true};                   ///< Disabling pauses every node in the group
    bool monitorPing{true};               ///< Default for ICMP reachability checks
    bool monitorSnmp{false};              ///< Default for SNMP reachability checks

    /**
     * @brief Validates the group configuration.
     * @return True if the name is set and all numeric defaults are in range.
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const Group& other) const = default;
};

} // namespace beamstate::core
