#include "core/types/Node.hpp"

namespace beamstate::core {

std::string statusToString(NodeStatus status) {
    switch (status) {
    case NodeStatus::Waiting:
        return "WAITING";
    case NodeStatus::Pending:
        return "PENDING";
    case NodeStatus::Up:
        return "UP";
    case NodeStatus::Down:
        return "DOWN";
    case NodeStatus::Paused:
        return "PAUSED";
    }
    return "WAITING";
}

NodeStatus statusFromString(const std::string& str) {
    if (str == "PENDING")
        return NodeStatus::Pending;
    if (str == "UP")
        return NodeStatus::Up;
    if (str == "DOWN")
        return NodeStatus::Down;
    if (str == "PAUSED")
        return NodeStatus::Paused;
    return NodeStatus::Waiting;
}

bool Node::isValid() const {
    if (name.empty() || ip.empty() || groupId <= 0) {
        return false;
    }
    if (intervalSeconds && *intervalSeconds <= 0) {
        return false;
    }
    if (packetCount && *packetCount <= 0) {
        return false;
    }
    if (snmpPort && *snmpPort == 0) {
        return false;
    }
    if (snmpCommunity && (snmpCommunity->empty() || snmpCommunity->size() > 255)) {
        return false;
    }
    if (notificationPriority && (*notificationPriority < -2 || *notificationPriority > 2)) {
        return false;
    }
    return true;
}

EffectiveSettings resolveEffective(const Node& node, const Group& group) {
    EffectiveSettings settings;
    settings.intervalSeconds = node.intervalSeconds.value_or(group.intervalSeconds);
    settings.packetCount = node.packetCount.value_or(group.packetCount);
    settings.snmpCommunity = node.snmpCommunity.value_or(group.snmpCommunity);
    settings.snmpPort = node.snmpPort.value_or(group.snmpPort);
    settings.monitorPing = node.monitorPing.value_or(group.monitorPing);
    settings.monitorSnmp = node.monitorSnmp.value_or(group.monitorSnmp);
    settings.nodeEnabled = node.enabled;
    settings.groupEnabled = group.enabled;
    settings.groupName = group.name;
    return settings;
}

} // namespace beamstate::core
