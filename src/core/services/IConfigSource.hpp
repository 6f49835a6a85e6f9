/**
 * @file IConfigSource.hpp
 * @brief Read-only view of the monitoring configuration with change notification.
 */

#pragma once

#include "core/types/Group.hpp"
#include "core/types/MetricDefinition.hpp"
#include "core/types/Node.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace beamstate::core {

enum class ConfigChangeKind : int {
    GroupChanged = 0,  ///< Group added or modified; id is the group id
    GroupRemoved = 1,
    NodeChanged = 2,   ///< Node added or modified; id is the node id
    NodeRemoved = 3,
    MetricsChanged = 4 ///< Metric definitions or bindings changed; id is the node id, or 0 for all
};

struct ConfigChange {
    ConfigChangeKind kind{ConfigChangeKind::NodeChanged};
    int64_t id{0};
};

/**
 * @brief A node together with its group and resolved settings.
 */
struct NodeContext {
    Node node;
    Group group;
    EffectiveSettings effective;
};

/**
 * @brief A node metric binding joined with its definition.
 */
struct MetricBinding {
    NodeMetricConfig config;
    MetricDefinition definition;
};

/**
 * @brief Source of groups, nodes and metric bindings.
 *
 * Every getter returns a copy that stays valid after the configuration changes.
 */
class IConfigSource {
public:
    using ChangeCallback = std::function<void(const ConfigChange&)>;

    virtual ~IConfigSource() = default;

    virtual std::vector<Group> groups() const = 0;
    virtual std::vector<Node> nodes() const = 0;
    virtual std::optional<Group> group(int64_t id) const = 0;
    virtual std::optional<Node> node(int64_t id) const = 0;

    /**
     * @brief Resolves a node against its group.
     * @param nodeId ID of the node.
     * @return Node, group and effective settings, or nullopt if the node is unknown.
     */
    virtual std::optional<NodeContext> nodeContext(int64_t nodeId) const = 0;

    virtual std::vector<MetricDefinition> metricDefinitions() const = 0;

    /**
     * @brief Returns all metric bindings of a node, enabled or not.
     * @param nodeId ID of the node.
     */
    virtual std::vector<MetricBinding> metricBindings(int64_t nodeId) const = 0;

    /**
     * @brief Registers a change listener. Listeners run after the change is applied.
     * @return Subscription id for unsubscribe().
     */
    virtual int subscribe(ChangeCallback callback) = 0;

    virtual void unsubscribe(int subscriptionId) = 0;
};

} // namespace beamstate::core
