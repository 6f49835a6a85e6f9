/**
 * @file Inventory.hpp
 * @brief In-memory, validated monitoring configuration.
 */

#pragma once

#include "core/services/IConfigSource.hpp"
#include "core/services/INodeStore.hpp"
#include "core/types/Errors.hpp"

#include <map>
#include <mutex>
#include <vector>

namespace beamstate::monitor {

/**
 * @brief Holds groups, nodes, metric definitions and node metric bindings.
 *
 * Every mutation is validated before it is applied and throws
 * core::ConfigurationError when it would leave the configuration
 * inconsistent, so consumers never observe an invalid binding. Change
 * listeners are invoked after the internal lock is released.
 */
class Inventory : public core::IConfigSource, public core::INodeStore {
public:
    Inventory() = default;

    Inventory(const Inventory&) = delete;
    Inventory& operator=(const Inventory&) = delete;

    /**
     * @brief Replaces the whole configuration, e.g. when loading from storage.
     *
     * Entries keep their ids. Listeners are not notified.
     *
     * @throws core::ConfigurationError if any entry is invalid.
     */
    void replaceAll(std::vector<core::Group> groups, std::vector<core::Node> nodes,
                    std::vector<core::MetricDefinition> definitions,
                    std::vector<core::NodeMetricConfig> bindings);

    // Groups
    core::Group addGroup(core::Group group);
    void updateGroup(const core::Group& group);
    void setGroupEnabled(int64_t groupId, bool enabled);

    /**
     * @throws core::ConfigurationError if the group still has nodes.
     */
    void removeGroup(int64_t groupId);

    // Nodes
    core::Node addNode(core::Node node);
    void setNodeEnabled(int64_t nodeId, bool enabled);

    /**
     * @brief Removes a node together with its metric bindings.
     */
    void removeNode(int64_t nodeId);

    // Metric definitions
    core::MetricDefinition addMetricDefinition(core::MetricDefinition definition);
    void updateMetricDefinition(const core::MetricDefinition& definition);

    /**
     * @brief Removes a definition together with every binding that uses it.
     */
    void removeMetricDefinition(int64_t definitionId);

    // Node metric bindings
    core::NodeMetricConfig addNodeMetric(core::NodeMetricConfig config);
    void updateNodeMetric(const core::NodeMetricConfig& config);
    void removeNodeMetric(int64_t configId);

    [[nodiscard]] std::vector<core::NodeMetricConfig> nodeMetrics() const;
    [[nodiscard]] std::optional<core::NodeMetricConfig> nodeMetric(int64_t configId) const;
    [[nodiscard]] std::optional<core::MetricDefinition> metricDefinition(int64_t id) const;

    // IConfigSource
    std::vector<core::Group> groups() const override;
    std::vector<core::Node> nodes() const override;
    std::optional<core::Group> group(int64_t id) const override;
    std::optional<core::Node> node(int64_t id) const override;
    std::optional<core::NodeContext> nodeContext(int64_t nodeId) const override;
    std::vector<core::MetricDefinition> metricDefinitions() const override;
    std::vector<core::MetricBinding> metricBindings(int64_t nodeId) const override;
    int subscribe(ChangeCallback callback) override;
    void unsubscribe(int subscriptionId) override;

    // INodeStore
    std::optional<core::Node> findNodeByIp(const std::string& ip) const override;
    std::optional<core::Group> findGroup(int64_t id) const override;
    core::Node createNode(const core::Node& node) override;
    void updateNode(const core::Node& node) override;

private:
    void validateGroup(const core::Group& group) const;
    void validateNode(const core::Node& node) const;
    void validateDefinition(const core::MetricDefinition& definition) const;
    void validateBinding(const core::NodeMetricConfig& config) const;
    void notify(const std::vector<core::ConfigChange>& changes);

    mutable std::mutex mutex_;
    std::map<int64_t, core::Group> groups_;
    std::map<int64_t, core::Node> nodes_;
    std::map<int64_t, core::MetricDefinition> definitions_;
    std::map<int64_t, core::NodeMetricConfig> bindings_;
    int64_t nextGroupId_{1};
    int64_t nextNodeId_{1};
    int64_t nextDefinitionId_{1};
    int64_t nextBindingId_{1};

    std::mutex listenersMutex_;
    std::map<int, ChangeCallback> listeners_;
    int nextListenerId_{1};
};

} // namespace beamstate::monitor
