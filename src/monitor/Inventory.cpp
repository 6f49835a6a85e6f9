#include "monitor/Inventory.hpp"

#include "monitor/CidrRange.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>

namespace beamstate::monitor {

using core::ConfigChange;
using core::ConfigChangeKind;
using core::ConfigurationError;

void Inventory::replaceAll(std::vector<core::Group> groups, std::vector<core::Node> nodes,
                           std::vector<core::MetricDefinition> definitions,
                           std::vector<core::NodeMetricConfig> bindings) {
    std::lock_guard lock(mutex_);

    auto previousGroups = std::move(groups_);
    auto previousNodes = std::move(nodes_);
    auto previousDefinitions = std::move(definitions_);
    auto previousBindings = std::move(bindings_);
    groups_.clear();
    nodes_.clear();
    definitions_.clear();
    bindings_.clear();

    try {
        for (auto& group : groups) {
            validateGroup(group);
            groups_[group.id] = std::move(group);
        }
        for (auto& node : nodes) {
            validateNode(node);
            nodes_[node.id] = std::move(node);
        }
        for (auto& definition : definitions) {
            validateDefinition(definition);
            definitions_[definition.id] = std::move(definition);
        }
        for (auto& binding : bindings) {
            validateBinding(binding);
            bindings_[binding.id] = std::move(binding);
        }
    } catch (const ConfigurationError&) {
        groups_ = std::move(previousGroups);
        nodes_ = std::move(previousNodes);
        definitions_ = std::move(previousDefinitions);
        bindings_ = std::move(previousBindings);
        throw;
    }

    nextGroupId_ = groups_.empty() ? 1 : groups_.rbegin()->first + 1;
    nextNodeId_ = nodes_.empty() ? 1 : nodes_.rbegin()->first + 1;
    nextDefinitionId_ = definitions_.empty() ? 1 : definitions_.rbegin()->first + 1;
    nextBindingId_ = bindings_.empty() ? 1 : bindings_.rbegin()->first + 1;

    spdlog::info("Inventory loaded: {} groups, {} nodes, {} metric definitions, {} bindings",
                 groups_.size(), nodes_.size(), definitions_.size(), bindings_.size());
}

// Groups

core::Group Inventory::addGroup(core::Group group) {
    {
        std::lock_guard lock(mutex_);
        group.id = nextGroupId_;
        validateGroup(group);
        groups_[group.id] = group;
        ++nextGroupId_;
    }
    spdlog::debug("Added group {} ({})", group.name, group.id);
    notify({{ConfigChangeKind::GroupChanged, group.id}});
    return group;
}

void Inventory::updateGroup(const core::Group& group) {
    {
        std::lock_guard lock(mutex_);
        if (!groups_.contains(group.id)) {
            throw ConfigurationError(fmt::format("Unknown group id {}", group.id));
        }
        validateGroup(group);
        groups_[group.id] = group;
    }
    notify({{ConfigChangeKind::GroupChanged, group.id}});
}

void Inventory::setGroupEnabled(int64_t groupId, bool enabled) {
    {
        std::lock_guard lock(mutex_);
        auto it = groups_.find(groupId);
        if (it == groups_.end()) {
            throw ConfigurationError(fmt::format("Unknown group id {}", groupId));
        }
        if (it->second.enabled == enabled) {
            return;
        }
        it->second.enabled = enabled;
    }
    spdlog::info("Group {} {}", groupId, enabled ? "enabled" : "disabled");
    notify({{ConfigChangeKind::GroupChanged, groupId}});
}

void Inventory::removeGroup(int64_t groupId) {
    {
        std::lock_guard lock(mutex_);
        if (!groups_.contains(groupId)) {
            throw ConfigurationError(fmt::format("Unknown group id {}", groupId));
        }
        for (const auto& [id, node] : nodes_) {
            if (node.groupId == groupId) {
                throw ConfigurationError(
                    fmt::format("Group {} still contains node '{}'", groupId, node.name));
            }
        }
        groups_.erase(groupId);
    }
    notify({{ConfigChangeKind::GroupRemoved, groupId}});
}

// Nodes

core::Node Inventory::addNode(core::Node node) {
    {
        std::lock_guard lock(mutex_);
        node.id = nextNodeId_;
        validateNode(node);
        nodes_[node.id] = node;
        ++nextNodeId_;
    }
    spdlog::info("Added node {} ({}) with id {}", node.name, node.ip, node.id);
    notify({{ConfigChangeKind::NodeChanged, node.id}});
    return node;
}

core::Node Inventory::createNode(const core::Node& node) {
    return addNode(node);
}

void Inventory::updateNode(const core::Node& node) {
    {
        std::lock_guard lock(mutex_);
        if (!nodes_.contains(node.id)) {
            throw ConfigurationError(fmt::format("Unknown node id {}", node.id));
        }
        validateNode(node);
        nodes_[node.id] = node;
    }
    notify({{ConfigChangeKind::NodeChanged, node.id}});
}

void Inventory::setNodeEnabled(int64_t nodeId, bool enabled) {
    {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(nodeId);
        if (it == nodes_.end()) {
            throw ConfigurationError(fmt::format("Unknown node id {}", nodeId));
        }
        if (it->second.enabled == enabled) {
            return;
        }
        it->second.enabled = enabled;
    }
    spdlog::info("Node {} {}", nodeId, enabled ? "enabled" : "disabled");
    notify({{ConfigChangeKind::NodeChanged, nodeId}});
}

void Inventory::removeNode(int64_t nodeId) {
    {
        std::lock_guard lock(mutex_);
        if (nodes_.erase(nodeId) == 0) {
            throw ConfigurationError(fmt::format("Unknown node id {}", nodeId));
        }
        std::erase_if(bindings_, [nodeId](const auto& entry) {
            return entry.second.nodeId == nodeId;
        });
    }
    spdlog::info("Removed node {}", nodeId);
    notify({{ConfigChangeKind::NodeRemoved, nodeId}});
}

// Metric definitions

core::MetricDefinition Inventory::addMetricDefinition(core::MetricDefinition definition) {
    {
        std::lock_guard lock(mutex_);
        definition.id = nextDefinitionId_;
        validateDefinition(definition);
        definitions_[definition.id] = definition;
        ++nextDefinitionId_;
    }
    notify({{ConfigChangeKind::MetricsChanged, 0}});
    return definition;
}

void Inventory::updateMetricDefinition(const core::MetricDefinition& definition) {
    {
        std::lock_guard lock(mutex_);
        auto it = definitions_.find(definition.id);
        if (it == definitions_.end()) {
            throw ConfigurationError(fmt::format("Unknown metric definition id {}", definition.id));
        }
        validateDefinition(definition);

        auto previous = it->second;
        it->second = definition;
        for (const auto& [id, binding] : bindings_) {
            if (binding.metricId != definition.id) {
                continue;
            }
            try {
                validateBinding(binding);
            } catch (const ConfigurationError&) {
                it->second = previous;
                throw;
            }
        }
    }
    notify({{ConfigChangeKind::MetricsChanged, 0}});
}

void Inventory::removeMetricDefinition(int64_t definitionId) {
    {
        std::lock_guard lock(mutex_);
        if (definitions_.erase(definitionId) == 0) {
            throw ConfigurationError(fmt::format("Unknown metric definition id {}", definitionId));
        }
        std::erase_if(bindings_, [definitionId](const auto& entry) {
            return entry.second.metricId == definitionId;
        });
    }
    notify({{ConfigChangeKind::MetricsChanged, 0}});
}

// Node metric bindings

core::NodeMetricConfig Inventory::addNodeMetric(core::NodeMetricConfig config) {
    {
        std::lock_guard lock(mutex_);
        config.id = nextBindingId_;
        validateBinding(config);
        bindings_[config.id] = config;
        ++nextBindingId_;
    }
    notify({{ConfigChangeKind::MetricsChanged, config.nodeId}});
    return config;
}

void Inventory::updateNodeMetric(const core::NodeMetricConfig& config) {
    int64_t previousNode = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = bindings_.find(config.id);
        if (it == bindings_.end()) {
            throw ConfigurationError(fmt::format("Unknown node metric id {}", config.id));
        }
        validateBinding(config);
        previousNode = it->second.nodeId;
        it->second = config;
    }
    std::vector<ConfigChange> changes{{ConfigChangeKind::MetricsChanged, config.nodeId}};
    if (previousNode != config.nodeId) {
        changes.push_back({ConfigChangeKind::MetricsChanged, previousNode});
    }
    notify(changes);
}

void Inventory::removeNodeMetric(int64_t configId) {
    int64_t nodeId = 0;
    {
        std::lock_guard lock(mutex_);
        auto it = bindings_.find(configId);
        if (it == bindings_.end()) {
            throw ConfigurationError(fmt::format("Unknown node metric id {}", configId));
        }
        nodeId = it->second.nodeId;
        bindings_.erase(it);
    }
    notify({{ConfigChangeKind::MetricsChanged, nodeId}});
}

std::vector<core::NodeMetricConfig> Inventory::nodeMetrics() const {
    std::lock_guard lock(mutex_);
    std::vector<core::NodeMetricConfig> result;
    result.reserve(bindings_.size());
    for (const auto& [id, binding] : bindings_) {
        result.push_back(binding);
    }
    return result;
}

std::optional<core::NodeMetricConfig> Inventory::nodeMetric(int64_t configId) const {
    std::lock_guard lock(mutex_);
    auto it = bindings_.find(configId);
    if (it == bindings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<core::MetricDefinition> Inventory::metricDefinition(int64_t id) const {
    std::lock_guard lock(mutex_);
    auto it = definitions_.find(id);
    if (it == definitions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// IConfigSource

std::vector<core::Group> Inventory::groups() const {
    std::lock_guard lock(mutex_);
    std::vector<core::Group> result;
    result.reserve(groups_.size());
    for (const auto& [id, group] : groups_) {
        result.push_back(group);
    }
    return result;
}

std::vector<core::Node> Inventory::nodes() const {
    std::lock_guard lock(mutex_);
    std::vector<core::Node> result;
    result.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) {
        result.push_back(node);
    }
    return result;
}

std::optional<core::Group> Inventory::group(int64_t id) const {
    std::lock_guard lock(mutex_);
    auto it = groups_.find(id);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<core::Node> Inventory::node(int64_t id) const {
    std::lock_guard lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<core::NodeContext> Inventory::nodeContext(int64_t nodeId) const {
    std::lock_guard lock(mutex_);
    auto nodeIt = nodes_.find(nodeId);
    if (nodeIt == nodes_.end()) {
        return std::nullopt;
    }
    auto groupIt = groups_.find(nodeIt->second.groupId);
    if (groupIt == groups_.end()) {
        return std::nullopt;
    }
    return core::NodeContext{nodeIt->second, groupIt->second,
                             core::resolveEffective(nodeIt->second, groupIt->second)};
}

std::vector<core::MetricDefinition> Inventory::metricDefinitions() const {
    std::lock_guard lock(mutex_);
    std::vector<core::MetricDefinition> result;
    result.reserve(definitions_.size());
    for (const auto& [id, definition] : definitions_) {
        result.push_back(definition);
    }
    return result;
}

std::vector<core::MetricBinding> Inventory::metricBindings(int64_t nodeId) const {
    std::lock_guard lock(mutex_);
    std::vector<core::MetricBinding> result;
    for (const auto& [id, binding] : bindings_) {
        if (binding.nodeId != nodeId) {
            continue;
        }
        auto definition = definitions_.find(binding.metricId);
        if (definition != definitions_.end()) {
            result.push_back({binding, definition->second});
        }
    }
    return result;
}

int Inventory::subscribe(ChangeCallback callback) {
    std::lock_guard lock(listenersMutex_);
    const int id = nextListenerId_++;
    listeners_[id] = std::move(callback);
    return id;
}

void Inventory::unsubscribe(int subscriptionId) {
    std::lock_guard lock(listenersMutex_);
    listeners_.erase(subscriptionId);
}

// INodeStore

std::optional<core::Node> Inventory::findNodeByIp(const std::string& ip) const {
    std::lock_guard lock(mutex_);
    for (const auto& [id, node] : nodes_) {
        if (node.ip == ip) {
            return node;
        }
    }
    return std::nullopt;
}

std::optional<core::Group> Inventory::findGroup(int64_t id) const {
    return group(id);
}

// Validation (called with mutex_ held)

void Inventory::validateGroup(const core::Group& group) const {
    if (!group.isValid()) {
        throw ConfigurationError(fmt::format("Invalid group '{}'", group.name));
    }
}

void Inventory::validateNode(const core::Node& node) const {
    if (!node.isValid()) {
        throw ConfigurationError(fmt::format("Invalid node '{}' ({})", node.name, node.ip));
    }
    if (!isValidIpv4(node.ip)) {
        throw ConfigurationError(fmt::format("Invalid IPv4 address '{}'", node.ip));
    }
    if (!groups_.contains(node.groupId)) {
        throw ConfigurationError(
            fmt::format("Node '{}' references unknown group {}", node.name, node.groupId));
    }
    for (const auto& [id, other] : nodes_) {
        if (id != node.id && other.ip == node.ip) {
            throw ConfigurationError(
                fmt::format("Address {} is already used by node '{}'", node.ip, other.name));
        }
    }
}

void Inventory::validateDefinition(const core::MetricDefinition& definition) const {
    if (definition.name.empty()) {
        throw ConfigurationError("Metric definition needs a name");
    }
    if (!definition.oid.isValid()) {
        throw ConfigurationError(fmt::format(
            "Metric '{}' has an invalid OID template '{}'", definition.name, definition.oid.pattern));
    }
    for (const auto& [id, other] : definitions_) {
        if (id != definition.id && other.name == definition.name) {
            throw ConfigurationError(
                fmt::format("Metric definition '{}' already exists", definition.name));
        }
    }
}

void Inventory::validateBinding(const core::NodeMetricConfig& config) const {
    if (!nodes_.contains(config.nodeId)) {
        throw ConfigurationError(
            fmt::format("Node metric references unknown node {}", config.nodeId));
    }
    auto definition = definitions_.find(config.metricId);
    if (definition == definitions_.end()) {
        throw ConfigurationError(
            fmt::format("Node metric references unknown metric {}", config.metricId));
    }
    if (config.interfaceIndex && *config.interfaceIndex < 0) {
        throw ConfigurationError("Interface index must not be negative");
    }
    if (config.enabled && definition->second.needsIndex() && !config.interfaceIndex) {
        throw ConfigurationError(fmt::format("Metric '{}' requires an interface index",
                                             definition->second.name));
    }
    if (config.intervalSeconds && *config.intervalSeconds <= 0) {
        throw ConfigurationError("Metric collection interval must be positive");
    }
    if ((config.warningThreshold && !std::isfinite(*config.warningThreshold)) ||
        (config.criticalThreshold && !std::isfinite(*config.criticalThreshold))) {
        throw ConfigurationError("Metric thresholds must be finite numbers");
    }
    for (const auto& [id, other] : bindings_) {
        if (id != config.id && other.nodeId == config.nodeId &&
            other.metricId == config.metricId && other.interfaceIndex == config.interfaceIndex) {
            throw ConfigurationError(fmt::format("Metric '{}' is already bound to node {}",
                                                 definition->second.name, config.nodeId));
        }
    }
}

void Inventory::notify(const std::vector<ConfigChange>& changes) {
    std::vector<ChangeCallback> listeners;
    {
        std::lock_guard lock(listenersMutex_);
        listeners.reserve(listeners_.size());
        for (const auto& [id, callback] : listeners_) {
            listeners.push_back(callback);
        }
    }

    for (const auto& change : changes) {
        for (const auto& listener : listeners) {
            try {
                listener(change);
            } catch (const std::exception& e) {
                spdlog::error("Configuration change listener failed: {}", e.what());
            }
        }
    }
}

} // namespace beamstate::monitor
