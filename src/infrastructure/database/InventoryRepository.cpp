#include "infrastructure/database/InventoryRepository.hpp"

#include "monitor/MetricCatalog.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace beamstate::infra {

namespace {

core::Group rowToGroup(Statement& stmt) {
    core::Group group;
    group.id = stmt.columnInt64(0);
    group.name = stmt.columnText(1);
    group.intervalSeconds = stmt.columnInt(2);
    group.packetCount = stmt.columnInt(3);
    group.snmpCommunity = stmt.columnText(4);
    group.snmpPort = static_cast<uint16_t>(stmt.columnInt(5));
    group.enabled = stmt.columnBool(6);
    group.monitorPing = stmt.columnBool(7);
    group.monitorSnmp = stmt.columnBool(8);
    return group;
}

std::optional<bool> optionalBool(const Statement& stmt, int index) {
    auto value = stmt.columnOptionalInt(index);
    if (!value) {
        return std::nullopt;
    }
    return *value != 0;
}

core::Node rowToNode(Statement& stmt) {
    core::Node node;
    node.id = stmt.columnInt64(0);
    node.name = stmt.columnText(1);
    node.ip = stmt.columnText(2);
    node.groupId = stmt.columnInt64(3);
    node.intervalSeconds = stmt.columnOptionalInt(4);
    node.packetCount = stmt.columnOptionalInt(5);
    node.snmpCommunity = stmt.columnOptionalText(6);
    if (auto port = stmt.columnOptionalInt(7)) {
        node.snmpPort = static_cast<uint16_t>(*port);
    }
    node.monitorPing = optionalBool(stmt, 8);
    node.monitorSnmp = optionalBool(stmt, 9);
    node.enabled = stmt.columnBool(10);
    node.notificationPriority = stmt.columnOptionalInt(11);
    return node;
}

core::MetricDefinition rowToDefinition(Statement& stmt) {
    core::MetricDefinition definition;
    definition.id = stmt.columnInt64(0);
    definition.name = stmt.columnText(1);
    definition.oid.pattern = stmt.columnText(2);
    definition.oid.requiresIndex = stmt.columnBool(3);
    definition.category = core::categoryFromString(stmt.columnText(4));
    definition.kind = core::kindFromString(stmt.columnText(5));
    definition.unit = stmt.columnText(6);
    definition.deviceType = stmt.columnText(7);
    definition.description = stmt.columnText(8);
    return definition;
}

core::NodeMetricConfig rowToBinding(Statement& stmt) {
    core::NodeMetricConfig binding;
    binding.id = stmt.columnInt64(0);
    binding.nodeId = stmt.columnInt64(1);
    binding.metricId = stmt.columnInt64(2);
    binding.interfaceIndex = stmt.columnOptionalInt(3);
    binding.interfaceName = stmt.columnText(4);
    binding.intervalSeconds = stmt.columnOptionalInt(5);
    binding.enabled = stmt.columnBool(6);
    binding.condition = core::conditionFromString(stmt.columnText(7));
    binding.warningThreshold = stmt.columnOptionalDouble(8);
    binding.criticalThreshold = stmt.columnOptionalDouble(9);
    return binding;
}

constexpr const char* BINDING_COLUMNS =
    "id, node_id, metric_id, interface_index, interface_name, interval_seconds, enabled, "
    "alert_condition, warning_threshold, critical_threshold";

} // namespace

InventoryRepository::InventoryRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

InventoryRepository::~InventoryRepository() {
    detach();
}

void InventoryRepository::loadInto(monitor::Inventory& inventory) {
    auto groups = findAllGroups();
    auto nodes = findAllNodes();
    auto definitions = findAllDefinitions();
    auto bindings = findAllBindings();

    spdlog::info("Loaded {} groups, {} nodes, {} metric definitions, {} bindings",
                 groups.size(), nodes.size(), definitions.size(), bindings.size());
    inventory.replaceAll(std::move(groups), std::move(nodes), std::move(definitions),
                         std::move(bindings));
}

void InventoryRepository::seedDefaults(monitor::Inventory& inventory, int defaultIntervalSeconds) {
    if (inventory.groups().empty()) {
        core::Group group;
        group.name = "Default";
        group.intervalSeconds = defaultIntervalSeconds;
        inventory.addGroup(group);
        spdlog::info("Created default group");
    }
    monitor::seedMetricCatalog(inventory);
}

void InventoryRepository::attach(monitor::Inventory& inventory) {
    detach();
    inventory_ = &inventory;
    subscriptionId_ =
        inventory.subscribe([this](const core::ConfigChange& change) { persist(change); });
}

void InventoryRepository::detach() {
    if (inventory_ && subscriptionId_) {
        inventory_->unsubscribe(*subscriptionId_);
    }
    subscriptionId_.reset();
    inventory_ = nullptr;
}

void InventoryRepository::persist(const core::ConfigChange& change) {
    if (!inventory_) {
        return;
    }

    // Inventory listeners must not throw; database failures are logged here
    try {
        switch (change.kind) {
        case core::ConfigChangeKind::GroupChanged:
            if (auto group = inventory_->group(change.id)) {
                saveGroup(*group);
            }
            break;
        case core::ConfigChangeKind::GroupRemoved:
            removeGroup(change.id);
            break;
        case core::ConfigChangeKind::NodeChanged:
            if (auto node = inventory_->node(change.id)) {
                saveNode(*node);
            }
            break;
        case core::ConfigChangeKind::NodeRemoved:
            removeNode(change.id);
            break;
        case core::ConfigChangeKind::MetricsChanged:
            syncMetrics(*inventory_, change.id);
            break;
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist configuration change: {}", e.what());
    }
}

std::vector<core::Group> InventoryRepository::findAllGroups() {
    std::vector<core::Group> groups;
    auto stmt = db_->prepare(
        "SELECT id, name, interval_seconds, packet_count, snmp_community, snmp_port, enabled, "
        "monitor_ping, monitor_snmp FROM node_groups ORDER BY id");
    while (stmt.step()) {
        groups.push_back(rowToGroup(stmt));
    }
    return groups;
}

std::vector<core::Node> InventoryRepository::findAllNodes() {
    std::vector<core::Node> nodes;
    auto stmt = db_->prepare(
        "SELECT id, name, ip, group_id, interval_seconds, packet_count, snmp_community, "
        "snmp_port, monitor_ping, monitor_snmp, enabled, notification_priority "
        "FROM nodes ORDER BY id");
    while (stmt.step()) {
        nodes.push_back(rowToNode(stmt));
    }
    return nodes;
}

std::vector<core::MetricDefinition> InventoryRepository::findAllDefinitions() {
    std::vector<core::MetricDefinition> definitions;
    auto stmt = db_->prepare(
        "SELECT id, name, oid, requires_index, category, kind, unit, device_type, description "
        "FROM metric_definitions ORDER BY id");
    while (stmt.step()) {
        definitions.push_back(rowToDefinition(stmt));
    }
    return definitions;
}

std::vector<core::NodeMetricConfig> InventoryRepository::findAllBindings() {
    std::vector<core::NodeMetricConfig> bindings;
    auto stmt =
        db_->prepare(std::string("SELECT ") + BINDING_COLUMNS + " FROM node_metrics ORDER BY id");
    while (stmt.step()) {
        bindings.push_back(rowToBinding(stmt));
    }
    return bindings;
}

std::vector<core::NodeMetricConfig> InventoryRepository::findBindingsByNode(int64_t nodeId) {
    std::vector<core::NodeMetricConfig> bindings;
    auto stmt = db_->prepare(std::string("SELECT ") + BINDING_COLUMNS +
                             " FROM node_metrics WHERE node_id = ? ORDER BY id");
    stmt.bind(1, nodeId);
    while (stmt.step()) {
        bindings.push_back(rowToBinding(stmt));
    }
    return bindings;
}

void InventoryRepository::saveGroup(const core::Group& group) {
    auto stmt = db_->prepare(R"(
        INSERT INTO node_groups (id, name, interval_seconds, packet_count, snmp_community, snmp_port,
                            enabled, monitor_ping, monitor_snmp)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name, interval_seconds = excluded.interval_seconds,
            packet_count = excluded.packet_count, snmp_community = excluded.snmp_community,
            snmp_port = excluded.snmp_port, enabled = excluded.enabled,
            monitor_ping = excluded.monitor_ping, monitor_snmp = excluded.monitor_snmp
    )");
    stmt.bind(1, group.id);
    stmt.bind(2, group.name);
    stmt.bind(3, group.intervalSeconds);
    stmt.bind(4, group.packetCount);
    stmt.bind(5, group.snmpCommunity);
    stmt.bind(6, static_cast<int>(group.snmpPort));
    stmt.bind(7, group.enabled);
    stmt.bind(8, group.monitorPing);
    stmt.bind(9, group.monitorSnmp);
    stmt.step();
    spdlog::debug("Saved group {}", group.id);
}

void InventoryRepository::removeGroup(int64_t id) {
    auto stmt = db_->prepare("DELETE FROM node_groups WHERE id = ?");
    stmt.bind(1, id);
    stmt.step();
    spdlog::debug("Removed group {}", id);
}

void InventoryRepository::saveNode(const core::Node& node) {
    auto stmt = db_->prepare(R"(
        INSERT INTO nodes (id, name, ip, group_id, interval_seconds, packet_count, snmp_community,
                           snmp_port, monitor_ping, monitor_snmp, enabled, notification_priority)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name, ip = excluded.ip, group_id = excluded.group_id,
            interval_seconds = excluded.interval_seconds, packet_count = excluded.packet_count,
            snmp_community = excluded.snmp_community, snmp_port = excluded.snmp_port,
            monitor_ping = excluded.monitor_ping, monitor_snmp = excluded.monitor_snmp,
            enabled = excluded.enabled, notification_priority = excluded.notification_priority
    )");
    stmt.bind(1, node.id);
    stmt.bind(2, node.name);
    stmt.bind(3, node.ip);
    stmt.bind(4, node.groupId);
    stmt.bind(5, node.intervalSeconds);
    stmt.bind(6, node.packetCount);
    stmt.bind(7, node.snmpCommunity);
    if (node.snmpPort) {
        stmt.bind(8, static_cast<int>(*node.snmpPort));
    } else {
        stmt.bindNull(8);
    }
    stmt.bind(9, node.monitorPing);
    stmt.bind(10, node.monitorSnmp);
    stmt.bind(11, node.enabled);
    stmt.bind(12, node.notificationPriority);
    stmt.step();
    spdlog::debug("Saved node {}", node.id);
}

void InventoryRepository::removeNode(int64_t id) {
    auto stmt = db_->prepare("DELETE FROM nodes WHERE id = ?");
    stmt.bind(1, id);
    stmt.step();
    spdlog::debug("Removed node {}", id);
}

void InventoryRepository::saveDefinition(const core::MetricDefinition& definition) {
    auto stmt = db_->prepare(R"(
        INSERT INTO metric_definitions (id, name, oid, requires_index, category, kind, unit,
                                        device_type, description)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name, oid = excluded.oid, requires_index = excluded.requires_index,
            category = excluded.category, kind = excluded.kind, unit = excluded.unit,
            device_type = excluded.device_type, description = excluded.description
    )");
    stmt.bind(1, definition.id);
    stmt.bind(2, definition.name);
    stmt.bind(3, definition.oid.pattern);
    stmt.bind(4, definition.oid.requiresIndex);
    stmt.bind(5, core::categoryToString(definition.category));
    stmt.bind(6, core::kindToString(definition.kind));
    stmt.bind(7, definition.unit);
    stmt.bind(8, definition.deviceType);
    stmt.bind(9, definition.description);
    stmt.step();
}

void InventoryRepository::saveBinding(const core::NodeMetricConfig& binding) {
    auto stmt = db_->prepare(R"(
        INSERT INTO node_metrics (id, node_id, metric_id, interface_index, interface_name,
                                  interval_seconds, enabled, alert_condition, warning_threshold,
                                  critical_threshold)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            node_id = excluded.node_id, metric_id = excluded.metric_id,
            interface_index = excluded.interface_index, interface_name = excluded.interface_name,
            interval_seconds = excluded.interval_seconds, enabled = excluded.enabled,
            alert_condition = excluded.alert_condition,
            warning_threshold = excluded.warning_threshold,
            critical_threshold = excluded.critical_threshold
    )");
    stmt.bind(1, binding.id);
    stmt.bind(2, binding.nodeId);
    stmt.bind(3, binding.metricId);
    stmt.bind(4, binding.interfaceIndex);
    stmt.bind(5, binding.interfaceName);
    stmt.bind(6, binding.intervalSeconds);
    stmt.bind(7, binding.enabled);
    stmt.bind(8, core::conditionToString(binding.condition));
    stmt.bind(9, binding.warningThreshold);
    stmt.bind(10, binding.criticalThreshold);
    stmt.step();
}

void InventoryRepository::syncMetrics(const monitor::Inventory& inventory, int64_t nodeId) {
    db_->transaction([&]() {
        if (nodeId == 0) {
            std::set<int64_t> keep;
            for (const auto& definition : inventory.metricDefinitions()) {
                saveDefinition(definition);
                keep.insert(definition.id);
            }
            for (const auto& stored : findAllDefinitions()) {
                if (!keep.count(stored.id)) {
                    auto stmt = db_->prepare("DELETE FROM metric_definitions WHERE id = ?");
                    stmt.bind(1, stored.id);
                    stmt.step();
                }
            }
        }

        std::vector<core::NodeMetricConfig> current;
        for (const auto& binding : inventory.nodeMetrics()) {
            if (nodeId == 0 || binding.nodeId == nodeId) {
                current.push_back(binding);
            }
        }

        std::set<int64_t> keep;
        for (const auto& binding : current) {
            saveBinding(binding);
            keep.insert(binding.id);
        }

        const auto stored = nodeId == 0 ? findAllBindings() : findBindingsByNode(nodeId);
        for (const auto& binding : stored) {
            if (!keep.count(binding.id)) {
                auto stmt = db_->prepare("DELETE FROM node_metrics WHERE id = ?");
                stmt.bind(1, binding.id);
                stmt.step();
            }
        }
    });
    spdlog::debug("Synchronised metric configuration{}",
                  nodeId == 0 ? std::string() : " of node " + std::to_string(nodeId));
}

} // namespace beamstate::infra
