#pragma once

#include "core/types/Group.hpp"
#include "core/types/MetricDefinition.hpp"
#include "core/types/Node.hpp"
#include "infrastructure/database/Database.hpp"
#include "monitor/Inventory.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace beamstate::infra {

/**
 * @brief Persists the inventory: groups, nodes, metric definitions and node metric bindings.
 *
 * loadInto() fills an Inventory from the database; attach() then writes every
 * change the inventory reports back to the database. Rows keep the ids the
 * inventory assigned.
 */
class InventoryRepository {
public:
    explicit InventoryRepository(std::shared_ptr<Database> db);
    ~InventoryRepository();

    InventoryRepository(const InventoryRepository&) = delete;
    InventoryRepository& operator=(const InventoryRepository&) = delete;

    /**
     * @brief Replaces the inventory's contents with the stored configuration.
     * @throws core::ConfigurationError if the stored data is inconsistent.
     */
    void loadInto(monitor::Inventory& inventory);

    /**
     * @brief Creates a "Default" group if there is none and adds missing catalog metrics.
     *
     * Call after attach() so the seeded entries are persisted.
     */
    void seedDefaults(monitor::Inventory& inventory, int defaultIntervalSeconds);

    /**
     * @brief Starts writing inventory changes through to the database.
     */
    void attach(monitor::Inventory& inventory);
    void detach();

    std::vector<core::Group> findAllGroups();
    std::vector<core::Node> findAllNodes();
    std::vector<core::MetricDefinition> findAllDefinitions();
    std::vector<core::NodeMetricConfig> findAllBindings();
    std::vector<core::NodeMetricConfig> findBindingsByNode(int64_t nodeId);

    void saveGroup(const core::Group& group);
    void removeGroup(int64_t id);
    void saveNode(const core::Node& node);
    void removeNode(int64_t id);
    void saveDefinition(const core::MetricDefinition& definition);
    void saveBinding(const core::NodeMetricConfig& binding);

    /**
     * @brief Makes the stored bindings of one node, or of all nodes if nodeId is 0, match the inventory.
     */
    void syncMetrics(const monitor::Inventory& inventory, int64_t nodeId);

private:
    void persist(const core::ConfigChange& change);

    std::shared_ptr<Database> db_;
    monitor::Inventory* inventory_{nullptr};
    std::optional<int> subscriptionId_;
};

} // namespace beamstate::infra
