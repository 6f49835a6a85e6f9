#pragma once

#include "core/types/MetricDefinition.hpp"

#include <vector>

namespace beamstate::monitor {

class Inventory;

/**
 * @brief Built-in metric definitions (IF-MIB, IF-MIB HC counters, HOST-RESOURCES, vendor CPU/temperature).
 */
std::vector<core::MetricDefinition> defaultMetricCatalog();

/**
 * @brief Adds every built-in definition whose name is not yet in the inventory.
 * @return Number of definitions added.
 */
int seedMetricCatalog(Inventory& inventory);

} // namespace beamstate::monitor
