#include "monitor/MetricCatalog.hpp"

#include "monitor/Inventory.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace beamstate::monitor {

namespace {

core::MetricDefinition makeDefinition(const char* name, const char* oid, core::MetricKind kind,
                                      const char* unit, core::MetricCategory category,
                                      const char* description) {
    core::MetricDefinition definition;
    definition.name = name;
    definition.oid.pattern = oid;
    definition.oid.requiresIndex = definition.oid.hasPlaceholder();
    definition.kind = kind;
    definition.unit = unit;
    definition.category = category;
    definition.description = description;
    return definition;
}

} // namespace

std::vector<core::MetricDefinition> defaultMetricCatalog() {
    using core::MetricCategory;
    using core::MetricKind;

    return {
        makeDefinition("Interface Bytes In", "1.3.6.1.2.1.2.2.1.10.{index}", MetricKind::Counter,
                       "bytes", MetricCategory::Interface, "IF-MIB ifInOctets"),
        makeDefinition("Interface Bytes Out", "1.3.6.1.2.1.2.2.1.16.{index}", MetricKind::Counter,
                       "bytes", MetricCategory::Interface, "IF-MIB ifOutOctets"),
        makeDefinition("Interface Errors In", "1.3.6.1.2.1.2.2.1.14.{index}", MetricKind::Counter,
                       "errors", MetricCategory::Interface, "IF-MIB ifInErrors"),
        makeDefinition("Interface Errors Out", "1.3.6.1.2.1.2.2.1.20.{index}",
                       MetricKind::Counter, "errors", MetricCategory::Interface,
                       "IF-MIB ifOutErrors"),
        makeDefinition("Interface Status", "1.3.6.1.2.1.2.2.1.8.{index}", MetricKind::Gauge,
                       "status", MetricCategory::Interface, "IF-MIB ifOperStatus (1 = up)"),
        makeDefinition("Traffic In (HC)", "1.3.6.1.2.1.31.1.1.1.6.{index}", MetricKind::Counter,
                       "bytes", MetricCategory::Interface, "IF-MIB ifHCInOctets"),
        makeDefinition("Traffic Out (HC)", "1.3.6.1.2.1.31.1.1.1.10.{index}",
                       MetricKind::Counter, "bytes", MetricCategory::Interface,
                       "IF-MIB ifHCOutOctets"),
        makeDefinition("CPU Utilization", "1.3.6.1.2.1.25.3.3.1.2.{index}", MetricKind::Gauge,
                       "percent", MetricCategory::System,
                       "HOST-RESOURCES-MIB hrProcessorLoad; index is the CPU, usually 1"),
        makeDefinition("Temperature", "1.3.6.1.4.1.4413.1.1.43.1.8.1.5.1.0", MetricKind::Gauge,
                       "celsius", MetricCategory::System, "Broadcom FASTPATH chassis temperature"),
        makeDefinition("CPU % (Alt. OID)", "1.3.6.1.4.1.4413.1.1.1.1.4.6.1.3.1",
                       MetricKind::Gauge, "percent", MetricCategory::System,
                       "Broadcom FASTPATH CPU utilization"),
        makeDefinition("CPU Load (%)", "1.3.6.1.4.1.4413.1.1.43.1.8.1.4.1.0", MetricKind::Gauge,
                       "percent", MetricCategory::System, "Broadcom FASTPATH CPU load"),
    };
}

int seedMetricCatalog(Inventory& inventory) {
    const auto existing = inventory.metricDefinitions();
    int added = 0;

    for (auto& definition : defaultMetricCatalog()) {
        const bool present =
            std::any_of(existing.begin(), existing.end(), [&definition](const auto& other) {
                return other.name == definition.name;
            });
        if (present) {
            continue;
        }
        inventory.addMetricDefinition(std::move(definition));
        ++added;
    }

    if (added > 0) {
        spdlog::info("Seeded {} default metric definitions", added);
    }
    return added;
}

} // namespace beamstate::monitor
