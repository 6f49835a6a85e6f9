#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/InventoryRepository.hpp"
#include "infrastructure/database/SampleRepository.hpp"
#include "monitor/MetricCatalog.hpp"
#include "support/TestData.hpp"

#include <algorithm>

using namespace beamstate;
using namespace beamstate::infra;
using namespace beamstate::test;

namespace {

std::shared_ptr<Database> openDatabase(const TempDir& dir) {
    auto db = std::make_shared<Database>((dir.path() / "beamstate.db").string());
    db->runMigrations();
    return db;
}

/// One daemon lifetime: load, attach, seed.
struct Session {
    explicit Session(std::shared_ptr<Database> database)
        : db(std::move(database)), repository(db) {
        repository.loadInto(inventory);
        repository.attach(inventory);
        repository.seedDefaults(inventory, 60);
    }

    std::shared_ptr<Database> db;
    monitor::Inventory inventory;
    InventoryRepository repository;
};

std::optional<core::MetricDefinition> definitionNamed(const monitor::Inventory& inventory,
                                                      const std::string& name) {
    for (const auto& definition : inventory.metricDefinitions()) {
        if (definition.name == name) {
            return definition;
        }
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("Inventory survives a restart", "[Integration][Persistence]") {
    TempDir dir("beamstate_inventory_persistence");

    int64_t nodeId = 0;
    int64_t bindingId = 0;
    size_t definitionCount = 0;
    {
        Session first(openDatabase(dir));
        REQUIRE(first.inventory.groups().size() == 1);
        definitionCount = first.inventory.metricDefinitions().size();
        CHECK(definitionCount == monitor::defaultMetricCatalog().size());

        auto coreGroup = first.inventory.addGroup(makeGroup("Core", 30));
        auto node = makeNode("core-sw", "10.5.0.1", coreGroup.id);
        node.monitorSnmp = true;
        node.snmpCommunity = "monitor";
        node.notificationPriority = 1;
        nodeId = first.inventory.addNode(node).id;

        auto bytesIn = definitionNamed(first.inventory, "Interface Bytes In");
        REQUIRE(bytesIn.has_value());
        core::NodeMetricConfig config;
        config.nodeId = nodeId;
        config.metricId = bytesIn->id;
        config.interfaceIndex = 10101;
        config.interfaceName = "Gi1/0/1";
        config.criticalThreshold = 900e6;
        bindingId = first.inventory.addNodeMetric(config).id;

        first.inventory.setGroupEnabled(coreGroup.id, false);
    }

    Session second(openDatabase(dir));

    SECTION("Seeding does not duplicate anything") {
        CHECK(second.inventory.groups().size() == 2);
        CHECK(second.inventory.metricDefinitions().size() == definitionCount);
        CHECK(second.db->schemaVersion() == 2);
    }

    SECTION("Nodes, overrides and bindings come back unchanged") {
        auto node = second.inventory.node(nodeId);
        REQUIRE(node.has_value());
        CHECK(node->name == "core-sw");
        CHECK(node->snmpCommunity == "monitor");
        CHECK(node->notificationPriority == 1);
        CHECK(node->monitorSnmp == true);

        auto context = second.inventory.nodeContext(nodeId);
        REQUIRE(context.has_value());
        CHECK_FALSE(context->group.enabled);
        CHECK(context->effective.intervalSeconds == 30);

        auto bindings = second.inventory.metricBindings(nodeId);
        REQUIRE(bindings.size() == 1);
        CHECK(bindings[0].config.id == bindingId);
        CHECK(bindings[0].config.interfaceName == "Gi1/0/1");
        CHECK(bindings[0].config.criticalThreshold == 900e6);
        CHECK(bindings[0].definition.name == "Interface Bytes In");
    }

    SECTION("Removing the node removes its bindings") {
        second.inventory.removeNode(nodeId);
        CHECK(second.repository.findBindingsByNode(nodeId).empty());

        Session third(second.db);
        CHECK_FALSE(third.inventory.node(nodeId).has_value());
        CHECK(third.inventory.metricBindings(nodeId).empty());
    }

    SECTION("Rejected changes are not stored") {
        auto groups = second.inventory.groups();
        auto coreGroup = std::find_if(groups.begin(), groups.end(),
                                      [](const core::Group& g) { return g.name == "Core"; });
        REQUIRE(coreGroup != groups.end());
        CHECK_THROWS_AS(second.inventory.removeGroup(coreGroup->id), core::ConfigurationError);
        CHECK(second.repository.findAllGroups().size() == 2);

        CHECK_THROWS_AS(second.inventory.addNode(makeNode("dup", "10.5.0.1", coreGroup->id)),
                        core::ConfigurationError);
        CHECK(second.repository.findAllNodes().size() == 1);
    }
}

TEST_CASE("Metric history honours retention across restarts", "[Integration][Persistence]") {
    TempDir dir("beamstate_sample_retention");
    const auto now = std::chrono::system_clock::now();

    {
        SampleRepository samples(openDatabase(dir));
        for (int day : {45, 31, 29, 1}) {
            core::MetricSample sample;
            sample.nodeId = 1;
            sample.metricId = 2;
            sample.value = day;
            sample.unit = "percent";
            sample.timestamp = now - std::chrono::hours(24 * day);
            samples.record(sample);
        }
        CHECK(samples.sampleCount() == 4);
    }

    SampleRepository samples(openDatabase(dir));
    CHECK(samples.sampleCount() == 4);
    CHECK(samples.cleanup(30) == 2);

    auto remaining = samples.findSamples(1, 2, std::nullopt);
    REQUIRE(remaining.size() == 2);
    CHECK(remaining[0].value == 1);
    CHECK(remaining[1].value == 29);
}
