#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/InventoryRepository.hpp"
#include "monitor/DiscoveryScanner.hpp"
#include "monitor/ProbeCalls.hpp"
#include "support/MonitoringStack.hpp"
#include "support/TestData.hpp"

using namespace beamstate;
using namespace beamstate::monitor;
using namespace beamstate::test;

namespace {

void answerAgent(FakeProbeTransport& transport, const std::string& ip, const std::string& descr,
                 const std::string& name) {
    transport.setPing(ip, FakeProbeTransport::up());
    transport.setSnmp(ip, DiscoveryScanner::SYS_DESCR_OID, FakeProbeTransport::value(descr));
    transport.setSnmp(ip, DiscoveryScanner::SYS_OBJECT_ID_OID,
                      FakeProbeTransport::value(".1.3.6.1.4.1.9.1.516"));
    transport.setSnmp(ip, DiscoveryScanner::SYS_NAME_OID, FakeProbeTransport::value(name));
    transport.setSnmp(ip, SNMP_CHECK_OID, FakeProbeTransport::value("8641200"));
}

std::optional<core::Node> storedNode(InventoryRepository& repository, const std::string& ip) {
    for (const auto& node : repository.findAllNodes()) {
        if (node.ip == ip) {
            return node;
        }
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("Discovered devices are imported, persisted and monitored", "[Integration][Discovery]") {
    TempDir dir("beamstate_discovery_import");
    auto db = std::make_shared<infra::Database>((dir.path() / "beamstate.db").string());
    db->runMigrations();

    MonitoringStack stack;
    infra::InventoryRepository repository(db);
    repository.attach(stack.inventory);

    auto discovered = stack.inventory.addGroup(makeGroup("Discovered", 1));
    auto servers = stack.inventory.addGroup(makeGroup("Servers", 1));

    auto existing = makeNode("db-primary", "10.4.0.3", servers.id);
    existing.intervalSeconds = 30;
    existing.monitorSnmp = false;
    existing = stack.inventory.addNode(existing);

    answerAgent(stack.transport, "10.4.0.1", "Cisco IOS Software, C3750 switch", "core-sw");
    answerAgent(stack.transport, "10.4.0.3", "Linux db01 6.1.0", "db01");
    stack.transport.setPing("10.4.0.5", FakeProbeTransport::up());

    stack.start();

    DiscoveryConfig config;
    config.workerCount = 4;
    config.pingTimeout = std::chrono::milliseconds(50);
    config.snmpTimeout = std::chrono::milliseconds(50);
    DiscoveryScanner scanner(stack.transport, config);

    core::ScanRequest request;
    request.cidr = "10.4.0.0/29";
    REQUIRE(scanner.start(request) == ScanStartResult::Started);
    scanner.wait();

    auto progress = scanner.progress();
    CHECK(progress.total == 6);
    CHECK(progress.scanned == 6);
    CHECK(progress.icmpFound == 3);
    CHECK(progress.snmpFound == 2);

    auto results = scanner.results();
    REQUIRE(results.size() == 3);
    CHECK(results[0].ip == "10.4.0.1");
    CHECK(results[0].vendor == "Cisco");

    core::ImportOptions options;
    options.targetGroupId = discovered.id;
    auto report = DiscoveryScanner::importDiscovered(results, options, stack.inventory);
    REQUIRE(report.has_value());
    CHECK(*report == core::ImportReport{2, 1, 0});

    SECTION("New nodes land in the target group and are scheduled") {
        auto sw = stack.inventory.findNodeByIp("10.4.0.1");
        REQUIRE(sw.has_value());
        CHECK(sw->name == "core-sw");
        CHECK(sw->groupId == discovered.id);
        CHECK(sw->monitorSnmp == true);
        CHECK(stack.scheduler.isScheduled(sw->id));

        auto pingOnly = stack.inventory.findNodeByIp("10.4.0.5");
        REQUIRE(pingOnly.has_value());
        CHECK(pingOnly->name == "10.4.0.5");
        CHECK(pingOnly->monitorSnmp == false);

        CHECK(eventually([&] {
            return stack.status(sw->id) == core::NodeStatus::Up &&
                   stack.status(pingOnly->id) == core::NodeStatus::Up;
        }));
    }

    SECTION("The known node is merged, not replaced") {
        auto node = storedNode(repository, "10.4.0.3");
        REQUIRE(node.has_value());
        CHECK(node->id == existing.id);
        CHECK(node->name == "db-primary");
        CHECK(node->groupId == servers.id);
        CHECK(node->intervalSeconds == 30);
        CHECK(node->monitorSnmp == true);
        CHECK_FALSE(node->snmpCommunity.has_value());
        CHECK(stack.scheduler.scheduledInterval(existing.id) == 30);
    }

    SECTION("Imports are written to the database") {
        CHECK(repository.findAllNodes().size() == 3);
        auto sw = storedNode(repository, "10.4.0.1");
        REQUIRE(sw.has_value());
        CHECK(sw->groupId == discovered.id);
    }

    SECTION("Importing the same sweep again changes nothing") {
        REQUIRE(scanner.start(request) == ScanStartResult::Started);
        scanner.wait();
        auto again = DiscoveryScanner::importDiscovered(scanner.results(), options, stack.inventory);
        REQUIRE(again.has_value());
        CHECK(*again == core::ImportReport{0, 0, 3});
        CHECK(stack.inventory.nodes().size() == 3);
    }
}
