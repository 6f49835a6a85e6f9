#include <catch2/catch_test_macros.hpp>

#include "monitor/DiscoveryScanner.hpp"
#include "monitor/Inventory.hpp"
#include "support/FakeProbeTransport.hpp"
#include "support/TestData.hpp"

#include <atomic>

using namespace beamstate;
using namespace beamstate::monitor;
using namespace beamstate::test;

namespace {

DiscoveryConfig fastConfig() {
    DiscoveryConfig config;
    config.workerCount = 4;
    config.pingTimeout = std::chrono::milliseconds(50);
    config.snmpTimeout = std::chrono::milliseconds(50);
    return config;
}

void answerSnmp(FakeProbeTransport& transport, const std::string& ip, const std::string& descr,
                const std::string& name) {
    transport.setSnmp(ip, DiscoveryScanner::SYS_DESCR_OID, FakeProbeTransport::value(descr));
    transport.setSnmp(ip, DiscoveryScanner::SYS_OBJECT_ID_OID,
                      FakeProbeTransport::value(".1.3.6.1.4.1.9.1.1208"));
    transport.setSnmp(ip, DiscoveryScanner::SYS_NAME_OID, FakeProbeTransport::value(name));
}

core::DiscoveryResult found(const std::string& ip, bool ping, bool snmp,
                            std::optional<std::string> community = std::nullopt) {
    core::DiscoveryResult result;
    result.ip = ip;
    if (ping) {
        result.latencyMs = 1.0;
    }
    result.snmpEnabled = snmp;
    result.community = std::move(community);
    return result;
}

} // namespace

TEST_CASE("Device identification", "[DiscoveryScanner]") {
    SECTION("Keywords in sysDescr") {
        auto identity = core::identifyDevice(
            "Cisco IOS Software, C2960 Software, catalyst switch", "");
        CHECK(identity.vendor == "Cisco");
        CHECK(identity.deviceType == "Switch");
    }

    SECTION("Linux servers and NAS") {
        CHECK(core::identifyDevice("Linux web01 5.15.0", "").deviceType == "Server");
        auto nas = core::identifyDevice("Linux DiskStation Synology DSM", "");
        CHECK(nas.vendor == "Synology");
        CHECK(nas.deviceType == "NAS");
    }

    SECTION("Enterprise number decides when keywords do not") {
        auto identity = core::identifyDevice("RouterOS CCR1009", ".1.3.6.1.4.1.14988.1");
        CHECK(identity.vendor == "MikroTik");
    }

    SECTION("Nothing matches") {
        auto identity = core::identifyDevice("Embedded device", "1.3.6.1.4.1.99999.1");
        CHECK(identity.vendor == "Unknown");
        CHECK(identity.deviceType == "Device");
    }
}

TEST_CASE("DiscoveryScanner start validation", "[DiscoveryScanner]") {
    FakeProbeTransport transport;
    DiscoveryScanner scanner(transport, fastConfig());

    core::ScanRequest request;
    request.cidr = "not-a-range";
    CHECK(scanner.start(request) == ScanStartResult::InvalidRange);

    request.cidr = "10.0.0.0/8";
    CHECK(scanner.start(request) == ScanStartResult::InvalidRange);

    request.cidr = "10.0.0.0/30";
    request.useIcmp = false;
    request.useSnmp = false;
    CHECK(scanner.start(request) == ScanStartResult::NoProtocols);

    CHECK_FALSE(scanner.isRunning());
    CHECK(std::string(scanStartResultToString(ScanStartResult::AlreadyRunning)) ==
          "already running");
}

TEST_CASE("DiscoveryScanner sweep", "[DiscoveryScanner]") {
    FakeProbeTransport transport;
    DiscoveryScanner scanner(transport, fastConfig());

    transport.setPing("192.168.5.3", FakeProbeTransport::up(0.8));
    transport.setPing("192.168.5.10", FakeProbeTransport::up(1.2));
    answerSnmp(transport, "192.168.5.10", "Cisco IOS catalyst switch", "core-sw");

    core::ScanRequest request;
    request.cidr = "192.168.5.0/28";

    std::atomic<int> callbacks{0};
    REQUIRE(scanner.start(request, [&callbacks](const core::DiscoveryResult&) { ++callbacks; }) ==
            ScanStartResult::Started);
    scanner.wait();

    auto progress = scanner.progress();
    CHECK_FALSE(progress.running);
    CHECK(progress.total == 14);
    CHECK(progress.scanned == 14);
    CHECK(progress.icmpFound == 2);
    CHECK(progress.snmpFound == 1);
    CHECK(progress.percent() == 100.0);
    CHECK(callbacks == 2);

    auto results = scanner.results();
    REQUIRE(results.size() == 2);
    CHECK(results[0].ip == "192.168.5.3");
    CHECK_FALSE(results[0].snmpEnabled);
    CHECK(results[0].latencyMs == 0.8);

    CHECK(results[1].ip == "192.168.5.10");
    CHECK(results[1].snmpEnabled);
    CHECK(results[1].community == "public");
    CHECK(results[1].hostname == "core-sw");
    CHECK(results[1].vendor == "Cisco");
    CHECK(results[1].deviceType == "Switch");
}

TEST_CASE("DiscoveryScanner communities", "[DiscoveryScanner]") {
    FakeProbeTransport transport;
    DiscoveryScanner scanner(transport, fastConfig());

    transport.setPing("10.1.1.1", FakeProbeTransport::up());
    answerSnmp(transport, "10.1.1.1", "Linux nas01", "nas01");
    transport.rejectCommunity("public");

    core::ScanRequest request;
    request.cidr = "10.1.1.1/32";
    request.communities = {"public", "monitor"};

    REQUIRE(scanner.start(request) == ScanStartResult::Started);
    scanner.wait();

    auto results = scanner.results();
    REQUIRE(results.size() == 1);
    CHECK(results[0].community == "monitor");
}

TEST_CASE("DiscoveryScanner SNMP-only sweep", "[DiscoveryScanner]") {
    FakeProbeTransport transport;
    DiscoveryScanner scanner(transport, fastConfig());

    answerSnmp(transport, "10.2.0.2", "HP ProCurve switch", "edge");

    core::ScanRequest request;
    request.cidr = "10.2.0.0/30";
    request.useIcmp = false;

    REQUIRE(scanner.start(request) == ScanStartResult::Started);
    scanner.wait();

    auto results = scanner.results();
    REQUIRE(results.size() == 1);
    CHECK(results[0].ip == "10.2.0.2");
    CHECK_FALSE(results[0].latencyMs.has_value());
    CHECK(transport.pingCount("10.2.0.2") == 0);
}

TEST_CASE("DiscoveryScanner cancellation", "[DiscoveryScanner]") {
    FakeProbeTransport transport;
    auto config = fastConfig();
    config.workerCount = 1;
    DiscoveryScanner scanner(transport, config);

    // Silent hosts wait for the full deadline, which keeps the scan busy
    core::ScanRequest request;
    request.cidr = "10.3.0.0/24";
    request.useSnmp = false;
    for (int i = 1; i < 255; ++i) {
        transport.setSilent("10.3.0." + std::to_string(i));
    }

    REQUIRE(scanner.start(request) == ScanStartResult::Started);
    CHECK(scanner.start(request) == ScanStartResult::AlreadyRunning);

    scanner.cancel();
    scanner.wait();

    auto progress = scanner.progress();
    CHECK(progress.cancelled);
    CHECK_FALSE(progress.running);
    CHECK(progress.scanned < progress.total);
}

TEST_CASE("Importing discovery results", "[DiscoveryScanner]") {
    Inventory inventory;
    auto target = inventory.addGroup(makeGroup("Discovered"));
    auto other = inventory.addGroup(makeGroup("Servers"));

    core::ImportOptions options;
    options.targetGroupId = target.id;

    SECTION("New addresses become nodes in the target group") {
        auto result = found("10.0.0.5", true, true, "public");
        result.hostname = "printer-2";

        auto report = DiscoveryScanner::importDiscovered({result, found("10.0.0.6", true, false)},
                                                         options, inventory);
        REQUIRE(report.has_value());
        CHECK(report->imported == 2);

        auto node = inventory.findNodeByIp("10.0.0.5");
        REQUIRE(node.has_value());
        CHECK(node->name == "printer-2");
        CHECK(node->groupId == target.id);
        CHECK(node->monitorPing == true);
        CHECK(node->monitorSnmp == true);
        CHECK_FALSE(node->snmpCommunity.has_value());

        CHECK(inventory.findNodeByIp("10.0.0.6")->name == "10.0.0.6");
    }

    SECTION("A non-default community is stored on new nodes") {
        DiscoveryScanner::importDiscovered({found("10.0.0.7", false, true, "monitor")}, options,
                                           inventory);
        auto node = inventory.findNodeByIp("10.0.0.7");
        REQUIRE(node.has_value());
        CHECK(node->snmpCommunity == "monitor");
        CHECK(node->monitorPing == false);
    }

    SECTION("Existing nodes keep their name, group and overrides") {
        auto existing = makeNode("db-primary", "10.0.0.8", other.id);
        existing.intervalSeconds = 15;
        existing.monitorSnmp = false;
        inventory.addNode(existing);

        auto result = found("10.0.0.8", true, true, "monitor");
        result.hostname = "localhost";
        auto report = DiscoveryScanner::importDiscovered({result}, options, inventory);

        REQUIRE(report.has_value());
        CHECK(report->updated == 1);
        CHECK(report->imported == 0);

        auto node = inventory.findNodeByIp("10.0.0.8");
        CHECK(node->name == "db-primary");
        CHECK(node->groupId == other.id);
        CHECK(node->intervalSeconds == 15);
        CHECK(node->monitorSnmp == true);
        CHECK(node->snmpCommunity == "monitor");
    }

    SECTION("An explicit community is never replaced") {
        auto existing = makeNode("edge", "10.0.0.9", target.id);
        existing.snmpCommunity = "secret";
        existing.monitorSnmp = true;
        inventory.addNode(existing);

        auto report = DiscoveryScanner::importDiscovered({found("10.0.0.9", true, true, "public")},
                                                         options, inventory);
        CHECK(report->skipped == 1);
        CHECK(inventory.findNodeByIp("10.0.0.9")->snmpCommunity == "secret");
    }

    SECTION("Importing twice changes nothing the second time") {
        std::vector<core::DiscoveryResult> results{found("10.0.0.5", true, true, "public")};
        DiscoveryScanner::importDiscovered(results, options, inventory);
        auto again = DiscoveryScanner::importDiscovered(results, options, inventory);

        REQUIRE(again.has_value());
        CHECK(*again == core::ImportReport{0, 0, 1});
        CHECK(inventory.nodes().size() == 1);
    }

    SECTION("Protocols can be left off") {
        options.useSnmp = false;
        DiscoveryScanner::importDiscovered({found("10.0.0.5", true, true, "public")}, options,
                                           inventory);
        CHECK(inventory.findNodeByIp("10.0.0.5")->monitorSnmp == false);
    }

    SECTION("Unknown target group") {
        options.targetGroupId = 404;
        CHECK_FALSE(DiscoveryScanner::importDiscovered({found("10.0.0.5", true, false)}, options,
                                                       inventory)
                        .has_value());
        CHECK(inventory.nodes().empty());
    }

    SECTION("Invalid results are skipped") {
        auto report = DiscoveryScanner::importDiscovered(
            {found("999.0.0.1", true, false), found("10.0.0.5", true, false)}, options,
            inventory);
        REQUIRE(report.has_value());
        CHECK(report->imported == 1);
        CHECK(report->skipped == 1);
    }
}
