#include <catch2/catch_test_macros.hpp>

#include "infrastructure/database/SampleRepository.hpp"
#include "support/MonitoringStack.hpp"
#include "support/TestData.hpp"

#include <thread>

using namespace beamstate;
using namespace beamstate::test;

TEST_CASE("Reachability changes flow from probes to notifications", "[Integration][Pipeline]") {
    MonitoringStack stack;
    auto group = stack.inventory.addGroup(makeGroup("Core", 1));
    auto node = makeNode("sw1", "10.0.0.1", group.id);
    node.notificationPriority = 2;
    node = stack.inventory.addNode(node);

    stack.transport.setPing("10.0.0.1", FakeProbeTransport::up(3.0));
    stack.start();

    REQUIRE(eventually([&] { return stack.status(node.id) == core::NodeStatus::Up; }));
    CHECK(stack.notifier.count() == 0);

    SECTION("The trace bus replays the history to late subscribers") {
        auto subscription = stack.bus.subscribe(true);
        auto first = subscription->next(std::chrono::milliseconds(500));
        REQUIRE(first.has_value());
        CHECK(first->nodeId == node.id);
        CHECK(first->oldStatus == core::NodeStatus::Waiting);
        CHECK(first->newStatus == core::NodeStatus::Up);
        stack.bus.unsubscribe(subscription);
    }

    SECTION("An outage is alerted once and so is the recovery") {
        stack.transport.setPing("10.0.0.1", FakeProbeTransport::timeout());
        REQUIRE(stack.notifier.waitForCount(1, std::chrono::seconds(8)));
        CHECK(stack.status(node.id) == core::NodeStatus::Down);

        auto down = stack.notifier.sent()[0];
        CHECK(down.title == "sw1 is DOWN");
        CHECK(down.priority == 2);
        CHECK(down.message.find("10.0.0.1") != std::string::npos);

        stack.transport.setPing("10.0.0.1", FakeProbeTransport::up());
        REQUIRE(stack.notifier.waitForCount(2, std::chrono::seconds(5)));
        CHECK(stack.notifier.sent()[1].title == "sw1 is UP");
        CHECK(stack.status(node.id) == core::NodeStatus::Up);

        // Pending retries are not transitions worth an alert
        CHECK(stack.notifier.count() == 2);
    }

    SECTION("Pausing a node never alerts") {
        stack.inventory.setNodeEnabled(node.id, false);
        CHECK(stack.status(node.id) == core::NodeStatus::Paused);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        CHECK(stack.notifier.count() == 0);
    }
}

TEST_CASE("Metric samples are stored and thresholds alert", "[Integration][Pipeline]") {
    auto db = std::make_shared<infra::Database>(":memory:");
    db->runMigrations();
    infra::SampleRepository samples(db);

    MonitoringStack stack({}, &samples);
    auto group = stack.inventory.addGroup(makeGroup("Core", 1));
    auto node = stack.inventory.addNode(makeNode("sw1", "10.0.0.1", group.id));
    auto temperature = stack.inventory.addMetricDefinition(
        makeGauge("Temperature", "1.3.6.1.4.1.9.9.13.1.3.1.3.1", "celsius"));

    stack.transport.setPing("10.0.0.1", FakeProbeTransport::up());
    stack.transport.setSnmpSequence("10.0.0.1", "1.3.6.1.4.1.9.9.13.1.3.1.3.1",
                                    {FakeProbeTransport::value("45"),
                                     FakeProbeTransport::value("95")});

    core::NodeMetricConfig config;
    config.nodeId = node.id;
    config.metricId = temperature.id;
    config.warningThreshold = 70.0;
    config.criticalThreshold = 90.0;
    stack.inventory.addNodeMetric(config);

    stack.start();

    REQUIRE(eventually([&] { return samples.sampleCount() >= 2; }, std::chrono::seconds(5)));
    auto stored = samples.findSamples(node.id, temperature.id, std::nullopt);
    REQUIRE(stored.size() >= 2);
    CHECK(stored.back().value == 45);
    CHECK(stored.front().value == 95);
    CHECK(stored.front().unit == "celsius");

    REQUIRE(stack.notifier.waitForCount(1, std::chrono::seconds(2)));
    auto alert = stack.notifier.sent()[0];
    CHECK(alert.title == "BeamState CRITICAL: sw1 - Temperature");
    CHECK(alert.priority == 1);

    SECTION("The value stays critical without repeating the alert") {
        REQUIRE(eventually([&] { return samples.sampleCount() >= 4; }, std::chrono::seconds(5)));
        CHECK(stack.notifier.countTitled("CRITICAL") == 1);
    }

    SECTION("The latest value is visible in the status cache") {
        auto record = stack.cache.snapshot(node.id);
        REQUIRE(record.has_value());
        auto key = core::MetricKey{node.id, temperature.id, std::nullopt};
        REQUIRE(record->lastSamples.count(key) == 1);
        CHECK(record->lastSamples.at(key).value == 95);
        CHECK(record->metricLevels.at(key) == core::ThresholdLevel::Critical);
    }
}
