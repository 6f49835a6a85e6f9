#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "monitor/MetricCollector.hpp"
#include "support/FakeProbeTransport.hpp"
#include "support/TestData.hpp"

#include <chrono>

using namespace beamstate;
using namespace beamstate::monitor;
using namespace beamstate::test;

// =============================================================================
// Pure computations
// =============================================================================

TEST_CASE("Metric computation benchmarks", "[benchmark][MetricCollector]") {
    const auto t0 = std::chrono::system_clock::now();
    const core::MetricReading previous{1'000'000.0, t0};
    const core::MetricReading current{1'250'000.0, t0 + std::chrono::seconds(60)};

    BENCHMARK("Byte counter rate") {
        return MetricCollector::deriveRate(previous, current, "bytes");
    };

    BENCHMARK("Threshold evaluation with hysteresis") {
        return ThresholdEvaluator::evaluate(88.0, core::AlertCondition::GreaterThan, 80.0, 90.0,
                                            core::ThresholdLevel::Critical);
    };
}

// =============================================================================
// Sample processing
// =============================================================================

TEST_CASE("Sample processing benchmarks", "[benchmark][MetricCollector]") {
    FakeProbeTransport transport;
    StatusCache cache;
    MetricCollector collector(transport, cache, nullptr);

    auto group = makeGroup("Core");
    group.id = 1;
    auto node = makeNode("sw1", "10.0.0.1", 1);
    node.id = 1;
    const core::NodeContext context{node, group, core::resolveEffective(node, group)};

    auto definition = makeCounter("Interface Bytes In");
    definition.id = 1;
    core::NodeMetricConfig config;
    config.id = 1;
    config.nodeId = 1;
    config.metricId = 1;
    config.interfaceIndex = 1;
    config.warningThreshold = 800e6;
    config.criticalThreshold = 950e6;
    const core::MetricBinding binding{config, definition};

    auto timestamp = std::chrono::system_clock::now();
    double counter = 0.0;

    BENCHMARK("Counter sample with rate and thresholds") {
        timestamp += std::chrono::seconds(60);
        counter += 1.5e9;
        return collector.processValue(context, binding, counter, timestamp).rate;
    };
}
