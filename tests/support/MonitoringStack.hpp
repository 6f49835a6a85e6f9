#pragma once

#include "infrastructure/network/AsioContext.hpp"
#include "monitor/AlertThrottler.hpp"
#include "monitor/Inventory.hpp"
#include "monitor/MetricCollector.hpp"
#include "monitor/Scheduler.hpp"
#include "monitor/StatusCache.hpp"
#include "monitor/TraceBus.hpp"
#include "support/FakeProbeTransport.hpp"
#include "support/RecordingNotifier.hpp"

namespace beamstate::test {

/**
 * @brief The monitoring engine wired the way the daemon wires it, on a fake transport.
 *
 * Probe timeouts are short so DOWN is reached within a few seconds at a 1 s
 * group interval.
 */
struct MonitoringStack {
    explicit MonitoringStack(monitor::ThrottlerConfig throttlerConfig = {},
                             core::IMetricsSink* sink = nullptr)
        : throttler(notifier, throttlerConfig,
                    [this](int64_t nodeId) -> std::optional<int> {
                        auto node = inventory.node(nodeId);
                        return node ? node->notificationPriority : std::nullopt;
                    }),
          collector(transport, cache, sink, std::chrono::milliseconds(100)),
          pool("integration-io", 2),
          scheduler(pool.getContext(), inventory, transport, cache, bus, collector,
                    monitor::SchedulerConfig{std::chrono::milliseconds(100), 3}) {
        collector.setBreachListener(
            [this](const core::MetricBreach& breach) { throttler.onMetricBreach(breach); });
    }

    ~MonitoringStack() {
        scheduler.stop();
        throttler.stop();
        pool.stop();
    }

    MonitoringStack(const MonitoringStack&) = delete;
    MonitoringStack& operator=(const MonitoringStack&) = delete;

    void start() {
        pool.start();
        throttler.attach(bus);
        scheduler.start();
    }

    core::NodeStatus status(int64_t nodeId) const {
        auto record = cache.snapshot(nodeId);
        return record ? record->status : core::NodeStatus::Waiting;
    }

    monitor::Inventory inventory;
    FakeProbeTransport transport;
    monitor::StatusCache cache;
    monitor::TraceBus bus;
    RecordingNotifier notifier;
    monitor::AlertThrottler throttler;
    monitor::MetricCollector collector;
    infra::AsioContext pool;
    monitor::Scheduler scheduler;
};

} // namespace beamstate::test
