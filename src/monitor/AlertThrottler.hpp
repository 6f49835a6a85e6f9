/**
 * @file AlertThrottler.hpp
 * @brief Notification policy: individual alerts, storm aggregation, maintenance mode.
 */

#pragma once

#include "core/services/INotifier.hpp"
#include "core/types/AlertDecision.hpp"
#include "core/types/MetricSample.hpp"
#include "core/types/TraceEvent.hpp"
#include "monitor/TraceBus.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace beamstate::monitor {

struct ThrottlerConfig {
    int stormThreshold{5};                    ///< DOWN transitions inside the window that start a storm
    std::chrono::seconds window{60};
    std::chrono::seconds stormCooldown{60};   ///< Time below threshold before a storm ends
    int defaultPriority{0};
    int stormPriority{1};
    std::chrono::seconds metricCooldown{60};  ///< Minimum gap between alerts of one metric series
    size_t decisionLogSize{200};
};

/**
 * @brief Decides for every alert-worthy transition whether to notify.
 *
 * DOWN transitions are counted in a sliding window across all nodes. When the
 * count reaches the storm threshold the throttler sends one "Global Alert"
 * and suppresses individual DOWN and recovery alerts until the count has
 * stayed below the threshold for the storm cooldown.
 *
 * All window and storm state is serialized by one mutex; the notifier is
 * always called outside of it.
 */
class AlertThrottler {
public:
    /// Returns a node's priority override, if it has one.
    using PriorityLookup = std::function<std::optional<int>(int64_t nodeId)>;

    AlertThrottler(core::INotifier& notifier, ThrottlerConfig config = {},
                   PriorityLookup priorityLookup = {});
    ~AlertThrottler();

    AlertThrottler(const AlertThrottler&) = delete;
    AlertThrottler& operator=(const AlertThrottler&) = delete;

    /**
     * @brief Starts consuming bus on a worker thread.
     *
     * The worker also calls tick() while idle so a storm can end without new events.
     */
    void attach(TraceBus& bus);

    /**
     * @brief Stops the worker thread started by attach().
     */
    void stop();

    /**
     * @brief Applies the policy to one trace event.
     *
     * Only transitions into DOWN and DOWN to UP are considered; everything
     * else is ignored.
     */
    void handleEvent(const core::TraceEvent& event);

    /**
     * @brief Applies the policy to a metric level change.
     */
    void onMetricBreach(const core::MetricBreach& breach);

    /**
     * @brief Re-evaluates the window at now; ends the storm once its cooldown has passed.
     */
    void tick(std::chrono::system_clock::time_point now);

    void setMaintenanceMode(bool enabled);
    [[nodiscard]] bool maintenanceMode() const;

    [[nodiscard]] bool inStorm() const;

    /**
     * @brief Number of DOWN transitions in the window ending at the latest observed time.
     */
    [[nodiscard]] size_t windowCount() const;

    /**
     * @brief Returns up to limit most recent decisions, oldest first.
     */
    [[nodiscard]] std::vector<core::AlertDecision> recentDecisions(size_t limit = 50) const;

    void updateConfig(const ThrottlerConfig& config);
    [[nodiscard]] ThrottlerConfig config() const;

private:
    struct WindowEntry {
        std::chrono::system_clock::time_point timestamp;
        int64_t nodeId;
        std::string nodeName;
    };

    struct Outgoing {
        int priority;
        std::string title;
        std::string message;
    };

    void prune(std::chrono::system_clock::time_point now);
    void evaluateStormExit(std::chrono::system_clock::time_point now);
    int nodePriority(int64_t nodeId) const;
    void record(core::AlertDecision decision, std::vector<Outgoing>& outgoing);
    void deliver(const std::vector<Outgoing>& outgoing);

    core::INotifier& notifier_;
    PriorityLookup priorityLookup_;

    mutable std::mutex mutex_;
    ThrottlerConfig config_;
    std::deque<WindowEntry> window_;
    bool inStorm_{false};
    std::optional<std::chrono::system_clock::time_point> belowSince_;
    bool maintenance_{false};
    std::map<core::MetricKey, std::chrono::system_clock::time_point> lastMetricAlert_;
    std::deque<core::AlertDecision> decisions_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::shared_ptr<TraceSubscription> subscription_;
};

} // namespace beamstate::monitor
