/**
 * @file Scheduler.hpp
 * @brief Per-node reachability and metric loops on a shared Asio pool.
 */

#pragma once

#include "core/services/IConfigSource.hpp"
#include "core/services/IProbeTransport.hpp"
#include "monitor/MetricCollector.hpp"
#include "monitor/ProbeCalls.hpp"
#include "monitor/StatusCache.hpp"
#include "monitor/StatusEngine.hpp"
#include "monitor/TraceBus.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

namespace beamstate::monitor {

struct SchedulerConfig {
    std::chrono::milliseconds probeTimeout{5000}; ///< Bound for every single probe
    int maxRetries{StatusEngine::DEFAULT_MAX_RETRIES};
};

/**
 * @brief Drives one reachability loop and one metric loop per enabled node.
 *
 * Every loop owns a strand and a steady_timer on that strand, so a node's
 * checks are strictly ordered while different nodes never wait on each other.
 * Loops tick at a fixed rate against their own schedule; a tick that finds
 * the previous check still running is skipped. While a node is PENDING its
 * loop ticks at retryInterval() instead of the full interval.
 *
 * Configuration is re-read on every tick and on every change notification.
 * Disabling a node or its group pauses it at once and tears its loops down;
 * re-enabling resumes it and checks immediately. An interval change replaces
 * the loop instead of adjusting it.
 *
 * @note The io_context must be stopped before the scheduler is destroyed.
 */
class Scheduler {
public:
    Scheduler(asio::io_context& io, core::IConfigSource& config,
              core::IProbeTransport& transport, StatusCache& cache, TraceBus& bus,
              MetricCollector& collector, SchedulerConfig settings = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Subscribes to configuration changes and creates loops for all nodes.
     */
    void start();

    /**
     * @brief Unsubscribes and tears every loop down. In-flight results are discarded.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /**
     * @brief Reconciles all loops against the current configuration.
     */
    void syncAll();

    /**
     * @brief Runs a reachability check for nodeId now, leaving its schedule as is.
     * @return False if the node has no active loop.
     */
    bool triggerImmediateCheck(int64_t nodeId);

    [[nodiscard]] bool isScheduled(int64_t nodeId) const;
    [[nodiscard]] bool hasMetricLoop(int64_t nodeId) const;
    [[nodiscard]] size_t loopCount() const;

    /**
     * @brief Interval of the node's active loop in seconds.
     */
    [[nodiscard]] std::optional<int> scheduledInterval(int64_t nodeId) const;

    [[nodiscard]] const StatusEngine& engine() const { return engine_; }

    /**
     * @brief Gap between checks of a PENDING node: a third of its interval.
     */
    static std::chrono::milliseconds retryInterval(int intervalSeconds);

private:
    struct NodeLoop {
        NodeLoop(asio::io_context& io, int64_t id, int interval)
            : nodeId(id), intervalSeconds(interval), strand(asio::make_strand(io)),
              timer(strand) {}

        int64_t nodeId;
        int intervalSeconds;
        Strand strand;
        asio::steady_timer timer;
        std::atomic<bool> active{true};
        bool checkInFlight{false}; ///< Strand only
        std::chrono::steady_clock::time_point nextDue;
    };

    struct MetricLoop {
        MetricLoop(asio::io_context& io, int64_t id)
            : nodeId(id), strand(asio::make_strand(io)), timer(strand) {}

        int64_t nodeId;
        Strand strand;
        asio::steady_timer timer;
        std::atomic<bool> active{true};
        std::map<int64_t, std::chrono::steady_clock::time_point> due; ///< Strand only
        std::set<int64_t> inFlight;                                   ///< Strand only
    };

    /// Why a reconciliation happens; picks the pause/resume reason.
    enum class Cause { Sync, NodeChange, GroupChange, Tick };

    void onConfigChange(const core::ConfigChange& change);
    void reconcileNode(int64_t nodeId, Cause cause);
    void reconcileMetrics(const core::NodeContext& context);
    void removeNode(int64_t nodeId);

    void pauseNode(const core::NodeContext& context);
    bool resumeNode(const core::NodeContext& context, Cause cause);

    void ensureNodeLoop(const core::NodeContext& context, bool checkNow);
    void teardownNodeLoop(int64_t nodeId);
    void teardownMetricLoop(int64_t nodeId);
    std::shared_ptr<NodeLoop> findLoop(int64_t nodeId) const;

    void armTimer(const std::shared_ptr<NodeLoop>& loop);
    void scheduleNext(const std::shared_ptr<NodeLoop>& loop);
    void runTick(const std::shared_ptr<NodeLoop>& loop);
    void runCheck(const std::shared_ptr<NodeLoop>& loop, const core::NodeContext& context,
                  bool reschedule);

    void runMetricTick(const std::shared_ptr<MetricLoop>& loop);

    void publish(const core::NodeContext& context, const Transition& transition,
                 std::chrono::system_clock::time_point timestamp);

    asio::io_context& io_;
    core::IConfigSource& config_;
    core::IProbeTransport& transport_;
    StatusCache& cache_;
    TraceBus& bus_;
    MetricCollector& collector_;
    SchedulerConfig settings_;
    StatusEngine engine_;

    std::atomic<bool> running_{false};
    std::optional<int> subscriptionId_;

    std::mutex reconcileMutex_; ///< Serializes reconciliation; taken before mutex_
    mutable std::mutex mutex_;  ///< Guards the loop maps; never held while calling config_
    std::map<int64_t, std::shared_ptr<NodeLoop>> loops_;
    std::map<int64_t, std::shared_ptr<MetricLoop>> metricLoops_;
};

} // namespace beamstate::monitor
