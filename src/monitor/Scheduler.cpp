#include "monitor/Scheduler.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <vector>

namespace beamstate::monitor {

namespace {

using Clock = std::chrono::steady_clock;

struct CheckState {
    int pending{0};
    std::optional<core::PingResult> ping;
    std::optional<core::SnmpResult> snmp;
};

CheckOutcome aggregate(const CheckState& state) {
    CheckOutcome outcome;
    outcome.timestamp = std::chrono::system_clock::now();

    std::vector<double> latencies;
    std::vector<std::string> failures;
    bool allTimeouts = true;

    if (state.ping) {
        outcome.packetLoss = state.ping->packetLossPercent;
        if (state.ping->success()) {
            if (state.ping->latencyMs) {
                latencies.push_back(*state.ping->latencyMs);
            }
        } else {
            failures.push_back(fmt::format("ping {}", core::outcomeToString(state.ping->outcome)));
            allTimeouts = allTimeouts && state.ping->outcome == core::PingOutcome::Timeout;
        }
    }

    if (state.snmp) {
        if (state.snmp->success()) {
            if (state.snmp->latencyMs) {
                latencies.push_back(*state.snmp->latencyMs);
            }
        } else {
            failures.push_back(fmt::format("snmp {}", core::outcomeToString(state.snmp->outcome)));
            allTimeouts = allTimeouts && state.snmp->outcome == core::SnmpOutcome::Timeout;
        }
    }

    outcome.success = failures.empty();
    outcome.timedOut = !failures.empty() && allTimeouts;
    if (!latencies.empty()) {
        outcome.latencyMs =
            std::accumulate(latencies.begin(), latencies.end(), 0.0) / latencies.size();
    }
    outcome.detail = fmt::format("{}", fmt::join(failures, ", "));
    return outcome;
}

std::string pauseReason(const core::NodeContext& context) {
    if (!context.effective.nodeEnabled) {
        return "paused by user";
    }
    return fmt::format("group '{}' disabled", context.effective.groupName);
}

} // namespace

Scheduler::Scheduler(asio::io_context& io, core::IConfigSource& config,
                     core::IProbeTransport& transport, StatusCache& cache, TraceBus& bus,
                     MetricCollector& collector, SchedulerConfig settings)
    : io_(io), config_(config), transport_(transport), cache_(cache), bus_(bus),
      collector_(collector), settings_(settings), engine_(settings.maxRetries) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    subscriptionId_ =
        config_.subscribe([this](const core::ConfigChange& change) { onConfigChange(change); });
    syncAll();

    spdlog::info("Scheduler started with {} node loops (timeout {}ms, max retries {})",
                 loopCount(), settings_.probeTimeout.count(), engine_.maxRetries());
}

void Scheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (subscriptionId_) {
        config_.unsubscribe(*subscriptionId_);
        subscriptionId_.reset();
    }

    std::lock_guard reconcileLock(reconcileMutex_);
    std::lock_guard lock(mutex_);
    for (auto& [id, loop] : loops_) {
        loop->active = false;
        asio::post(loop->strand, [loop]() { loop->timer.cancel(); });
    }
    for (auto& [id, loop] : metricLoops_) {
        loop->active = false;
        asio::post(loop->strand, [loop]() { loop->timer.cancel(); });
    }
    loops_.clear();
    metricLoops_.clear();

    spdlog::info("Scheduler stopped");
}

void Scheduler::syncAll() {
    if (!running_) {
        return;
    }

    const auto nodes = config_.nodes();
    std::set<int64_t> known;
    for (const auto& node : nodes) {
        known.insert(node.id);
        reconcileNode(node.id, Cause::Sync);
    }

    std::vector<int64_t> stale;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, loop] : loops_) {
            if (!known.count(id)) {
                stale.push_back(id);
            }
        }
        for (const auto& [id, loop] : metricLoops_) {
            if (!known.count(id)) {
                stale.push_back(id);
            }
        }
    }
    for (auto id : stale) {
        removeNode(id);
    }
}

bool Scheduler::triggerImmediateCheck(int64_t nodeId) {
    auto loop = findLoop(nodeId);
    if (!loop) {
        return false;
    }

    asio::post(loop->strand, [this, loop]() {
        if (!loop->active) {
            return;
        }
        if (loop->checkInFlight) {
            spdlog::debug("Immediate check for node {} skipped, check already running",
                          loop->nodeId);
            return;
        }
        auto context = config_.nodeContext(loop->nodeId);
        if (!context || !context->effective.enabled() || !context->effective.anyProtocol()) {
            return;
        }
        runCheck(loop, *context, false);
    });
    return true;
}

bool Scheduler::isScheduled(int64_t nodeId) const {
    return findLoop(nodeId) != nullptr;
}

bool Scheduler::hasMetricLoop(int64_t nodeId) const {
    std::lock_guard lock(mutex_);
    return metricLoops_.count(nodeId) > 0;
}

size_t Scheduler::loopCount() const {
    std::lock_guard lock(mutex_);
    return loops_.size();
}

std::optional<int> Scheduler::scheduledInterval(int64_t nodeId) const {
    auto loop = findLoop(nodeId);
    if (!loop) {
        return std::nullopt;
    }
    return loop->intervalSeconds;
}

void Scheduler::onConfigChange(const core::ConfigChange& change) {
    if (!running_) {
        return;
    }

    switch (change.kind) {
    case core::ConfigChangeKind::NodeChanged:
        reconcileNode(change.id, Cause::NodeChange);
        break;
    case core::ConfigChangeKind::NodeRemoved:
        removeNode(change.id);
        break;
    case core::ConfigChangeKind::GroupChanged:
        for (const auto& node : config_.nodes()) {
            if (node.groupId == change.id) {
                reconcileNode(node.id, Cause::GroupChange);
            }
        }
        break;
    case core::ConfigChangeKind::GroupRemoved:
        // A group can only be removed once it has no nodes
        break;
    case core::ConfigChangeKind::MetricsChanged:
        if (change.id == 0) {
            for (const auto& node : config_.nodes()) {
                if (auto context = config_.nodeContext(node.id)) {
                    std::lock_guard reconcileLock(reconcileMutex_);
                    reconcileMetrics(*context);
                }
            }
        } else if (auto context = config_.nodeContext(change.id)) {
            std::lock_guard reconcileLock(reconcileMutex_);
            reconcileMetrics(*context);
        }
        break;
    }
}

void Scheduler::reconcileNode(int64_t nodeId, Cause cause) {
    auto context = config_.nodeContext(nodeId);
    if (!context) {
        removeNode(nodeId);
        return;
    }

    std::lock_guard reconcileLock(reconcileMutex_);
    if (!running_) {
        return;
    }

    if (!context->effective.enabled()) {
        pauseNode(*context);
        teardownNodeLoop(nodeId);
        teardownMetricLoop(nodeId);
        return;
    }

    const bool resumed = resumeNode(*context, cause);
    ensureNodeLoop(*context, resumed);
    reconcileMetrics(*context);
}

void Scheduler::reconcileMetrics(const core::NodeContext& context) {
    const auto nodeId = context.node.id;
    if (!running_) {
        return;
    }

    const auto bindings = config_.metricBindings(nodeId);
    const bool anyEnabled = std::any_of(bindings.begin(), bindings.end(),
                                        [](const auto& binding) { return binding.config.enabled; });

    if (!context.effective.enabled() || !anyEnabled) {
        teardownMetricLoop(nodeId);
        return;
    }

    std::shared_ptr<MetricLoop> loop;
    {
        std::lock_guard lock(mutex_);
        auto& slot = metricLoops_[nodeId];
        if (!slot) {
            slot = std::make_shared<MetricLoop>(io_, nodeId);
            spdlog::debug("Created metric loop for node {}", nodeId);
        }
        loop = slot;
    }

    // Picks up added bindings right away; the tick re-arms the timer
    asio::post(loop->strand, [this, loop]() { runMetricTick(loop); });
}

void Scheduler::removeNode(int64_t nodeId) {
    {
        std::lock_guard reconcileLock(reconcileMutex_);
        teardownNodeLoop(nodeId);
        teardownMetricLoop(nodeId);
    }
    cache_.remove(nodeId);
    spdlog::debug("Node {} removed from scheduling", nodeId);
}

void Scheduler::pauseNode(const core::NodeContext& context) {
    const auto reason = pauseReason(context);
    auto transition = cache_.update(context.node.id, [&](core::StatusRecord& record) {
        return engine_.applyPause(record, reason);
    });
    if (transition) {
        publish(context, *transition, std::chrono::system_clock::now());
    }
}

bool Scheduler::resumeNode(const core::NodeContext& context, Cause cause) {
    const auto reason = cause == Cause::GroupChange
                            ? fmt::format("group '{}' enabled", context.effective.groupName)
                            : std::string("resumed by user");
    auto transition = cache_.update(context.node.id, [&](core::StatusRecord& record) {
        return engine_.applyResume(record, reason);
    });
    if (!transition) {
        return false;
    }
    publish(context, *transition, std::chrono::system_clock::now());
    return true;
}

void Scheduler::ensureNodeLoop(const core::NodeContext& context, bool checkNow) {
    const auto nodeId = context.node.id;
    const int interval = context.effective.intervalSeconds;

    std::shared_ptr<NodeLoop> loop;
    bool fresh = true;
    {
        std::lock_guard lock(mutex_);
        auto it = loops_.find(nodeId);
        if (it != loops_.end()) {
            if (it->second->intervalSeconds == interval) {
                if (!checkNow) {
                    return;
                }
                loop = it->second;
            } else {
                spdlog::info("Interval of {} changed {}s -> {}s, recreating loop",
                             context.node.name, it->second->intervalSeconds, interval);
                it->second->active = false;
                auto old = it->second;
                asio::post(old->strand, [old]() { old->timer.cancel(); });
                loops_.erase(it);
                fresh = false;
            }
        }

        if (!loop) {
            loop = std::make_shared<NodeLoop>(io_, nodeId, interval);
            const auto now = Clock::now();
            loop->nextDue = fresh || checkNow ? now : now + std::chrono::seconds(interval);
            loops_[nodeId] = loop;
            armTimer(loop);
            spdlog::debug("Created loop for {} every {}s", context.node.name, interval);
            return;
        }
    }

    triggerImmediateCheck(nodeId);
}

void Scheduler::teardownNodeLoop(int64_t nodeId) {
    std::lock_guard lock(mutex_);
    auto it = loops_.find(nodeId);
    if (it == loops_.end()) {
        return;
    }
    auto loop = it->second;
    loop->active = false;
    asio::post(loop->strand, [loop]() { loop->timer.cancel(); });
    loops_.erase(it);
    spdlog::debug("Stopped loop for node {}", nodeId);
}

void Scheduler::teardownMetricLoop(int64_t nodeId) {
    std::lock_guard lock(mutex_);
    auto it = metricLoops_.find(nodeId);
    if (it == metricLoops_.end()) {
        return;
    }
    auto loop = it->second;
    loop->active = false;
    asio::post(loop->strand, [loop]() { loop->timer.cancel(); });
    metricLoops_.erase(it);
    spdlog::debug("Stopped metric loop for node {}", nodeId);
}

std::shared_ptr<Scheduler::NodeLoop> Scheduler::findLoop(int64_t nodeId) const {
    std::lock_guard lock(mutex_);
    auto it = loops_.find(nodeId);
    return it != loops_.end() ? it->second : nullptr;
}

std::chrono::milliseconds Scheduler::retryInterval(int intervalSeconds) {
    return std::chrono::milliseconds(std::max(1, intervalSeconds) * 1000 / 3);
}

void Scheduler::armTimer(const std::shared_ptr<NodeLoop>& loop) {
    asio::post(loop->strand, [this, loop]() {
        if (!loop->active) {
            return;
        }
        loop->timer.expires_at(loop->nextDue);
        loop->timer.async_wait([this, loop](const asio::error_code& ec) {
            if (ec || !loop->active) {
                return;
            }
            runTick(loop);
        });
    });
}

void Scheduler::scheduleNext(const std::shared_ptr<NodeLoop>& loop) {
    // A PENDING node is retried at a third of its interval so DOWN is confirmed sooner
    const auto record = cache_.snapshot(loop->nodeId);
    const bool retrying = record && record->status == core::NodeStatus::Pending;
    const std::chrono::milliseconds interval =
        retrying ? retryInterval(loop->intervalSeconds)
                 : std::chrono::seconds(loop->intervalSeconds);
    const auto now = Clock::now();

    loop->nextDue += interval;
    if (loop->nextDue <= now) {
        // Missed ticks are skipped, not replayed
        const auto behind = (now - loop->nextDue) / interval + 1;
        loop->nextDue += interval * behind;
    }
    armTimer(loop);
}

void Scheduler::runTick(const std::shared_ptr<NodeLoop>& loop) {
    auto context = config_.nodeContext(loop->nodeId);
    if (!context || !context->effective.enabled() ||
        context->effective.intervalSeconds != loop->intervalSeconds) {
        reconcileNode(loop->nodeId, Cause::Tick);
        return;
    }

    if (loop->checkInFlight) {
        spdlog::debug("Check for {} still running, skipping tick", context->node.name);
        scheduleNext(loop);
        return;
    }

    if (!context->effective.anyProtocol()) {
        spdlog::debug("No protocol enabled for {}, skipping check", context->node.name);
        scheduleNext(loop);
        return;
    }

    runCheck(loop, *context, true);
}

void Scheduler::runCheck(const std::shared_ptr<NodeLoop>& loop, const core::NodeContext& context,
                         bool reschedule) {
    loop->checkInFlight = true;

    auto state = std::make_shared<CheckState>();
    state->pending = (context.effective.monitorPing ? 1 : 0) +
                     (context.effective.monitorSnmp ? 1 : 0);

    auto finish = [this, loop, context, state, reschedule]() {
        if (--state->pending > 0) {
            return;
        }
        loop->checkInFlight = false;
        if (!loop->active) {
            spdlog::debug("Discarding result for stopped loop of {}", context.node.name);
            return;
        }

        const auto outcome = aggregate(*state);
        auto transition = cache_.update(context.node.id, [&](core::StatusRecord& record) {
            return engine_.applyResult(record, outcome);
        });
        if (transition) {
            publish(context, *transition, outcome.timestamp);
        }
        if (reschedule) {
            scheduleNext(loop);
        }
    };

    if (context.effective.monitorPing) {
        pingWithDeadline(loop->strand, transport_, context.node.ip, settings_.probeTimeout,
                         context.effective.packetCount,
                         [state, finish](const core::PingResult& result) {
                             state->ping = result;
                             finish();
                         });
    }

    if (context.effective.monitorSnmp) {
        core::SnmpGetRequest request;
        request.ip = context.node.ip;
        request.port = context.effective.snmpPort;
        request.community = context.effective.snmpCommunity;
        request.oid = SNMP_CHECK_OID;
        request.timeout = settings_.probeTimeout;
        snmpGetWithDeadline(loop->strand, transport_, request,
                            [state, finish](const core::SnmpResult& result) {
                                state->snmp = result;
                                finish();
                            });
    }
}

void Scheduler::runMetricTick(const std::shared_ptr<MetricLoop>& loop) {
    if (!loop->active) {
        return;
    }

    auto context = config_.nodeContext(loop->nodeId);
    if (!context || !context->effective.enabled()) {
        std::lock_guard reconcileLock(reconcileMutex_);
        teardownMetricLoop(loop->nodeId);
        return;
    }

    const auto now = Clock::now();
    std::set<int64_t> live;
    for (const auto& binding : config_.metricBindings(loop->nodeId)) {
        if (!binding.config.enabled) {
            continue;
        }
        const auto id = binding.config.id;
        live.insert(id);

        auto [it, inserted] = loop->due.try_emplace(id, now);
        if (it->second > now || loop->inFlight.count(id)) {
            continue;
        }

        const auto interval = std::chrono::seconds(
            binding.config.intervalSeconds.value_or(context->effective.intervalSeconds));
        while (it->second <= now) {
            it->second += interval;
        }

        loop->inFlight.insert(id);
        collector_.collectAsync(loop->strand, *context, binding,
                                [loop, id]() { loop->inFlight.erase(id); });
    }

    for (auto it = loop->due.begin(); it != loop->due.end();) {
        it = live.count(it->first) ? std::next(it) : loop->due.erase(it);
    }

    if (loop->due.empty()) {
        std::lock_guard reconcileLock(reconcileMutex_);
        teardownMetricLoop(loop->nodeId);
        return;
    }

    auto earliest = std::min_element(loop->due.begin(), loop->due.end(),
                                     [](const auto& a, const auto& b) { return a.second < b.second; });
    loop->timer.expires_at(earliest->second);
    loop->timer.async_wait([this, loop](const asio::error_code& ec) {
        if (ec || !loop->active) {
            return;
        }
        runMetricTick(loop);
    });
}

void Scheduler::publish(const core::NodeContext& context, const Transition& transition,
                        std::chrono::system_clock::time_point timestamp) {
    core::TraceEvent event;
    event.timestamp = timestamp;
    event.nodeId = context.node.id;
    event.nodeName = context.node.name;
    event.nodeIp = context.node.ip;
    event.groupName = context.effective.groupName;
    event.oldStatus = transition.from;
    event.newStatus = transition.to;
    event.reason = transition.reason;
    bus_.publish(std::move(event));

    if (transition.to == core::NodeStatus::Down) {
        spdlog::warn("{} ({}) {} -> {}: {}", context.node.name, context.node.ip,
                     core::statusToString(transition.from), core::statusToString(transition.to),
                     transition.reason);
    } else {
        spdlog::info("{} ({}) {} -> {}: {}", context.node.name, context.node.ip,
                     core::statusToString(transition.from), core::statusToString(transition.to),
                     transition.reason);
    }
}

} // namespace beamstate::monitor
