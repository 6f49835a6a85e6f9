#include "monitor/AlertThrottler.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace beamstate::monitor {

namespace {

constexpr auto WORKER_POLL = std::chrono::milliseconds(200);

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace

AlertThrottler::AlertThrottler(core::INotifier& notifier, ThrottlerConfig config,
                               PriorityLookup priorityLookup)
    : notifier_(notifier), priorityLookup_(std::move(priorityLookup)), config_(config) {
    config_.stormThreshold = std::max(1, config_.stormThreshold);
}

AlertThrottler::~AlertThrottler() {
    stop();
}

void AlertThrottler::attach(TraceBus& bus) {
    if (running_.exchange(true)) {
        return;
    }

    // Every DOWN must reach the storm window, so the throttler is never dropped
    auto subscription = bus.subscribeLossless();
    {
        std::lock_guard lock(mutex_);
        subscription_ = subscription;
    }

    worker_ = std::thread([this, &bus, subscription]() {
        spdlog::debug("Alert throttler attached to trace bus");
        while (running_) {
            if (auto event = subscription->next(WORKER_POLL)) {
                handleEvent(*event);
                continue;
            }
            tick(std::chrono::system_clock::now());
        }

        if (subscription->pending() > 0) {
            spdlog::warn("Alert throttler stopped with {} unprocessed transitions",
                         subscription->pending());
        }
        bus.unsubscribe(subscription);
    });
}

void AlertThrottler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (subscription_) {
            subscription_->close();
        }
    }
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::debug("Alert throttler stopped");
}

void AlertThrottler::handleEvent(const core::TraceEvent& event) {
    const bool down = event.isDownTransition();
    const bool recovery = event.isRecovery();
    if (!down && !recovery) {
        return;
    }

    const int priority = nodePriority(event.nodeId);
    std::vector<Outgoing> outgoing;
    {
        std::lock_guard lock(mutex_);
        prune(event.timestamp);

        if (down) {
            window_.push_back({event.timestamp, event.nodeId, event.nodeName});
        }
        evaluateStormExit(event.timestamp);

        core::AlertDecision decision;
        decision.timestamp = event.timestamp;
        decision.nodeId = event.nodeId;
        decision.priority = priority;

        if (down) {
            decision.kind = core::AlertKind::NodeDown;
            decision.title = fmt::format("{} is DOWN", event.nodeName);
            decision.message = fmt::format("{} ({}) in {} is DOWN: {}", event.nodeName,
                                           event.nodeIp, event.groupName, event.reason);
        } else {
            decision.kind = core::AlertKind::NodeRecovered;
            decision.title = fmt::format("{} is UP", event.nodeName);
            decision.message = fmt::format("{} ({}) in {} is UP again: {}", event.nodeName,
                                           event.nodeIp, event.groupName, event.reason);
        }

        const bool onset = down && !inStorm_ &&
                           window_.size() >= static_cast<size_t>(config_.stormThreshold);
        if (onset) {
            inStorm_ = true;
            belowSince_.reset();

            std::vector<std::string> names;
            std::set<int64_t> seen;
            for (const auto& entry : window_) {
                if (seen.insert(entry.nodeId).second) {
                    names.push_back(entry.nodeName);
                }
            }

            spdlog::warn("Alert storm: {} nodes down within {}s, suppressing individual alerts",
                         window_.size(), config_.window.count());

            decision.outcome = core::DecisionOutcome::SuppressedStorm;
            record(decision, outgoing);

            core::AlertDecision aggregate;
            aggregate.timestamp = event.timestamp;
            aggregate.kind = core::AlertKind::GlobalStorm;
            aggregate.priority = core::clampPriority(config_.stormPriority);
            aggregate.title = "Global Alert";
            aggregate.message =
                fmt::format("{} nodes went DOWN within {}s: {}", names.size(),
                            config_.window.count(), fmt::join(names, ", "));
            record(std::move(aggregate), outgoing);
        } else if (inStorm_) {
            decision.outcome = core::DecisionOutcome::SuppressedStorm;
            record(std::move(decision), outgoing);
        } else {
            record(std::move(decision), outgoing);
        }
    }

    deliver(outgoing);
}

void AlertThrottler::onMetricBreach(const core::MetricBreach& breach) {
    std::vector<Outgoing> outgoing;
    {
        std::lock_guard lock(mutex_);

        core::AlertDecision decision;
        decision.timestamp = breach.timestamp;
        decision.kind = core::AlertKind::MetricBreach;
        decision.nodeId = breach.key.nodeId;

        switch (breach.current) {
        case core::ThresholdLevel::Critical:
            decision.priority = core::clampPriority(std::max(
                breach.nodePriority.value_or(config_.defaultPriority), 1));
            break;
        case core::ThresholdLevel::Warning:
            decision.priority =
                core::clampPriority(breach.nodePriority.value_or(config_.defaultPriority));
            break;
        case core::ThresholdLevel::Normal:
            decision.priority = 0;
            break;
        }

        const auto subject = breach.interfaceName.empty()
                                 ? breach.metricName
                                 : fmt::format("{} ({})", breach.metricName, breach.interfaceName);
        const auto level = breach.current == core::ThresholdLevel::Normal
                               ? std::string("RESOLVED")
                               : upper(core::levelToString(breach.current));
        decision.title = fmt::format("BeamState {}: {} - {}", level, breach.nodeName, subject);
        if (breach.current != core::ThresholdLevel::Normal && breach.threshold) {
            decision.message = fmt::format("{} on {} is {:.2f} {} (threshold {:.2f})", subject,
                                           breach.nodeName, breach.value, breach.unit,
                                           *breach.threshold);
        } else {
            decision.message = fmt::format("{} on {} is back to normal at {:.2f} {}", subject,
                                           breach.nodeName, breach.value, breach.unit);
        }

        auto last = lastMetricAlert_.find(breach.key);
        if (last != lastMetricAlert_.end() &&
            breach.timestamp - last->second < config_.metricCooldown) {
            decision.outcome = core::DecisionOutcome::SuppressedCooldown;
        } else if (!maintenance_) {
            lastMetricAlert_[breach.key] = breach.timestamp;
        }
        record(std::move(decision), outgoing);
    }

    deliver(outgoing);
}

void AlertThrottler::tick(std::chrono::system_clock::time_point now) {
    std::lock_guard lock(mutex_);
    prune(now);
    evaluateStormExit(now);
}

void AlertThrottler::setMaintenanceMode(bool enabled) {
    std::lock_guard lock(mutex_);
    if (maintenance_ != enabled) {
        maintenance_ = enabled;
        spdlog::info("Maintenance mode {}", enabled ? "enabled" : "disabled");
    }
}

bool AlertThrottler::maintenanceMode() const {
    std::lock_guard lock(mutex_);
    return maintenance_;
}

bool AlertThrottler::inStorm() const {
    std::lock_guard lock(mutex_);
    return inStorm_;
}

size_t AlertThrottler::windowCount() const {
    std::lock_guard lock(mutex_);
    return window_.size();
}

std::vector<core::AlertDecision> AlertThrottler::recentDecisions(size_t limit) const {
    std::lock_guard lock(mutex_);
    const size_t count = std::min(limit, decisions_.size());
    return {decisions_.end() - static_cast<std::ptrdiff_t>(count), decisions_.end()};
}

void AlertThrottler::updateConfig(const ThrottlerConfig& config) {
    std::lock_guard lock(mutex_);
    config_ = config;
    config_.stormThreshold = std::max(1, config_.stormThreshold);
    while (decisions_.size() > config_.decisionLogSize) {
        decisions_.pop_front();
    }
}

ThrottlerConfig AlertThrottler::config() const {
    std::lock_guard lock(mutex_);
    return config_;
}

void AlertThrottler::prune(std::chrono::system_clock::time_point now) {
    // Window is the half-open interval (now - window, now]
    while (!window_.empty() && window_.front().timestamp <= now - config_.window) {
        window_.pop_front();
    }
}

void AlertThrottler::evaluateStormExit(std::chrono::system_clock::time_point now) {
    if (!inStorm_) {
        return;
    }
    if (window_.size() >= static_cast<size_t>(config_.stormThreshold)) {
        belowSince_.reset();
        return;
    }
    if (!belowSince_) {
        belowSince_ = now;
    }
    if (now - *belowSince_ >= config_.stormCooldown) {
        inStorm_ = false;
        belowSince_.reset();
        spdlog::info("Alert storm over, individual alerts resumed");
    }
}

int AlertThrottler::nodePriority(int64_t nodeId) const {
    std::optional<int> override;
    if (priorityLookup_) {
        override = priorityLookup_(nodeId);
    }
    if (override) {
        return core::clampPriority(*override);
    }
    std::lock_guard lock(mutex_);
    return core::clampPriority(config_.defaultPriority);
}

void AlertThrottler::record(core::AlertDecision decision, std::vector<Outgoing>& outgoing) {
    if (decision.outcome == core::DecisionOutcome::Sent) {
        if (maintenance_) {
            decision.outcome = core::DecisionOutcome::SuppressedMaintenance;
        } else {
            outgoing.push_back({decision.priority, decision.title, decision.message});
        }
    }

    spdlog::debug("Alert decision: {} '{}' -> {}", decision.kindToString(), decision.title,
                  decision.outcomeToString());

    decisions_.push_back(std::move(decision));
    while (decisions_.size() > config_.decisionLogSize) {
        decisions_.pop_front();
    }
}

void AlertThrottler::deliver(const std::vector<Outgoing>& outgoing) {
    for (const auto& alert : outgoing) {
        try {
            notifier_.notify(alert.priority, alert.title, alert.message);
        } catch (const std::exception& e) {
            spdlog::error("Failed to deliver alert '{}': {}", alert.title, e.what());
        }
    }
}

} // namespace beamstate::monitor
