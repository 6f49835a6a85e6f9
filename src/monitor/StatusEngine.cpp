#include "monitor/StatusEngine.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace beamstate::monitor {

using core::NodeStatus;

StatusEngine::StatusEngine(int maxRetries) : maxRetries_(std::max(1, maxRetries)) {}

std::optional<Transition> StatusEngine::applyResult(core::StatusRecord& record,
                                                    const CheckOutcome& outcome) const {
    if (record.status == NodeStatus::Paused) {
        spdlog::debug("Discarding check result for paused node");
        return std::nullopt;
    }

    const auto previous = record.status;
    record.lastCheck = outcome.timestamp;
    record.lastPacketLoss = outcome.packetLoss;

    if (outcome.success) {
        const int failedBefore = record.consecutiveFailures;
        record.consecutiveFailures = 0;
        record.failureStreakAllTimeouts = true;
        record.lastLatencyMs = outcome.latencyMs;
        record.status = NodeStatus::Up;

        switch (previous) {
        case NodeStatus::Up:
            return std::nullopt;
        case NodeStatus::Waiting:
            return Transition{previous, NodeStatus::Up, "initial check succeeded"};
        case NodeStatus::Down:
            return Transition{previous, NodeStatus::Up, "responded after outage"};
        default:
            return Transition{previous, NodeStatus::Up,
                              fmt::format("recovered after {} failed check{}", failedBefore,
                                          failedBefore == 1 ? "" : "s")};
        }
    }

    record.failureStreakAllTimeouts =
        (record.consecutiveFailures == 0 ? true : record.failureStreakAllTimeouts) &&
        outcome.timedOut;
    ++record.consecutiveFailures;
    record.lastLatencyMs.reset();

    if (previous == NodeStatus::Down) {
        return std::nullopt;
    }

    if (record.consecutiveFailures >= maxRetries_) {
        record.status = NodeStatus::Down;
        return Transition{previous, NodeStatus::Down,
                          fmt::format("{} consecutive {}", record.consecutiveFailures,
                                      record.failureStreakAllTimeouts ? "timeouts" : "failures")};
    }

    record.status = NodeStatus::Pending;
    if (previous == NodeStatus::Pending) {
        spdlog::debug("Check failed ({}/{}): {}", record.consecutiveFailures, maxRetries_,
                      outcome.detail);
        return std::nullopt;
    }

    const auto detail = outcome.detail.empty() ? std::string("check failed") : outcome.detail;
    return Transition{previous, NodeStatus::Pending,
                      fmt::format("{} (retry {}/{})", detail, record.consecutiveFailures,
                                  maxRetries_)};
}

std::optional<Transition> StatusEngine::applyPause(core::StatusRecord& record,
                                                   const std::string& reason) const {
    if (record.status == NodeStatus::Paused) {
        return std::nullopt;
    }

    const auto previous = record.status;
    record.statusBeforePause = previous;
    record.status = NodeStatus::Paused;
    record.metricLevels.clear();
    return Transition{previous, NodeStatus::Paused, reason};
}

std::optional<Transition> StatusEngine::applyResume(core::StatusRecord& record,
                                                    const std::string& reason) const {
    if (record.status != NodeStatus::Paused) {
        return std::nullopt;
    }

    const auto restored = record.statusBeforePause.value_or(NodeStatus::Waiting);
    record.status = restored;
    record.statusBeforePause.reset();
    record.consecutiveFailures = 0;
    record.failureStreakAllTimeouts = true;
    return Transition{NodeStatus::Paused, restored, reason};
}

} // namespace beamstate::monitor
