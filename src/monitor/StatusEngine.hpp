/**
 * @file StatusEngine.hpp
 * @brief Reachability state machine turning check outcomes into node status.
 */

#pragma once

#include "core/types/StatusRecord.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace beamstate::monitor {

/**
 * @brief Aggregated outcome of one reachability check across all configured protocols.
 */
struct CheckOutcome {
    bool success{false};
    bool timedOut{false};               ///< Every failed protocol timed out
    std::optional<double> latencyMs;    ///< Mean latency of the successful protocols
    std::optional<double> packetLoss;   ///< ICMP packet loss, if ping ran
    std::string detail;                 ///< Failure description, e.g. "ping timeout"
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @brief A status change produced by the engine.
 */
struct Transition {
    core::NodeStatus from{core::NodeStatus::Waiting};
    core::NodeStatus to{core::NodeStatus::Waiting};
    std::string reason;
};

/**
 * @brief Converts check outcomes and pause/resume requests into status transitions.
 *
 * Stateless apart from its configuration; all per-node state lives in the
 * StatusRecord passed in, which the caller owns and serializes.
 *
 * Rules:
 * - any success sets UP and resets the failure counter;
 * - a failure increments the counter and sets PENDING while it is below
 *   maxRetries, DOWN once it reaches maxRetries; DOWN stays DOWN;
 * - PAUSED is entered and left only through applyPause()/applyResume().
 *
 * Only changes of status are returned; PENDING to PENDING and DOWN to DOWN
 * are silent.
 */
class StatusEngine {
public:
    static constexpr int DEFAULT_MAX_RETRIES = 3;

    /**
     * @param maxRetries Consecutive failures that mark a node DOWN (clamped to at least 1).
     */
    explicit StatusEngine(int maxRetries = DEFAULT_MAX_RETRIES);

    /**
     * @brief Applies a check outcome.
     * @param record Node state to update.
     * @param outcome Result of the check.
     * @return The transition, if the status changed.
     */
    std::optional<Transition> applyResult(core::StatusRecord& record,
                                          const CheckOutcome& outcome) const;

    /**
     * @brief Moves the node to PAUSED, remembering the current status.
     * @param record Node state to update.
     * @param reason e.g. "paused by user".
     * @return The transition, or nullopt if already paused.
     */
    std::optional<Transition> applyPause(core::StatusRecord& record,
                                         const std::string& reason) const;

    /**
     * @brief Leaves PAUSED, restoring the status held before the pause with the counter reset.
     * @param record Node state to update.
     * @param reason e.g. "resumed by user".
     * @return The transition, or nullopt if the node was not paused.
     */
    std::optional<Transition> applyResume(core::StatusRecord& record,
                                          const std::string& reason) const;

    [[nodiscard]] int maxRetries() const { return maxRetries_; }

private:
    int maxRetries_;
};

} // namespace beamstate::monitor
