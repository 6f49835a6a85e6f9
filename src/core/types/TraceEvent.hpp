/**
 * @file TraceEvent.hpp
 * @brief Immutable record of a node status transition.
 */

#pragma once

#include "core/types/Node.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace beamstate::core {

/**
 * @brief One externally visible status change of a node.
 */
struct TraceEvent {
    uint64_t sequence{0};                            ///< Assigned by the trace bus, strictly increasing
    std::chrono::system_clock::time_point timestamp; ///< When the transition happened
    int64_t nodeId{0};
    std::string nodeName;
    std::string nodeIp;
    std::string groupName;
    NodeStatus oldStatus{NodeStatus::Waiting};
    NodeStatus newStatus{NodeStatus::Waiting};
    std::string reason;                              ///< Human-readable cause, e.g. "3 consecutive timeouts"

    /**
     * @brief True for a node failing into DOWN from WAITING, UP or PENDING.
     *
     * Resuming a node that was DOWN before its pause restores DOWN without a new outage.
     */
    [[nodiscard]] bool isDownTransition() const {
        return newStatus == NodeStatus::Down &&
               (oldStatus == NodeStatus::Waiting || oldStatus == NodeStatus::Up ||
                oldStatus == NodeStatus::Pending);
    }

    /**
     * @brief True for DOWN to UP, also after a resume restored DOWN.
     */
    [[nodiscard]] bool isRecovery() const {
        return oldStatus == NodeStatus::Down && newStatus == NodeStatus::Up;
    }

    /**
     * @brief Serializes the event for streaming consumers.
     * @return JSON object including "timestamp" (epoch seconds) and "timestamp_iso".
     */
    [[nodiscard]] nlohmann::json toJson() const;

    bool operator==(const TraceEvent& other) const = default;
};

} // namespace beamstate::core
