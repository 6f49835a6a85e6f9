/**
 * @file StatusRecord.hpp
 * @brief In-memory monitoring state kept per node.
 */

#pragma once

#include "core/types/MetricSample.hpp"
#include "core/types/Node.hpp"

#include <chrono>
#include <map>
#include <optional>

namespace beamstate::core {

/**
 * @brief Current monitoring state of one node.
 *
 * Written only by the node's own loop; readers receive copies.
 */
struct StatusRecord {
    NodeStatus status{NodeStatus::Waiting};          ///< Current lifecycle status
    std::optional<NodeStatus> statusBeforePause;     ///< Restored when the node resumes
    int consecutiveFailures{0};                      ///< Reset to zero by any success
    bool failureStreakAllTimeouts{true};             ///< Whether every failure in the streak timed out
    std::optional<double> lastLatencyMs;             ///< Mean latency of the last successful check
    std::optional<double> lastPacketLoss;            ///< ICMP packet loss of the last check, percent
    std::optional<std::chrono::system_clock::time_point> lastCheck; ///< Last completed check
    std::map<MetricKey, MetricReading> lastSamples;  ///< Last raw value per series
    std::map<MetricKey, ThresholdLevel> metricLevels; ///< Current threshold level per series
};

} // namespace beamstate::core
