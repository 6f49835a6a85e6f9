#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace beamstate::core {

enum class AlertKind : int { NodeDown = 0, NodeRecovered = 1, GlobalStorm = 2, MetricBreach = 3 };

enum class DecisionOutcome : int {
    Sent = 0,
    SuppressedStorm = 1,
    SuppressedMaintenance = 2,
    SuppressedCooldown = 3
};

struct AlertDecision {
    std::chrono::system_clock::time_point timestamp;
    AlertKind kind{AlertKind::NodeDown};
    DecisionOutcome outcome{DecisionOutcome::Sent};
    std::optional<int64_t> nodeId;
    int priority{0};
    std::string title;
    std::string message;

    [[nodiscard]] std::string kindToString() const;
    [[nodiscard]] std::string outcomeToString() const;
};

inline constexpr int MIN_PRIORITY = -2;
inline constexpr int MAX_PRIORITY = 2;

[[nodiscard]] inline int clampPriority(int priority) {
    return std::clamp(priority, MIN_PRIORITY, MAX_PRIORITY);
}

} // namespace beamstate::core
