#pragma once

#include "core/types/MetricDefinition.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace beamstate::core {

enum class ThresholdLevel : int { Normal = 0, Warning = 1, Critical = 2 };

[[nodiscard]] inline const char* levelToString(ThresholdLevel level) {
    switch (level) {
    case ThresholdLevel::Warning:
        return "warning";
    case ThresholdLevel::Critical:
        return "critical";
    case ThresholdLevel::Normal:
        break;
    }
    return "normal";
}

/// Raw value kept per series for rate derivation.
struct MetricReading {
    double value{0.0};
    std::chrono::system_clock::time_point timestamp;

    bool operator==(const MetricReading& other) const = default;
};

/// One collected data point as handed to the metrics sink.
struct MetricSample {
    int64_t nodeId{0};
    int64_t metricId{0};
    std::optional<int> interfaceIndex;
    double value{0.0};        ///< Raw value read from the device
    std::optional<double> rate; ///< Per-second rate for counters; absent when not derivable
    std::string unit;         ///< Unit of rate for counters ("bps" for byte counters), else of value
    std::chrono::system_clock::time_point timestamp;

    [[nodiscard]] MetricKey key() const { return {nodeId, metricId, interfaceIndex}; }

    bool operator==(const MetricSample& other) const = default;
};

/// Threshold level change on one series, reported to the alert throttler.
struct MetricBreach {
    MetricKey key;
    std::string nodeName;
    std::string metricName;
    std::string interfaceName;
    ThresholdLevel previous{ThresholdLevel::Normal};
    ThresholdLevel current{ThresholdLevel::Normal};
    double value{0.0};
    std::optional<double> threshold;
    std::string unit;
    std::optional<int> nodePriority;
    std::chrono::system_clock::time_point timestamp;
};

} // namespace beamstate::core
