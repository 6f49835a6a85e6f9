/**
 * @file MetricDefinition.hpp
 * @brief Collectible SNMP metric definitions and their per-node bindings.
 */

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace beamstate::core {

/// Placeholder replaced by the interface index when an OID template is resolved.
inline constexpr const char* OID_INDEX_PLACEHOLDER = "{index}";

enum class MetricCategory : int { Interface = 0, System = 1 };

enum class MetricKind : int {
    Gauge = 0,  ///< Value is meaningful on its own
    Counter = 1 ///< Monotonic counter; the rate between samples is reported
};

enum class AlertCondition : int {
    GreaterThan = 0, ///< Breach when the value reaches or exceeds the threshold
    LessThan = 1     ///< Breach when the value reaches or falls below the threshold
};

[[nodiscard]] std::string categoryToString(MetricCategory category);
MetricCategory categoryFromString(const std::string& str);
[[nodiscard]] std::string kindToString(MetricKind kind);
MetricKind kindFromString(const std::string& str);
[[nodiscard]] std::string conditionToString(AlertCondition condition);
AlertCondition conditionFromString(const std::string& str);

/**
 * @brief Dotted OID pattern, optionally containing the "{index}" placeholder.
 */
struct OidTemplate {
    std::string pattern;       ///< e.g. "1.3.6.1.2.1.2.2.1.10.{index}"
    bool requiresIndex{false}; ///< Must match whether the placeholder is present

    [[nodiscard]] bool hasPlaceholder() const;

    /**
     * @brief Checks the pattern is a dotted numeric OID and agrees with requiresIndex.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Substitutes the interface index into the pattern.
     * @param index Interface index; required when the pattern has a placeholder.
     * @return Concrete OID, or nullopt if an index is needed but missing.
     */
    [[nodiscard]] std::optional<std::string> resolve(std::optional<int> index) const;

    bool operator==(const OidTemplate& other) const = default;
};

/**
 * @brief A metric that can be collected from devices over SNMP.
 */
struct MetricDefinition {
    int64_t id{0};                                   ///< Unique identifier
    std::string name;                                ///< Display name
    OidTemplate oid;                                 ///< OID to read
    MetricCategory category{MetricCategory::System}; ///< Interface metrics are per ifIndex
    MetricKind kind{MetricKind::Gauge};              ///< Gauge or counter
    std::string unit;                                ///< e.g. "bytes", "percent"
    std::string deviceType{"generic"};               ///< Device family this applies to
    std::string description;                         ///< Free text

    /**
     * @brief True when a binding must carry an interface index.
     */
    [[nodiscard]] bool needsIndex() const {
        return oid.requiresIndex || category == MetricCategory::Interface;
    }

    [[nodiscard]] bool isValid() const { return !name.empty() && oid.isValid(); }

    bool operator==(const MetricDefinition& other) const = default;
};

/**
 * @brief Binds a metric definition to a node, with optional thresholds.
 */
struct NodeMetricConfig {
    int64_t id{0};
    int64_t nodeId{0};
    int64_t metricId{0};
    std::optional<int> interfaceIndex;  ///< Required when the definition needs an index
    std::string interfaceName;          ///< Display name of the interface, if any
    std::optional<int> intervalSeconds; ///< Unset uses the node's effective interval
    bool enabled{true};
    AlertCondition condition{AlertCondition::GreaterThan};
    std::optional<double> warningThreshold;
    std::optional<double> criticalThreshold;

    bool operator==(const NodeMetricConfig& other) const = default;
};

/**
 * @brief Identity of a collected series: (node, metric, interface).
 */
struct MetricKey {
    int64_t nodeId{0};
    int64_t metricId{0};
    std::optional<int> interfaceIndex;

    auto operator<=>(const MetricKey& other) const = default;
    bool operator==(const MetricKey& other) const = default;
};

[[nodiscard]] std::string keyToString(const MetricKey& key);

} // namespace beamstate::core
