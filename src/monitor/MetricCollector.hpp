/**
 * @file MetricCollector.hpp
 * @brief SNMP metric collection, counter-rate derivation and threshold evaluation.
 */

#pragma once

#include "core/services/IConfigSource.hpp"
#include "core/services/IMetricsSink.hpp"
#include "core/services/IProbeTransport.hpp"
#include "core/types/MetricSample.hpp"
#include "monitor/ProbeCalls.hpp"
#include "monitor/StatusCache.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

namespace beamstate::monitor {

/**
 * @brief Maps a value onto warning/critical levels with a hysteresis band.
 */
class ThresholdEvaluator {
public:
    static constexpr double HYSTERESIS = 0.05;

    /**
     * @brief Determines the level of value.
     *
     * Critical wins over warning. A level is only left once the value is back
     * beyond the threshold by HYSTERESIS (5 %); until then it is held.
     *
     * @param value Gauge value or counter rate.
     * @param condition Whether high (gt) or low (lt) values are bad.
     * @param warning Warning threshold, if any.
     * @param critical Critical threshold, if any.
     * @param previous Level before this value.
     * @return The new level.
     */
    static core::ThresholdLevel evaluate(double value, core::AlertCondition condition,
                                         std::optional<double> warning,
                                         std::optional<double> critical,
                                         core::ThresholdLevel previous);
};

/**
 * @brief Collects one metric binding at a time and turns raw values into samples.
 *
 * Every successful read updates the node's StatusRecord sample map, is handed
 * to the metrics sink, and is evaluated against the binding's thresholds.
 * Level changes go to the breach listener; the collector never notifies.
 */
class MetricCollector {
public:
    using BreachListener = std::function<void(const core::MetricBreach&)>;

    /**
     * @param transport Probe transport used for SNMP reads.
     * @param cache Status cache holding the previous sample per series.
     * @param sink Receiver of samples; may be null.
     * @param timeout SNMP timeout per read.
     */
    MetricCollector(core::IProbeTransport& transport, StatusCache& cache, core::IMetricsSink* sink,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5));

    void setBreachListener(BreachListener listener);

    /**
     * @brief Reads the binding's OID and processes the value.
     * @param strand Strand on which the completion runs.
     * @param context Node, group and effective settings.
     * @param binding Binding and its definition.
     * @param done Invoked on strand once the read has been handled, successful or not.
     */
    void collectAsync(const Strand& strand, const core::NodeContext& context,
                      const core::MetricBinding& binding, std::function<void()> done);

    /**
     * @brief Processes one raw value read at timestamp.
     * @return The sample handed to the sink.
     */
    core::MetricSample processValue(const core::NodeContext& context,
                                    const core::MetricBinding& binding, double rawValue,
                                    std::chrono::system_clock::time_point timestamp);

    /**
     * @brief Per-second rate between two counter readings.
     *
     * Byte counters are converted to bits per second. Returns nullopt when
     * there is no previous reading, when the counter decreased (wrap or
     * reset), or when no time has elapsed.
     */
    static std::optional<double> deriveRate(const std::optional<core::MetricReading>& previous,
                                            const core::MetricReading& current,
                                            const std::string& unit);

    /**
     * @brief Unit of the reported value: "bps" for byte counters, "<unit>/s" for other counters.
     */
    static std::string reportedUnit(const core::MetricDefinition& definition);

private:
    core::IProbeTransport& transport_;
    StatusCache& cache_;
    core::IMetricsSink* sink_;
    std::chrono::milliseconds timeout_;

    std::mutex listenerMutex_;
    BreachListener breachListener_;
};

} // namespace beamstate::monitor
