#include "monitor/MetricCollector.hpp"

#include <spdlog/spdlog.h>

namespace beamstate::monitor {

namespace {

bool breaches(double value, core::AlertCondition condition, double threshold) {
    return condition == core::AlertCondition::GreaterThan ? value >= threshold
                                                          : value <= threshold;
}

// True while value has not yet cleared threshold by the hysteresis margin.
bool withinHysteresis(double value, core::AlertCondition condition, double threshold) {
    if (condition == core::AlertCondition::GreaterThan) {
        return value > threshold * (1.0 - ThresholdEvaluator::HYSTERESIS);
    }
    return value < threshold * (1.0 + ThresholdEvaluator::HYSTERESIS);
}

} // namespace

core::ThresholdLevel ThresholdEvaluator::evaluate(double value, core::AlertCondition condition,
                                                  std::optional<double> warning,
                                                  std::optional<double> critical,
                                                  core::ThresholdLevel previous) {
    using core::ThresholdLevel;

    auto level = ThresholdLevel::Normal;
    if (critical && breaches(value, condition, *critical)) {
        level = ThresholdLevel::Critical;
    } else if (warning && breaches(value, condition, *warning)) {
        level = ThresholdLevel::Warning;
    }

    if (previous == ThresholdLevel::Critical && level != ThresholdLevel::Critical && critical &&
        withinHysteresis(value, condition, *critical)) {
        level = ThresholdLevel::Critical;
    } else if (previous == ThresholdLevel::Warning && level == ThresholdLevel::Normal && warning &&
               withinHysteresis(value, condition, *warning)) {
        level = ThresholdLevel::Warning;
    }

    return level;
}

MetricCollector::MetricCollector(core::IProbeTransport& transport, StatusCache& cache,
                                 core::IMetricsSink* sink, std::chrono::milliseconds timeout)
    : transport_(transport), cache_(cache), sink_(sink), timeout_(timeout) {}

void MetricCollector::setBreachListener(BreachListener listener) {
    std::lock_guard lock(listenerMutex_);
    breachListener_ = std::move(listener);
}

void MetricCollector::collectAsync(const Strand& strand, const core::NodeContext& context,
                                   const core::MetricBinding& binding, std::function<void()> done) {
    auto oid = binding.definition.oid.resolve(binding.config.interfaceIndex);
    if (!oid) {
        spdlog::warn("Metric '{}' on {} has no interface index, skipping",
                     binding.definition.name, context.node.name);
        asio::post(strand, std::move(done));
        return;
    }

    core::SnmpGetRequest request;
    request.ip = context.node.ip;
    request.port = context.effective.snmpPort;
    request.community = context.effective.snmpCommunity;
    request.oid = *oid;
    request.timeout = timeout_;

    snmpGetWithDeadline(
        strand, transport_, request,
        [this, context, binding, done = std::move(done)](const core::SnmpResult& result) {
            if (!result.success()) {
                spdlog::debug("Metric '{}' on {} not collected: {} {}", binding.definition.name,
                              context.node.name, core::outcomeToString(result.outcome),
                              result.errorMessage);
            } else if (auto value = result.numericValue()) {
                processValue(context, binding, *value, std::chrono::system_clock::now());
            } else {
                spdlog::debug("Metric '{}' on {} returned non-numeric value '{}'",
                              binding.definition.name, context.node.name, result.value);
            }
            if (done) {
                done();
            }
        });
}

core::MetricSample MetricCollector::processValue(const core::NodeContext& context,
                                                 const core::MetricBinding& binding,
                                                 double rawValue,
                                                 std::chrono::system_clock::time_point timestamp) {
    const auto& definition = binding.definition;
    const auto& config = binding.config;
    const bool isCounter = definition.kind == core::MetricKind::Counter;

    core::MetricSample sample;
    sample.nodeId = context.node.id;
    sample.metricId = definition.id;
    sample.interfaceIndex = config.interfaceIndex;
    sample.value = rawValue;
    sample.unit = reportedUnit(definition);
    sample.timestamp = timestamp;

    const auto key = sample.key();
    const core::MetricReading reading{rawValue, timestamp};

    std::optional<core::MetricBreach> breach;
    cache_.update(context.node.id, [&](core::StatusRecord& record) {
        std::optional<core::MetricReading> previous;
        if (auto it = record.lastSamples.find(key); it != record.lastSamples.end()) {
            previous = it->second;
        }
        record.lastSamples[key] = reading;

        if (isCounter) {
            sample.rate = deriveRate(previous, reading, definition.unit);
        }

        const auto subject = isCounter ? sample.rate : std::optional<double>(rawValue);
        if (!subject) {
            return;
        }
        if (!config.warningThreshold && !config.criticalThreshold) {
            record.metricLevels.erase(key);
            return;
        }

        auto levelIt = record.metricLevels.find(key);
        const auto previousLevel =
            levelIt != record.metricLevels.end() ? levelIt->second : core::ThresholdLevel::Normal;
        const auto level = ThresholdEvaluator::evaluate(
            *subject, config.condition, config.warningThreshold, config.criticalThreshold,
            previousLevel);
        if (level == previousLevel) {
            return;
        }

        if (level == core::ThresholdLevel::Normal) {
            record.metricLevels.erase(key);
        } else {
            record.metricLevels[key] = level;
        }

        core::MetricBreach change;
        change.key = key;
        change.nodeName = context.node.name;
        change.metricName = definition.name;
        change.interfaceName = config.interfaceName;
        change.previous = previousLevel;
        change.current = level;
        change.value = *subject;
        change.threshold = level == core::ThresholdLevel::Critical ? config.criticalThreshold
                                                                    : config.warningThreshold;
        change.unit = sample.unit;
        change.nodePriority = context.node.notificationPriority;
        change.timestamp = timestamp;
        breach = std::move(change);
    });

    if (sink_) {
        try {
            sink_->record(sample);
        } catch (const std::exception& e) {
            spdlog::error("Failed to store sample {}: {}", core::keyToString(key), e.what());
        }
    }

    if (breach) {
        spdlog::info("Metric '{}' on {}: {} -> {} (value {:.2f} {})", breach->metricName,
                     breach->nodeName, core::levelToString(breach->previous),
                     core::levelToString(breach->current), breach->value, breach->unit);
        BreachListener listener;
        {
            std::lock_guard lock(listenerMutex_);
            listener = breachListener_;
        }
        if (listener) {
            listener(*breach);
        }
    }

    return sample;
}

std::optional<double> MetricCollector::deriveRate(
    const std::optional<core::MetricReading>& previous, const core::MetricReading& current,
    const std::string& unit) {
    if (!previous) {
        return std::nullopt;
    }

    const double elapsed =
        std::chrono::duration<double>(current.timestamp - previous->timestamp).count();
    if (elapsed <= 0.0) {
        return std::nullopt;
    }

    const double delta = current.value - previous->value;
    if (delta < 0.0) {
        return std::nullopt; // Counter wrapped or was reset
    }

    double rate = delta / elapsed;
    if (unit == "bytes") {
        rate *= 8.0;
    }
    return rate;
}

std::string MetricCollector::reportedUnit(const core::MetricDefinition& definition) {
    if (definition.kind != core::MetricKind::Counter) {
        return definition.unit;
    }
    if (definition.unit == "bytes") {
        return "bps";
    }
    return definition.unit.empty() ? std::string("/s") : definition.unit + "/s";
}

} // namespace beamstate::monitor
