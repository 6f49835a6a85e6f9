#include "core/types/MetricDefinition.hpp"

#include <cctype>

namespace beamstate::core {

namespace {

bool isDottedNumeric(const std::string& oid) {
    if (oid.empty() || oid.front() == '.' || oid.back() == '.') {
        return false;
    }
    char previous = '.';
    for (char c : oid) {
        if (c == '.') {
            if (previous == '.') {
                return false;
            }
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        previous = c;
    }
    return true;
}

} // namespace

std::string categoryToString(MetricCategory category) {
    return category == MetricCategory::Interface ? "interface" : "system";
}

MetricCategory categoryFromString(const std::string& str) {
    return str == "interface" ? MetricCategory::Interface : MetricCategory::System;
}

std::string kindToString(MetricKind kind) {
    return kind == MetricKind::Counter ? "counter" : "gauge";
}

MetricKind kindFromString(const std::string& str) {
    return str == "counter" ? MetricKind::Counter : MetricKind::Gauge;
}

std::string conditionToString(AlertCondition condition) {
    return condition == AlertCondition::LessThan ? "lt" : "gt";
}

AlertCondition conditionFromString(const std::string& str) {
    return str == "lt" ? AlertCondition::LessThan : AlertCondition::GreaterThan;
}

bool OidTemplate::hasPlaceholder() const {
    return pattern.find(OID_INDEX_PLACEHOLDER) != std::string::npos;
}

bool OidTemplate::isValid() const {
    if (requiresIndex != hasPlaceholder()) {
        return false;
    }
    auto probe = resolve(0);
    return probe && isDottedNumeric(*probe);
}

std::optional<std::string> OidTemplate::resolve(std::optional<int> index) const {
    std::string result = pattern;
    const std::string placeholder = OID_INDEX_PLACEHOLDER;

    auto pos = result.find(placeholder);
    if (pos == std::string::npos) {
        return result;
    }
    if (!index) {
        return std::nullopt;
    }

    const std::string value = std::to_string(*index);
    while (pos != std::string::npos) {
        result.replace(pos, placeholder.size(), value);
        pos = result.find(placeholder, pos + value.size());
    }
    return result;
}

std::string keyToString(const MetricKey& key) {
    std::string out = std::to_string(key.nodeId) + "/" + std::to_string(key.metricId);
    if (key.interfaceIndex) {
        out += "/if" + std::to_string(*key.interfaceIndex);
    }
    return out;
}

} // namespace beamstate::core
