#include "core/types/TraceEvent.hpp"

#include <cstdio>
#include <ctime>

namespace beamstate::core {

namespace {

std::string toIsoString(const std::chrono::system_clock::time_point& tp) {
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    char withMillis[48];
    std::snprintf(withMillis, sizeof(withMillis), "%s.%03lldZ", buffer,
                  static_cast<long long>(millis));
    return withMillis;
}

} // namespace

nlohmann::json TraceEvent::toJson() const {
    nlohmann::json j;
    j["sequence"] = sequence;
    j["timestamp"] =
        std::chrono::duration<double>(timestamp.time_since_epoch()).count();
    j["timestamp_iso"] = toIsoString(timestamp);
    j["node_id"] = nodeId;
    j["node_name"] = nodeName;
    j["ip"] = nodeIp;
    j["group_name"] = groupName;
    j["old_status"] = statusToString(oldStatus);
    j["new_status"] = statusToString(newStatus);
    j["reason"] = reason;
    return j;
}

} // namespace beamstate::core
