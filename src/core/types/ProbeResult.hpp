/**
 * @file ProbeResult.hpp
 * @brief Request and result types exchanged with the probe transport.
 */

#pragma once

#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace beamstate::core {

enum class PingOutcome : int {
    Success = 0,
    Timeout = 1,    ///< No reply before the deadline
    Unreachable = 2 ///< Host or network unreachable, or the probe could not run
};

/**
 * @brief Result of one ICMP reachability probe (one or more echo requests).
 */
struct PingResult {
    PingOutcome outcome{PingOutcome::Timeout};
    std::optional<double> latencyMs;  ///< Average round-trip time of the replies
    double packetLossPercent{100.0};  ///< Share of requests without reply
    std::string errorMessage;         ///< Detail for failed probes

    [[nodiscard]] bool success() const { return outcome == PingOutcome::Success; }
};

/**
 * @brief A single SNMPv2c GET.
 */
struct SnmpGetRequest {
    std::string ip;
    uint16_t port{161};
    std::string community{"public"};
    std::string oid;
    std::chrono::milliseconds timeout{5000};
};

enum class SnmpOutcome : int {
    Success = 0,
    Timeout = 1,
    NoSuchObject = 2, ///< Agent answered but the OID does not exist
    AuthError = 3,    ///< Community rejected
    Unavailable = 4   ///< The probe could not be run at all
};

/**
 * @brief Result of an SNMP GET.
 */
struct SnmpResult {
    SnmpOutcome outcome{SnmpOutcome::Timeout};
    std::string value;               ///< Value rendered as text
    std::optional<double> latencyMs; ///< Request round-trip time
    std::string errorMessage;

    [[nodiscard]] bool success() const { return outcome == SnmpOutcome::Success; }

    /**
     * @brief Parses the value as a number.
     * @return The numeric value, or nullopt for non-numeric values.
     */
    [[nodiscard]] std::optional<double> numericValue() const {
        if (value.empty()) {
            return std::nullopt;
        }
        double parsed = 0.0;
        const char* begin = value.data();
        const char* end = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return parsed;
    }
};

[[nodiscard]] inline const char* outcomeToString(PingOutcome outcome) {
    switch (outcome) {
    case PingOutcome::Success:
        return "success";
    case PingOutcome::Timeout:
        return "timeout";
    case PingOutcome::Unreachable:
        break;
    }
    return "unreachable";
}

[[nodiscard]] inline const char* outcomeToString(SnmpOutcome outcome) {
    switch (outcome) {
    case SnmpOutcome::Success:
        return "success";
    case SnmpOutcome::Timeout:
        return "timeout";
    case SnmpOutcome::NoSuchObject:
        return "no such object";
    case SnmpOutcome::AuthError:
        return "authentication error";
    case SnmpOutcome::Unavailable:
        break;
    }
    return "unavailable";
}

} // namespace beamstate::core
