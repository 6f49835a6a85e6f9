/**
 * @file IProbeTransport.hpp
 * @brief Interface to the ICMP and SNMP probe capability.
 *
 * The monitoring core never encodes ICMP or SNMP itself; it only issues
 * probes through this interface and bounds every call with its own deadline.
 */

#pragma once

#include "core/types/ProbeResult.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace beamstate::core {

/**
 * @brief Asynchronous probe transport.
 *
 * Callbacks may run on any thread. A transport should invoke each callback
 * exactly once; callers tolerate late, missing, or thrown results.
 */
class IProbeTransport {
public:
    using PingCallback = std::function<void(const PingResult&)>;
    using SnmpCallback = std::function<void(const SnmpResult&)>;

    virtual ~IProbeTransport() = default;

    /**
     * @brief Sends count ICMP echo requests to ip.
     * @param ip IPv4 address.
     * @param timeout Time to wait for each reply.
     * @param count Number of echo requests.
     * @param callback Receives the aggregated result.
     */
    virtual void pingAsync(const std::string& ip, std::chrono::milliseconds timeout, int count,
                           PingCallback callback) = 0;

    /**
     * @brief Performs one SNMPv2c GET.
     * @param request Target, credentials, OID and timeout.
     * @param callback Receives the result.
     */
    virtual void snmpGetAsync(const SnmpGetRequest& request, SnmpCallback callback) = 0;
};

} // namespace beamstate::core
