/**
 * @file ProbeCalls.hpp
 * @brief Deadline-bounded calls into the probe transport.
 *
 * A transport may answer late, never, or by throwing. These helpers race the
 * transport callback against a steady_timer, deliver exactly one result, and
 * discard whatever arrives after the deadline.
 */

#pragma once

#include "core/services/IProbeTransport.hpp"

#include <asio.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace beamstate::monitor {

using Strand = asio::strand<asio::io_context::executor_type>;

/// Slack added on top of the transport's own timeout before a probe is abandoned.
inline constexpr std::chrono::milliseconds DEADLINE_GRACE{500};

/// OID read by SNMP reachability checks (SNMPv2-MIB::sysUpTime.0).
inline constexpr const char* SNMP_CHECK_OID = "1.3.6.1.2.1.1.3.0";

/**
 * @brief Pings ip, delivering the result on strand.
 *
 * The overall deadline is timeout * count plus DEADLINE_GRACE; hitting it
 * yields a Timeout result.
 */
void pingWithDeadline(const Strand& strand, core::IProbeTransport& transport,
                      const std::string& ip, std::chrono::milliseconds timeout, int count,
                      std::function<void(const core::PingResult&)> callback);

/**
 * @brief Performs an SNMP GET, delivering the result on strand.
 *
 * The deadline is request.timeout plus DEADLINE_GRACE.
 */
void snmpGetWithDeadline(const Strand& strand, core::IProbeTransport& transport,
                         const core::SnmpGetRequest& request,
                         std::function<void(const core::SnmpResult&)> callback);

/**
 * @brief Blocking ping for worker threads outside the I/O pool.
 */
core::PingResult pingBlocking(core::IProbeTransport& transport, const std::string& ip,
                              std::chrono::milliseconds timeout, int count);

/**
 * @brief Blocking SNMP GET for worker threads outside the I/O pool.
 */
core::SnmpResult snmpGetBlocking(core::IProbeTransport& transport,
                                 const core::SnmpGetRequest& request);

} // namespace beamstate::monitor
