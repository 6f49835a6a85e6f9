#pragma once

#include "core/services/IProbeTransport.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/CommandRunner.hpp"

#include <atomic>
#include <string>

namespace beamstate::infra {

struct CommandProbeConfig {
    std::string pingCommand{"ping"};
    std::string snmpGetCommand{"snmpget"};
};

/**
 * @brief Probe transport backed by the system ping and net-snmp snmpget tools.
 *
 * Each probe runs one child process on the probe pool. Arguments are passed
 * without a shell and validated first: the target must be a dotted IPv4
 * address, the OID numeric, the community free of control characters.
 * Invalid requests fail immediately without starting a process.
 */
class CommandProbeTransport : public core::IProbeTransport {
public:
    CommandProbeTransport(AsioContext& probePool, CommandProbeConfig config = {});

    void pingAsync(const std::string& ip, std::chrono::milliseconds timeout, int count,
                   PingCallback callback) override;

    void snmpGetAsync(const core::SnmpGetRequest& request, SnmpCallback callback) override;

    /**
     * @brief Runs a ping on the calling thread.
     */
    core::PingResult ping(const std::string& ip, std::chrono::milliseconds timeout, int count);

    /**
     * @brief Runs an SNMP GET on the calling thread.
     */
    core::SnmpResult snmpGet(const core::SnmpGetRequest& request);

    static core::PingResult parsePingOutput(const CommandOutput& output, int count);
    static core::SnmpResult parseSnmpOutput(const CommandOutput& output);

    static bool isValidIpv4(const std::string& ip);
    static bool isValidOid(const std::string& oid);
    static bool isValidCommunity(const std::string& community);

private:
    void reportMissingTool(const std::string& tool);

    AsioContext& pool_;
    CommandProbeConfig config_;
    std::atomic<bool> pingMissingLogged_{false};
    std::atomic<bool> snmpMissingLogged_{false};
};

} // namespace beamstate::infra
