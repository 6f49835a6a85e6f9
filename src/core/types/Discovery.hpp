/**
 * @file Discovery.hpp
 * @brief Types for subnet discovery scans and importing their results.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace beamstate::core {

/**
 * @brief A device found by a discovery scan.
 */
struct DiscoveryResult {
    std::string ip;                       ///< Responding address
    std::optional<std::string> hostname;  ///< sysName or reverse DNS name
    std::optional<double> latencyMs;      ///< ICMP round-trip, if it answered ping
    std::string vendor{"Unknown"};        ///< Vendor guess from sysDescr
    std::string deviceType{"Generic"};    ///< Device type guess from sysDescr
    bool snmpEnabled{false};              ///< Answered an SNMP sysDescr read
    std::optional<std::string> community; ///< Community that answered

    bool operator==(const DiscoveryResult& other) const = default;
};

/**
 * @brief Parameters of one discovery scan.
 */
struct ScanRequest {
    std::string cidr;                                ///< e.g. "192.168.1.0/24"
    bool useIcmp{true};                              ///< Ping sweep
    bool useSnmp{true};                              ///< SNMP identification
    std::vector<std::string> communities{"public"};  ///< Tried in order
    uint16_t snmpPort{161};
    bool resolveHostnames{false};                    ///< Reverse DNS for responders
};

/**
 * @brief Progress counters of the running or last scan; all monotonically increasing.
 */
struct ScanProgress {
    int scanned{0};   ///< Addresses fully processed
    int total{0};     ///< Usable addresses in the range
    int icmpFound{0}; ///< Addresses that answered ping
    int snmpFound{0}; ///< Addresses that answered SNMP
    bool running{false};
    bool cancelled{false};

    [[nodiscard]] double percent() const {
        return total > 0 ? (static_cast<double>(scanned) / total) * 100.0 : 0.0;
    }
};

/**
 * @brief Options for merging discovery results into the inventory.
 */
struct ImportOptions {
    int64_t targetGroupId{0}; ///< Group that receives new nodes; must exist
    bool useIcmp{true};       ///< Enable ping monitoring for ICMP responders
    bool useSnmp{true};       ///< Enable SNMP monitoring for SNMP responders
};

/**
 * @brief Outcome counts of an import.
 */
struct ImportReport {
    int imported{0}; ///< New nodes created
    int updated{0};  ///< Existing nodes whose flags or community changed
    int skipped{0};  ///< Results that changed nothing

    bool operator==(const ImportReport& other) const = default;
};

/**
 * @brief Vendor and device type guessed from SNMP system data.
 */
struct DeviceIdentity {
    std::string vendor{"Unknown"};
    std::string deviceType{"Device"};

    bool operator==(const DeviceIdentity& other) const = default;
};

/**
 * @brief Guesses vendor and type from sysDescr keywords.
 * @param sysDescr Value of SNMPv2-MIB::sysDescr.0.
 * @param sysObjectId Value of SNMPv2-MIB::sysObjectID.0.
 * @return Best guess; "Unknown" / "Device" when nothing matches.
 */
[[nodiscard]] DeviceIdentity identifyDevice(const std::string& sysDescr,
                                            const std::string& sysObjectId);

} // namespace beamstate::core
