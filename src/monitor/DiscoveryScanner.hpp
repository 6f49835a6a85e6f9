/**
 * @file DiscoveryScanner.hpp
 * @brief Subnet sweep with ICMP/SNMP identification and inventory import.
 */

#pragma once

#include "core/services/INodeStore.hpp"
#include "core/services/IProbeTransport.hpp"
#include "core/types/Discovery.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace beamstate::monitor {

struct DiscoveryConfig {
    int workerCount{16};                          ///< Size of the scan pool
    std::chrono::milliseconds pingTimeout{1000};
    std::chrono::milliseconds snmpTimeout{1500};
    size_t maxHosts{65534};                       ///< Larger ranges are rejected
};

enum class ScanStartResult : int { Started, AlreadyRunning, InvalidRange, NoProtocols };

[[nodiscard]] const char* scanStartResultToString(ScanStartResult result);

/**
 * @brief Sweeps an IPv4 range on its own bounded thread pool.
 *
 * Only one scan runs at a time. Progress and the results found so far can be
 * polled from any thread while the scan runs; results are sorted by address
 * once it finishes. The pool uses blocking probe calls and is independent of
 * the monitoring I/O pool.
 */
class DiscoveryScanner {
public:
    using ResultCallback = std::function<void(const core::DiscoveryResult&)>;

    static constexpr const char* SYS_DESCR_OID = "1.3.6.1.2.1.1.1.0";
    static constexpr const char* SYS_OBJECT_ID_OID = "1.3.6.1.2.1.1.2.0";
    static constexpr const char* SYS_NAME_OID = "1.3.6.1.2.1.1.5.0";

    explicit DiscoveryScanner(core::IProbeTransport& transport, DiscoveryConfig config = {});
    ~DiscoveryScanner();

    DiscoveryScanner(const DiscoveryScanner&) = delete;
    DiscoveryScanner& operator=(const DiscoveryScanner&) = delete;

    /**
     * @brief Starts a scan in the background.
     * @param request Range, protocols and communities.
     * @param onResult Called from a worker thread for every responder; may be empty.
     */
    ScanStartResult start(const core::ScanRequest& request, ResultCallback onResult = {});

    /**
     * @brief Asks the running scan to stop; addresses already in progress finish.
     */
    void cancel();

    /**
     * @brief Blocks until the current scan, if any, has finished.
     */
    void wait();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] core::ScanProgress progress() const;
    [[nodiscard]] std::vector<core::DiscoveryResult> results() const;

    /**
     * @brief Merges discovery results into the store by IP address.
     *
     * New addresses become nodes in the target group. For known addresses only
     * monitoring flags are switched on and an unset community is filled;
     * names, thresholds and other overrides are left alone.
     *
     * @return Counts, or nullopt if the target group does not exist.
     */
    static std::optional<core::ImportReport> importDiscovered(
        const std::vector<core::DiscoveryResult>& results, const core::ImportOptions& options,
        core::INodeStore& store);

private:
    void runScan(core::ScanRequest request, std::vector<asio::ip::address_v4> hosts,
                 ResultCallback onResult);
    std::optional<core::DiscoveryResult> probeAddress(const core::ScanRequest& request,
                                                      const asio::ip::address_v4& address);
    std::optional<std::string> reverseLookup(const asio::ip::address_v4& address) const;

    core::IProbeTransport& transport_;
    DiscoveryConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<int> scanned_{0};
    std::atomic<int> total_{0};
    std::atomic<int> icmpFound_{0};
    std::atomic<int> snmpFound_{0};

    mutable std::mutex resultsMutex_;
    std::vector<core::DiscoveryResult> results_;

    std::mutex threadMutex_;
    std::thread coordinator_;
};

} // namespace beamstate::monitor
