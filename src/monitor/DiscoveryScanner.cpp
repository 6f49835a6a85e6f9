#include "monitor/DiscoveryScanner.hpp"

#include "core/types/Errors.hpp"
#include "monitor/CidrRange.hpp"
#include "monitor/ProbeCalls.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace beamstate::monitor {

const char* scanStartResultToString(ScanStartResult result) {
    switch (result) {
    case ScanStartResult::Started:
        return "started";
    case ScanStartResult::AlreadyRunning:
        return "already running";
    case ScanStartResult::InvalidRange:
        return "invalid range";
    case ScanStartResult::NoProtocols:
        break;
    }
    return "no protocols";
}

DiscoveryScanner::DiscoveryScanner(core::IProbeTransport& transport, DiscoveryConfig config)
    : transport_(transport), config_(config) {
    config_.workerCount = std::max(1, config_.workerCount);
}

DiscoveryScanner::~DiscoveryScanner() {
    cancel();
    wait();
}

ScanStartResult DiscoveryScanner::start(const core::ScanRequest& request,
                                        ResultCallback onResult) {
    if (!request.useIcmp && !request.useSnmp) {
        return ScanStartResult::NoProtocols;
    }

    auto range = CidrRange::parse(request.cidr);
    if (!range || range->hostCount() > config_.maxHosts) {
        spdlog::warn("Rejected discovery range '{}'", request.cidr);
        return ScanStartResult::InvalidRange;
    }

    std::lock_guard lock(threadMutex_);
    if (running_.exchange(true)) {
        spdlog::warn("Discovery scan already in progress");
        return ScanStartResult::AlreadyRunning;
    }
    if (coordinator_.joinable()) {
        coordinator_.join(); // Previous scan has finished
    }

    auto hosts = range->hosts(config_.maxHosts);
    cancelled_ = false;
    scanned_ = 0;
    icmpFound_ = 0;
    snmpFound_ = 0;
    total_ = static_cast<int>(hosts.size());
    {
        std::lock_guard resultsLock(resultsMutex_);
        results_.clear();
    }

    spdlog::info("Starting discovery of {} ({} hosts, icmp={}, snmp={})", range->toString(),
                 hosts.size(), request.useIcmp, request.useSnmp);

    coordinator_ = std::thread([this, request, hosts = std::move(hosts),
                                onResult = std::move(onResult)]() mutable {
        runScan(std::move(request), std::move(hosts), std::move(onResult));
    });
    return ScanStartResult::Started;
}

void DiscoveryScanner::cancel() {
    if (running_ && !cancelled_.exchange(true)) {
        spdlog::info("Discovery scan cancellation requested");
    }
}

void DiscoveryScanner::wait() {
    std::lock_guard lock(threadMutex_);
    if (coordinator_.joinable()) {
        coordinator_.join();
    }
}

core::ScanProgress DiscoveryScanner::progress() const {
    core::ScanProgress progress;
    progress.scanned = scanned_;
    progress.total = total_;
    progress.icmpFound = icmpFound_;
    progress.snmpFound = snmpFound_;
    progress.running = running_;
    progress.cancelled = cancelled_;
    return progress;
}

std::vector<core::DiscoveryResult> DiscoveryScanner::results() const {
    std::lock_guard lock(resultsMutex_);
    return results_;
}

void DiscoveryScanner::runScan(core::ScanRequest request,
                               std::vector<asio::ip::address_v4> hosts, ResultCallback onResult) {
    const auto start = std::chrono::steady_clock::now();
    std::atomic<size_t> nextIndex{0};

    auto work = [&]() {
        while (!cancelled_) {
            const size_t index = nextIndex.fetch_add(1);
            if (index >= hosts.size()) {
                return;
            }

            const auto& address = hosts[index];
            try {
                if (auto result = probeAddress(request, address)) {
                    {
                        std::lock_guard lock(resultsMutex_);
                        results_.push_back(*result);
                    }
                    if (onResult) {
                        onResult(*result);
                    }
                }
            } catch (const std::exception& e) {
                spdlog::debug("Discovery of {} failed: {}", address.to_string(), e.what());
            }
            ++scanned_;
        }
    };

    const size_t workerCount =
        std::min(static_cast<size_t>(config_.workerCount), std::max<size_t>(1, hosts.size()));
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(work);
    }
    for (auto& worker : workers) {
        worker.join();
    }

    {
        std::lock_guard lock(resultsMutex_);
        std::sort(results_.begin(), results_.end(), [](const auto& a, const auto& b) {
            return asio::ip::make_address_v4(a.ip).to_uint() <
                   asio::ip::make_address_v4(b.ip).to_uint();
        });
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Discovery of {} {} after {}ms: {}/{} scanned, {} ping, {} snmp", request.cidr,
                 cancelled_ ? "cancelled" : "finished", elapsed.count(), scanned_.load(),
                 total_.load(), icmpFound_.load(), snmpFound_.load());
    running_ = false;
}

std::optional<core::DiscoveryResult> DiscoveryScanner::probeAddress(
    const core::ScanRequest& request, const asio::ip::address_v4& address) {
    core::DiscoveryResult result;
    result.ip = address.to_string();

    if (request.useIcmp) {
        auto ping = pingBlocking(transport_, result.ip, config_.pingTimeout, 1);
        if (!ping.success()) {
            return std::nullopt;
        }
        result.latencyMs = ping.latencyMs;
        ++icmpFound_;
    }

    std::optional<std::string> sysName;
    if (request.useSnmp) {
        core::SnmpGetRequest snmp;
        snmp.ip = result.ip;
        snmp.port = request.snmpPort;
        snmp.timeout = config_.snmpTimeout;

        std::string sysDescr;
        for (const auto& community : request.communities) {
            if (cancelled_) {
                break;
            }
            snmp.community = community;
            snmp.oid = SYS_DESCR_OID;
            auto descr = snmpGetBlocking(transport_, snmp);
            if (descr.success()) {
                result.snmpEnabled = true;
                result.community = community;
                sysDescr = descr.value;
                break;
            }
        }

        if (result.snmpEnabled) {
            ++snmpFound_;

            snmp.oid = SYS_OBJECT_ID_OID;
            auto objectId = snmpGetBlocking(transport_, snmp);
            snmp.oid = SYS_NAME_OID;
            auto name = snmpGetBlocking(transport_, snmp);
            if (name.success() && !name.value.empty()) {
                sysName = name.value;
            }

            auto identity =
                core::identifyDevice(sysDescr, objectId.success() ? objectId.value : "");
            result.vendor = identity.vendor;
            result.deviceType = identity.deviceType;
        } else if (!request.useIcmp) {
            return std::nullopt;
        }
    }

    if (request.resolveHostnames) {
        result.hostname = reverseLookup(address);
    }
    if (!result.hostname) {
        result.hostname = sysName;
    }

    spdlog::debug("Discovered {} ({}, {} {})", result.ip, result.hostname.value_or("-"),
                  result.vendor, result.deviceType);
    return result;
}

std::optional<std::string> DiscoveryScanner::reverseLookup(
    const asio::ip::address_v4& address) const {
    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    asio::error_code ec;
    auto entries = resolver.resolve(asio::ip::tcp::endpoint(address, 0), ec);
    if (ec || entries.empty()) {
        return std::nullopt;
    }
    auto name = entries.begin()->host_name();
    if (name.empty() || name == address.to_string()) {
        return std::nullopt;
    }
    return name;
}

std::optional<core::ImportReport> DiscoveryScanner::importDiscovered(
    const std::vector<core::DiscoveryResult>& results, const core::ImportOptions& options,
    core::INodeStore& store) {
    auto target = store.findGroup(options.targetGroupId);
    if (!target) {
        spdlog::error("Import target group {} does not exist", options.targetGroupId);
        return std::nullopt;
    }

    core::ImportReport report;
    for (const auto& result : results) {
        const bool answeredPing = result.latencyMs.has_value();
        try {
            if (auto existing = store.findNodeByIp(result.ip)) {
                auto group = store.findGroup(existing->groupId).value_or(core::Group{});
                const auto effective = core::resolveEffective(*existing, group);

                auto node = *existing;
                bool changed = false;
                if (options.useIcmp && answeredPing && !effective.monitorPing) {
                    node.monitorPing = true;
                    changed = true;
                }
                if (options.useSnmp && result.snmpEnabled && !effective.monitorSnmp) {
                    node.monitorSnmp = true;
                    changed = true;
                }
                if (result.snmpEnabled && result.community && !node.snmpCommunity &&
                    *result.community != group.snmpCommunity) {
                    node.snmpCommunity = result.community;
                    changed = true;
                }

                if (changed) {
                    store.updateNode(node);
                    ++report.updated;
                }
                continue;
            }

            core::Node node;
            node.name = result.hostname.value_or(result.ip);
            node.ip = result.ip;
            node.groupId = target->id;
            node.monitorPing = options.useIcmp && answeredPing;
            node.monitorSnmp = options.useSnmp && result.snmpEnabled;
            if (result.snmpEnabled && result.community &&
                *result.community != target->snmpCommunity) {
                node.snmpCommunity = result.community;
            }
            store.createNode(node);
            ++report.imported;
        } catch (const core::ConfigurationError& e) {
            spdlog::warn("Skipping discovered device {}: {}", result.ip, e.what());
        }
    }

    report.skipped = static_cast<int>(results.size()) - report.imported - report.updated;
    spdlog::info("Imported discovery results into '{}': {} new, {} updated, {} skipped",
                 target->name, report.imported, report.updated, report.skipped);
    return report;
}

} // namespace beamstate::monitor
