#pragma once

#include "app/ControlChannel.hpp"
#include "app/ControlCommand.hpp"
#include "core/services/INotifier.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/InventoryRepository.hpp"
#include "infrastructure/database/SampleRepository.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/CommandProbeTransport.hpp"
#include "monitor/AlertThrottler.hpp"
#include "monitor/DiscoveryScanner.hpp"
#include "monitor/Inventory.hpp"
#include "monitor/MetricCollector.hpp"
#include "monitor/Scheduler.hpp"
#include "monitor/StatusCache.hpp"
#include "monitor/TraceBus.hpp"

#include <QCoreApplication>
#include <QTimer>

#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace beamstate::app {

/**
 * @brief Headless monitoring daemon: owns every component and the Qt event loop.
 *
 * Started with --command, it instead forwards one control command to the
 * running daemon and prints the reply.
 */
class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    infra::ConfigManager& config() { return *config_; }
    infra::Database& database() { return *database_; }
    monitor::Inventory& inventory() { return *inventory_; }
    monitor::Scheduler& scheduler() { return *scheduler_; }
    monitor::AlertThrottler& throttler() { return *throttler_; }
    monitor::TraceBus& traceBus() { return *traceBus_; }
    monitor::DiscoveryScanner& discoveryScanner() { return *discovery_; }

private:
    struct PendingScan {
        core::ScanRequest request;
        int64_t importGroupId{0};
    };

    void parseArguments();
    void initializeLogging();
    void initializeComponents();
    void installSignalHandlers();
    void startMonitoring();
    void shutdown();

    int runClient();
    int storeCredentials();

    std::string handleControlRequest(const std::string& request);
    std::string statusReport() const;
    void queueScan(PendingScan scan);
    void pollDiscovery();
    void performCleanup();

    std::unique_ptr<QCoreApplication> qtApp_;
    std::string configDir_;
    std::optional<std::string> clientCommand_;
    std::optional<std::string> pushoverToken_;
    std::optional<std::string> pushoverUser_;

    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<ControlChannel> control_;
    std::shared_ptr<infra::Database> database_;
    std::unique_ptr<monitor::Inventory> inventory_;
    std::unique_ptr<infra::InventoryRepository> inventoryRepository_;
    std::unique_ptr<infra::SampleRepository> sampleRepository_;

    std::unique_ptr<infra::AsioContext> ioContext_;
    std::unique_ptr<infra::AsioContext> probeContext_;
    std::unique_ptr<infra::CommandProbeTransport> transport_;
    std::unique_ptr<asio::signal_set> signals_;

    std::unique_ptr<monitor::StatusCache> statusCache_;
    std::unique_ptr<monitor::TraceBus> traceBus_;
    std::unique_ptr<core::INotifier> notifier_;
    std::unique_ptr<monitor::AlertThrottler> throttler_;
    std::unique_ptr<monitor::MetricCollector> collector_;
    std::unique_ptr<monitor::Scheduler> scheduler_;
    std::unique_ptr<monitor::DiscoveryScanner> discovery_;

    std::deque<PendingScan> scanQueue_;
    std::optional<PendingScan> activeScan_;
    QTimer discoveryTimer_;
    QTimer cleanupTimer_;
    bool shutDown_{false};
};

} // namespace beamstate::app
