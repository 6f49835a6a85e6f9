#include "app/Application.hpp"

#include "infrastructure/notifications/LogNotifier.hpp"
#include "infrastructure/notifications/PushoverNotifier.hpp"
#include "monitor/CidrRange.hpp"

#include <QCommandLineParser>
#include <QStandardPaths>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>

namespace beamstate::app {

namespace {

constexpr int DISCOVERY_POLL_MS = 500;

monitor::ThrottlerConfig throttlerConfig(const infra::AppConfig& config) {
    monitor::ThrottlerConfig result;
    result.stormThreshold = config.stormThreshold;
    result.window = std::chrono::seconds(config.stormWindowSeconds);
    result.stormCooldown = std::chrono::seconds(config.stormCooldownSeconds);
    result.defaultPriority = config.defaultPriority;
    result.stormPriority = config.stormPriority;
    result.metricCooldown = std::chrono::seconds(config.metricCooldownSeconds);
    return result;
}

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json errorReply(const std::string& message) {
    return {{"ok", false}, {"error", message}};
}

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("BeamState");
    qtApp_->setApplicationVersion(BEAMSTATE_VERSION);
    qtApp_->setOrganizationName("BeamState");

    parseArguments();
    if (clientCommand_ || pushoverToken_ || pushoverUser_) {
        return;
    }

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    shutdown();
}

void Application::parseArguments() {
    QCommandLineParser parser;
    parser.setApplicationDescription("BeamState network monitoring daemon");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDirOption(
        {"c", "config-dir"}, "Configuration and data directory.", "dir",
        QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    QCommandLineOption commandOption(
        "command",
        "Send a command to the running daemon: status, check <id>, maintenance on|off, "
        "scan <cidr> [groupId], trace [limit].",
        "command");
    QCommandLineOption tokenOption("pushover-token", "Store the Pushover application token.",
                                   "token");
    QCommandLineOption userOption("pushover-user", "Store the Pushover user key.", "key");

    parser.addOption(configDirOption);
    parser.addOption(commandOption);
    parser.addOption(tokenOption);
    parser.addOption(userOption);
    parser.process(*qtApp_);

    configDir_ = parser.value(configDirOption).toStdString();
    if (parser.isSet(commandOption)) {
        clientCommand_ = parser.value(commandOption).toStdString();
    }
    if (parser.isSet(tokenOption)) {
        pushoverToken_ = parser.value(tokenOption).toStdString();
    }
    if (parser.isSet(userOption)) {
        pushoverUser_ = parser.value(userOption).toStdString();
    }
}

void Application::initializeLogging() {
    std::filesystem::create_directories(configDir_);

    // Loaded first so the logger can honour its settings; messages go to the default console logger
    config_ = std::make_unique<infra::ConfigManager>(configDir_);
    config_->load();
    const auto& cfg = config_->config();

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (cfg.logToFile) {
        auto logPath = config_->logPath();
        std::filesystem::create_directories(logPath.parent_path());
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), static_cast<size_t>(cfg.logMaxFileSizeMb) * 1024 * 1024,
            static_cast<size_t>(cfg.logMaxFiles));
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("beamstate", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(cfg.logLevel));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("BeamState {} starting...", qtApp_->applicationVersion().toStdString());
    if (cfg.logToFile) {
        spdlog::info("Log file: {}", config_->logPath().string());
    }
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Control channel first: it also refuses a second daemon on the same directory
    control_ = std::make_unique<ControlChannel>(ControlChannel::keyFor(configDir_));
    if (!control_->listen(
            [this](const std::string& request) { return handleControlRequest(request); })) {
        throw std::runtime_error("BeamState is already running for " + configDir_);
    }

    // Database and inventory
    database_ = std::make_shared<infra::Database>(config_->databasePath().string());
    database_->runMigrations();

    inventory_ = std::make_unique<monitor::Inventory>();
    inventoryRepository_ = std::make_unique<infra::InventoryRepository>(database_);
    inventoryRepository_->loadInto(*inventory_);
    inventoryRepository_->attach(*inventory_);
    inventoryRepository_->seedDefaults(*inventory_, cfg.defaultIntervalSeconds);
    sampleRepository_ = std::make_unique<infra::SampleRepository>(database_);

    // Asio pools
    ioContext_ = std::make_unique<infra::AsioContext>("io", static_cast<size_t>(cfg.ioThreads));
    probeContext_ =
        std::make_unique<infra::AsioContext>("probe", static_cast<size_t>(cfg.probeThreads));
    transport_ = std::make_unique<infra::CommandProbeTransport>(*probeContext_);

    // Notification
    if (cfg.pushoverEnabled) {
        infra::PushoverSettings settings;
        settings.apiUrl = cfg.pushoverApiUrl;
        settings.timeoutMs = cfg.pushoverTimeoutMs;
        settings.token = config_->getSecureValue(infra::ConfigManager::PUSHOVER_TOKEN_KEY)
                             .value_or("");
        settings.userKey =
            config_->getSecureValue(infra::ConfigManager::PUSHOVER_USER_KEY).value_or("");
        auto pushover = std::make_unique<infra::PushoverNotifier>(std::move(settings));
        if (!pushover->isConfigured()) {
            spdlog::warn("Pushover is enabled but credentials are missing; use --pushover-token "
                         "and --pushover-user");
        }
        notifier_ = std::move(pushover);
    } else {
        notifier_ = std::make_unique<infra::LogNotifier>();
        spdlog::info("Pushover disabled, alerts are written to the log");
    }

    // Monitoring engine
    statusCache_ = std::make_unique<monitor::StatusCache>();
    traceBus_ = std::make_unique<monitor::TraceBus>(
        static_cast<size_t>(cfg.traceBufferSize), static_cast<size_t>(cfg.traceSubscriberBacklog));

    auto* inventory = inventory_.get();
    throttler_ = std::make_unique<monitor::AlertThrottler>(
        *notifier_, throttlerConfig(cfg), [inventory](int64_t nodeId) -> std::optional<int> {
            auto node = inventory->node(nodeId);
            return node ? node->notificationPriority : std::nullopt;
        });
    throttler_->setMaintenanceMode(cfg.maintenanceMode);

    const auto probeTimeout = std::chrono::milliseconds(cfg.probeTimeoutMs);
    collector_ = std::make_unique<monitor::MetricCollector>(*transport_, *statusCache_,
                                                            sampleRepository_.get(), probeTimeout);
    auto* throttler = throttler_.get();
    collector_->setBreachListener(
        [throttler](const core::MetricBreach& breach) { throttler->onMetricBreach(breach); });

    monitor::SchedulerConfig schedulerConfig;
    schedulerConfig.probeTimeout = probeTimeout;
    schedulerConfig.maxRetries = cfg.maxRetries;
    scheduler_ = std::make_unique<monitor::Scheduler>(ioContext_->getContext(), *inventory_,
                                                      *transport_, *statusCache_, *traceBus_,
                                                      *collector_, schedulerConfig);

    monitor::DiscoveryConfig discoveryConfig;
    discoveryConfig.workerCount = cfg.discoveryWorkers;
    discoveryConfig.pingTimeout = std::chrono::milliseconds(cfg.discoveryPingTimeoutMs);
    discoveryConfig.snmpTimeout = std::chrono::milliseconds(cfg.discoverySnmpTimeoutMs);
    discoveryConfig.maxHosts = static_cast<size_t>(cfg.discoveryMaxHosts);
    discovery_ = std::make_unique<monitor::DiscoveryScanner>(*transport_, discoveryConfig);

    discoveryTimer_.setInterval(DISCOVERY_POLL_MS);
    QObject::connect(&discoveryTimer_, &QTimer::timeout, [this]() { pollDiscovery(); });
    QObject::connect(&cleanupTimer_, &QTimer::timeout, [this]() { performCleanup(); });

    spdlog::info("Application components initialized: {} groups, {} nodes",
                 inventory_->groups().size(), inventory_->nodes().size());
}

void Application::installSignalHandlers() {
    signals_ = std::make_unique<asio::signal_set>(ioContext_->getContext(), SIGINT, SIGTERM);
    signals_->async_wait([](const asio::error_code& ec, int signal) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down", signal);
        QMetaObject::invokeMethod(
            QCoreApplication::instance(), []() { QCoreApplication::quit(); },
            Qt::QueuedConnection);
    });
}

void Application::startMonitoring() {
    const auto& cfg = config_->config();

    ioContext_->start();
    probeContext_->start();
    installSignalHandlers();

    throttler_->attach(*traceBus_);
    scheduler_->start();

    for (const auto& startup : cfg.startupScans) {
        PendingScan scan;
        scan.request.cidr = startup.cidr;
        scan.request.useIcmp = startup.useIcmp;
        scan.request.useSnmp = startup.useSnmp;
        scan.request.resolveHostnames = startup.resolveHostnames;
        scan.request.communities = cfg.discoveryCommunities;
        scan.importGroupId = startup.importGroupId;
        queueScan(std::move(scan));
    }

    if (cfg.autoCleanup) {
        performCleanup();
        cleanupTimer_.start(std::chrono::hours(cfg.cleanupIntervalHours));
    }
}

int Application::run() {
    if (pushoverToken_ || pushoverUser_) {
        return storeCredentials();
    }
    if (clientCommand_) {
        return runClient();
    }

    startMonitoring();
    int code = qtApp_->exec();
    shutdown();
    return code;
}

int Application::runClient() {
    if (!parseControlCommand(*clientCommand_)) {
        std::cerr << "Unknown command: " << *clientCommand_ << '\n';
        return 2;
    }

    auto reply = ControlChannel::request(ControlChannel::keyFor(configDir_), *clientCommand_);
    if (!reply) {
        std::cerr << "BeamState is not running for " << configDir_ << '\n';
        return 1;
    }

    std::cout << *reply << '\n';
    auto parsed = nlohmann::json::parse(*reply, nullptr, false);
    return (!parsed.is_discarded() && parsed.value("ok", false)) ? 0 : 1;
}

int Application::storeCredentials() {
    std::filesystem::create_directories(configDir_);
    config_ = std::make_unique<infra::ConfigManager>(configDir_);
    config_->load();

    bool stored = true;
    if (pushoverToken_) {
        stored = config_->setSecureValue(infra::ConfigManager::PUSHOVER_TOKEN_KEY, *pushoverToken_) &&
                 stored;
    }
    if (pushoverUser_) {
        stored = config_->setSecureValue(infra::ConfigManager::PUSHOVER_USER_KEY, *pushoverUser_) &&
                 stored;
    }

    if (!stored) {
        spdlog::error("Failed to store Pushover credentials");
        return 1;
    }
    spdlog::info("Pushover credentials stored in {}", config_->configPath().string());
    return 0;
}

std::string Application::handleControlRequest(const std::string& request) {
    auto command = parseControlCommand(request);
    if (!command) {
        return errorReply("unknown command: " + request).dump();
    }

    spdlog::info("Control command: {}", formatControlCommand(*command));

    nlohmann::json reply{{"ok", true}};
    switch (command->type) {
    case ControlCommand::Type::Status:
        return statusReport();

    case ControlCommand::Type::Check:
        if (!scheduler_->triggerImmediateCheck(command->nodeId)) {
            return errorReply("node " + std::to_string(command->nodeId) +
                              " is not scheduled or already being checked")
                .dump();
        }
        reply["node_id"] = command->nodeId;
        break;

    case ControlCommand::Type::Maintenance:
        throttler_->setMaintenanceMode(command->enabled);
        config_->config().maintenanceMode = command->enabled;
        if (!config_->save()) {
            spdlog::warn("Maintenance mode changed but could not be saved");
        }
        reply["maintenance"] = command->enabled;
        break;

    case ControlCommand::Type::Scan: {
        if (!monitor::CidrRange::parse(command->cidr)) {
            return errorReply("invalid CIDR range: " + command->cidr).dump();
        }
        if (command->groupId > 0 && !inventory_->group(command->groupId)) {
            return errorReply("group " + std::to_string(command->groupId) + " does not exist")
                .dump();
        }
        PendingScan scan;
        scan.request.cidr = command->cidr;
        scan.request.communities = config_->config().discoveryCommunities;
        scan.importGroupId = command->groupId;
        queueScan(std::move(scan));
        reply["queued"] = scanQueue_.size() + (activeScan_ ? 1 : 0);
        break;
    }

    case ControlCommand::Type::Trace: {
        auto events = nlohmann::json::array();
        for (const auto& event : traceBus_->recent(command->limit)) {
            events.push_back(event.toJson());
        }
        reply["events"] = std::move(events);
        break;
    }
    }
    return reply.dump();
}

std::string Application::statusReport() const {
    auto statuses = statusCache_->snapshotAll();

    auto nodes = nlohmann::json::array();
    for (const auto& node : inventory_->nodes()) {
        nlohmann::json entry{{"id", node.id}, {"name", node.name}, {"ip", node.ip}};
        auto it = statuses.find(node.id);
        if (it == statuses.end()) {
            entry["status"] = core::statusToString(core::NodeStatus::Waiting);
        } else {
            const auto& record = it->second;
            entry["status"] = core::statusToString(record.status);
            entry["consecutive_failures"] = record.consecutiveFailures;
            if (record.lastLatencyMs) {
                entry["latency_ms"] = *record.lastLatencyMs;
            }
            if (record.lastPacketLoss) {
                entry["packet_loss"] = *record.lastPacketLoss;
            }
            if (record.lastCheck) {
                entry["last_check_ms"] = toEpochMs(*record.lastCheck);
            }
        }
        nodes.push_back(std::move(entry));
    }

    auto progress = discovery_->progress();
    nlohmann::json reply{
        {"ok", true},
        {"nodes", std::move(nodes)},
        {"scheduled_loops", scheduler_->loopCount()},
        {"alerts",
         {{"maintenance", throttler_->maintenanceMode()},
          {"storm", throttler_->inStorm()},
          {"window_count", throttler_->windowCount()}}},
        {"discovery",
         {{"running", progress.running},
          {"scanned", progress.scanned},
          {"total", progress.total},
          {"icmp_found", progress.icmpFound},
          {"snmp_found", progress.snmpFound},
          {"queued", scanQueue_.size()}}},
    };
    return reply.dump();
}

void Application::queueScan(PendingScan scan) {
    spdlog::info("Discovery scan of {} queued", scan.request.cidr);
    scanQueue_.push_back(std::move(scan));
    if (!discoveryTimer_.isActive()) {
        discoveryTimer_.start();
    }
    pollDiscovery();
}

void Application::pollDiscovery() {
    if (activeScan_) {
        if (discovery_->isRunning()) {
            return;
        }

        auto results = discovery_->results();
        if (activeScan_->importGroupId > 0) {
            core::ImportOptions options;
            options.targetGroupId = activeScan_->importGroupId;
            options.useIcmp = activeScan_->request.useIcmp;
            options.useSnmp = activeScan_->request.useSnmp;
            auto report = monitor::DiscoveryScanner::importDiscovered(results, options, *inventory_);
            if (report) {
                spdlog::info("Imported scan of {}: {} new, {} updated, {} unchanged",
                             activeScan_->request.cidr, report->imported, report->updated,
                             report->skipped);
            } else {
                spdlog::warn("Import target group {} no longer exists",
                             activeScan_->importGroupId);
            }
        }
        activeScan_.reset();
    }

    while (!scanQueue_.empty()) {
        auto next = std::move(scanQueue_.front());
        scanQueue_.pop_front();

        auto result = discovery_->start(next.request);
        if (result == monitor::ScanStartResult::Started) {
            activeScan_ = std::move(next);
            return;
        }
        spdlog::warn("Discovery scan of {} not started: {}", next.request.cidr,
                     monitor::scanStartResultToString(result));
    }

    discoveryTimer_.stop();
}

void Application::performCleanup() {
    try {
        sampleRepository_->cleanup(config_->config().dataRetentionDays);
    } catch (const std::exception& e) {
        spdlog::error("Sample cleanup failed: {}", e.what());
    }
}

void Application::shutdown() {
    if (shutDown_ || !scheduler_) {
        return;
    }
    shutDown_ = true;
    spdlog::info("Application shutting down...");

    discoveryTimer_.stop();
    cleanupTimer_.stop();
    discovery_->cancel();
    discovery_->wait();

    scheduler_->stop();
    throttler_->stop();
    if (signals_) {
        asio::error_code ec;
        signals_->cancel(ec);
    }

    probeContext_->stop();
    ioContext_->stop();

    inventoryRepository_->detach();
    control_.reset();
    spdlog::info("Shutdown complete");
}

} // namespace beamstate::app
