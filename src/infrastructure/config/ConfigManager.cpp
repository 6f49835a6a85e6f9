#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace beamstate::infra {

namespace {

const std::vector<std::string> LOG_LEVELS{"trace", "debug", "info", "warn", "error", "critical", "off"};

int clampValue(int& value, int low, int high, const char* name) {
    const int clamped = std::clamp(value, low, high);
    if (clamped == value) {
        return 0;
    }
    spdlog::warn("Config value {}={} out of range, using {}", name, value, clamped);
    value = clamped;
    return 1;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
    secureStorage_ = std::make_unique<SecureStorage>(configDir_ / ".key");
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, writing defaults to {}", configPath_.string());
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

int ConfigManager::validate(AppConfig& c) {
    int adjusted = 0;
    adjusted += clampValue(c.probeTimeoutMs, 100, 60000, "monitoring.probe_timeout_ms");
    adjusted += clampValue(c.maxRetries, 1, 100, "monitoring.max_retries");
    adjusted += clampValue(c.ioThreads, 1, 64, "monitoring.io_threads");
    adjusted += clampValue(c.probeThreads, 1, 256, "monitoring.probe_threads");
    adjusted += clampValue(c.defaultIntervalSeconds, 1, 86400, "monitoring.default_interval_seconds");

    adjusted += clampValue(c.stormThreshold, 1, 10000, "alerts.storm_threshold");
    adjusted += clampValue(c.stormWindowSeconds, 1, 86400, "alerts.storm_window_seconds");
    adjusted += clampValue(c.stormCooldownSeconds, 0, 86400, "alerts.storm_cooldown_seconds");
    adjusted += clampValue(c.defaultPriority, -2, 2, "alerts.default_priority");
    adjusted += clampValue(c.stormPriority, -2, 2, "alerts.storm_priority");
    adjusted += clampValue(c.metricCooldownSeconds, 0, 86400, "alerts.metric_cooldown_seconds");

    adjusted += clampValue(c.pushoverTimeoutMs, 1000, 120000, "pushover.timeout_ms");

    adjusted += clampValue(c.traceBufferSize, 1, 100000, "trace.buffer_size");
    adjusted += clampValue(c.traceSubscriberBacklog, 1, 100000, "trace.subscriber_backlog");

    adjusted += clampValue(c.discoveryWorkers, 1, 256, "discovery.workers");
    adjusted += clampValue(c.discoveryPingTimeoutMs, 100, 30000, "discovery.ping_timeout_ms");
    adjusted += clampValue(c.discoverySnmpTimeoutMs, 100, 30000, "discovery.snmp_timeout_ms");
    adjusted += clampValue(c.discoveryMaxHosts, 1, 65534, "discovery.max_hosts");
    if (c.discoveryCommunities.empty()) {
        spdlog::warn("Config value discovery.communities is empty, using \"public\"");
        c.discoveryCommunities = {"public"};
        ++adjusted;
    }

    adjusted += clampValue(c.dataRetentionDays, 1, 3650, "data.retention_days");
    adjusted += clampValue(c.cleanupIntervalHours, 1, 720, "data.cleanup_interval_hours");

    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), c.logLevel) == LOG_LEVELS.end()) {
        spdlog::warn("Config value logging.level='{}' unknown, using info", c.logLevel);
        c.logLevel = "info";
        ++adjusted;
    }
    adjusted += clampValue(c.logMaxFileSizeMb, 1, 1024, "logging.max_file_size_mb");
    adjusted += clampValue(c.logMaxFiles, 1, 100, "logging.max_files");
    return adjusted;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Monitoring
    j["monitoring"]["probe_timeout_ms"] = config_.probeTimeoutMs;
    j["monitoring"]["max_retries"] = config_.maxRetries;
    j["monitoring"]["io_threads"] = config_.ioThreads;
    j["monitoring"]["probe_threads"] = config_.probeThreads;
    j["monitoring"]["default_interval_seconds"] = config_.defaultIntervalSeconds;

    // Alerts
    j["alerts"]["storm_threshold"] = config_.stormThreshold;
    j["alerts"]["storm_window_seconds"] = config_.stormWindowSeconds;
    j["alerts"]["storm_cooldown_seconds"] = config_.stormCooldownSeconds;
    j["alerts"]["default_priority"] = config_.defaultPriority;
    j["alerts"]["storm_priority"] = config_.stormPriority;
    j["alerts"]["metric_cooldown_seconds"] = config_.metricCooldownSeconds;
    j["alerts"]["maintenance_mode"] = config_.maintenanceMode;

    // Pushover
    j["pushover"]["enabled"] = config_.pushoverEnabled;
    j["pushover"]["api_url"] = config_.pushoverApiUrl;
    j["pushover"]["timeout_ms"] = config_.pushoverTimeoutMs;

    // Trace bus
    j["trace"]["buffer_size"] = config_.traceBufferSize;
    j["trace"]["subscriber_backlog"] = config_.traceSubscriberBacklog;

    // Discovery
    j["discovery"]["workers"] = config_.discoveryWorkers;
    j["discovery"]["ping_timeout_ms"] = config_.discoveryPingTimeoutMs;
    j["discovery"]["snmp_timeout_ms"] = config_.discoverySnmpTimeoutMs;
    j["discovery"]["max_hosts"] = config_.discoveryMaxHosts;
    j["discovery"]["communities"] = config_.discoveryCommunities;
    j["discovery"]["startup_scans"] = nlohmann::json::array();
    for (const auto& scan : config_.startupScans) {
        j["discovery"]["startup_scans"].push_back({{"cidr", scan.cidr},
                                                   {"use_icmp", scan.useIcmp},
                                                   {"use_snmp", scan.useSnmp},
                                                   {"resolve_hostnames", scan.resolveHostnames},
                                                   {"import_group_id", scan.importGroupId}});
    }

    // Data retention
    j["data"]["retention_days"] = config_.dataRetentionDays;
    j["data"]["auto_cleanup"] = config_.autoCleanup;
    j["data"]["cleanup_interval_hours"] = config_.cleanupIntervalHours;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logToFile;
    j["logging"]["max_file_size_mb"] = config_.logMaxFileSizeMb;
    j["logging"]["max_files"] = config_.logMaxFiles;

    // Sealed secrets
    if (!secureValues_.empty()) {
        j["secure"] = secureValues_;
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        config_.probeTimeoutMs = m.value("probe_timeout_ms", defaults.probeTimeoutMs);
        config_.maxRetries = m.value("max_retries", defaults.maxRetries);
        config_.ioThreads = m.value("io_threads", defaults.ioThreads);
        config_.probeThreads = m.value("probe_threads", defaults.probeThreads);
        config_.defaultIntervalSeconds =
            m.value("default_interval_seconds", defaults.defaultIntervalSeconds);
    }

    if (j.contains("alerts")) {
        const auto& a = j["alerts"];
        config_.stormThreshold = a.value("storm_threshold", defaults.stormThreshold);
        config_.stormWindowSeconds = a.value("storm_window_seconds", defaults.stormWindowSeconds);
        config_.stormCooldownSeconds =
            a.value("storm_cooldown_seconds", defaults.stormCooldownSeconds);
        config_.defaultPriority = a.value("default_priority", defaults.defaultPriority);
        config_.stormPriority = a.value("storm_priority", defaults.stormPriority);
        config_.metricCooldownSeconds =
            a.value("metric_cooldown_seconds", defaults.metricCooldownSeconds);
        config_.maintenanceMode = a.value("maintenance_mode", defaults.maintenanceMode);
    }

    if (j.contains("pushover")) {
        const auto& p = j["pushover"];
        config_.pushoverEnabled = p.value("enabled", defaults.pushoverEnabled);
        config_.pushoverApiUrl = p.value("api_url", defaults.pushoverApiUrl);
        config_.pushoverTimeoutMs = p.value("timeout_ms", defaults.pushoverTimeoutMs);
    }

    if (j.contains("trace")) {
        const auto& t = j["trace"];
        config_.traceBufferSize = t.value("buffer_size", defaults.traceBufferSize);
        config_.traceSubscriberBacklog =
            t.value("subscriber_backlog", defaults.traceSubscriberBacklog);
    }

    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        config_.discoveryWorkers = d.value("workers", defaults.discoveryWorkers);
        config_.discoveryPingTimeoutMs = d.value("ping_timeout_ms", defaults.discoveryPingTimeoutMs);
        config_.discoverySnmpTimeoutMs = d.value("snmp_timeout_ms", defaults.discoverySnmpTimeoutMs);
        config_.discoveryMaxHosts = d.value("max_hosts", defaults.discoveryMaxHosts);
        config_.discoveryCommunities = d.value("communities", defaults.discoveryCommunities);

        config_.startupScans.clear();
        if (d.contains("startup_scans") && d["startup_scans"].is_array()) {
            for (const auto& s : d["startup_scans"]) {
                StartupScan scan;
                scan.cidr = s.value("cidr", "");
                scan.useIcmp = s.value("use_icmp", true);
                scan.useSnmp = s.value("use_snmp", true);
                scan.resolveHostnames = s.value("resolve_hostnames", false);
                scan.importGroupId = s.value("import_group_id", int64_t{0});
                if (scan.cidr.empty()) {
                    spdlog::warn("Ignoring startup scan without cidr");
                    continue;
                }
                config_.startupScans.push_back(std::move(scan));
            }
        }
    }

    if (j.contains("data")) {
        const auto& d = j["data"];
        config_.dataRetentionDays = d.value("retention_days", defaults.dataRetentionDays);
        config_.autoCleanup = d.value("auto_cleanup", defaults.autoCleanup);
        config_.cleanupIntervalHours =
            d.value("cleanup_interval_hours", defaults.cleanupIntervalHours);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = l.value("level", defaults.logLevel);
        config_.logToFile = l.value("file", defaults.logToFile);
        config_.logMaxFileSizeMb = l.value("max_file_size_mb", defaults.logMaxFileSizeMb);
        config_.logMaxFiles = l.value("max_files", defaults.logMaxFiles);
    }

    if (j.contains("secure") && j["secure"].is_object()) {
        secureValues_ = j["secure"];
    }

    validate(config_);
}

bool ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    auto sealed = secureStorage_->seal(value);
    if (sealed.empty()) {
        return false;
    }
    secureValues_[key] = sealed;
    return save();
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) const {
    auto it = secureValues_.find(key);
    if (it == secureValues_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return secureStorage_->open(it->get<std::string>());
}

std::filesystem::path ConfigManager::databasePath() const {
    return configDir_ / "beamstate.db";
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "logs" / "beamstate.log";
}

} // namespace beamstate::infra
