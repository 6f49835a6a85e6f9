#pragma once

#include "infrastructure/crypto/SecureStorage.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace beamstate::infra {

/**
 * @brief A discovery scan run once at startup.
 */
struct StartupScan {
    std::string cidr;
    bool useIcmp{true};
    bool useSnmp{true};
    bool resolveHostnames{false};
    int64_t importGroupId{0}; ///< Group to import results into; 0 keeps them unimported

    bool operator==(const StartupScan& other) const = default;
};

/**
 * @brief Deployment configuration.
 */
struct AppConfig {
    // Monitoring
    int probeTimeoutMs{5000};          ///< Hard bound of every probe.
    int maxRetries{3};                 ///< Consecutive failures before DOWN.
    int ioThreads{4};                  ///< Size of the shared I/O pool.
    int probeThreads{8};               ///< Concurrent ping/snmpget processes.
    int defaultIntervalSeconds{60};    ///< Interval of the seeded default group.

    // Alerts
    int stormThreshold{5};             ///< DOWN transitions that start an alert storm.
    int stormWindowSeconds{60};        ///< Sliding window for counting DOWN transitions.
    int stormCooldownSeconds{60};      ///< Time below threshold before a storm ends.
    int defaultPriority{0};            ///< Priority of individual alerts without override.
    int stormPriority{1};              ///< Priority of the aggregated storm alert.
    int metricCooldownSeconds{60};     ///< Minimum gap between alerts of one metric series.
    bool maintenanceMode{false};       ///< Suppress every notification.

    // Pushover
    bool pushoverEnabled{false};
    std::string pushoverApiUrl{"https://api.pushover.net/1/messages.json"};
    int pushoverTimeoutMs{10000};

    // Trace bus
    int traceBufferSize{500};
    int traceSubscriberBacklog{100};

    // Discovery
    int discoveryWorkers{16};
    int discoveryPingTimeoutMs{1000};
    int discoverySnmpTimeoutMs{1500};
    int discoveryMaxHosts{65534};
    std::vector<std::string> discoveryCommunities{"public"};
    std::vector<StartupScan> startupScans;

    // Data retention
    int dataRetentionDays{30};
    bool autoCleanup{true};
    int cleanupIntervalHours{24};

    // Logging
    std::string logLevel{"info"};
    bool logToFile{true};
    int logMaxFileSizeMb{5};
    int logMaxFiles{3};
};

/**
 * @brief Loads, validates and saves config.json in the configuration directory.
 *
 * Sections missing from the file keep their defaults. Out-of-range values are
 * clamped and logged. Pushover credentials are kept sealed in the "secure"
 * section.
 */
class ConfigManager {
public:
    static constexpr const char* PUSHOVER_TOKEN_KEY = "pushover_token";
    static constexpr const char* PUSHOVER_USER_KEY = "pushover_user";

    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if the file does not exist.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Seals and stores a secret, then saves.
     * @return False if the secret could not be sealed or saved.
     */
    bool setSecureValue(const std::string& key, const std::string& value);

    /**
     * @brief Returns a stored secret.
     * @return The secret, or nullopt if missing or unreadable.
     */
    std::optional<std::string> getSecureValue(const std::string& key) const;

    std::filesystem::path configPath() const { return configPath_; }
    std::filesystem::path databasePath() const;
    std::filesystem::path logPath() const;
    const std::filesystem::path& configDir() const { return configDir_; }

    /**
     * @brief Clamps every value into its valid range.
     * @return Number of values that were adjusted.
     */
    static int validate(AppConfig& config);

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
    std::unique_ptr<SecureStorage> secureStorage_;
    nlohmann::json secureValues_ = nlohmann::json::object();
};

} // namespace beamstate::infra
