#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"
#include "support/TestData.hpp"

#include <fstream>
#include <iterator>

using namespace beamstate::infra;
using beamstate::test::TempDir;

namespace {

void writeConfig(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

} // namespace

TEST_CASE("ConfigManager paths", "[ConfigManager]") {
    TempDir dir("beamstate_config_paths");

    SECTION("Creates the directory if it does not exist") {
        auto nested = dir.path() / "nested" / "config";
        ConfigManager manager(nested);
        CHECK(std::filesystem::is_directory(nested));
    }

    SECTION("File locations") {
        ConfigManager manager(dir.path());
        CHECK(manager.configPath() == dir.path() / "config.json");
        CHECK(manager.databasePath() == dir.path() / "beamstate.db");
        CHECK(manager.logPath() == dir.path() / "logs" / "beamstate.log");
    }
}

TEST_CASE("ConfigManager load and save", "[ConfigManager]") {
    TempDir dir("beamstate_config_load");

    SECTION("Missing file is written with defaults") {
        ConfigManager manager(dir.path());
        REQUIRE(manager.load());
        CHECK(std::filesystem::exists(manager.configPath()));
        CHECK(manager.config().stormThreshold == 5);
        CHECK(manager.config().maxRetries == 3);
        CHECK(manager.config().discoveryCommunities == std::vector<std::string>{"public"});
    }

    SECTION("Saved values survive a reload") {
        {
            ConfigManager manager(dir.path());
            manager.config().stormThreshold = 8;
            manager.config().maintenanceMode = true;
            manager.config().discoveryCommunities = {"public", "monitor"};
            manager.config().startupScans.push_back({"10.0.0.0/24", true, false, false, 2});
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(dir.path());
        REQUIRE(reloaded.load());
        const auto& config = reloaded.config();
        CHECK(config.stormThreshold == 8);
        CHECK(config.maintenanceMode);
        CHECK(config.discoveryCommunities.size() == 2);
        REQUIRE(config.startupScans.size() == 1);
        CHECK(config.startupScans[0] == StartupScan{"10.0.0.0/24", true, false, false, 2});
    }

    SECTION("Missing sections keep their defaults") {
        writeConfig(dir.path() / "config.json", R"({"alerts": {"storm_threshold": 12}})");

        ConfigManager manager(dir.path());
        REQUIRE(manager.load());
        CHECK(manager.config().stormThreshold == 12);
        CHECK(manager.config().stormWindowSeconds == 60);
        CHECK(manager.config().probeTimeoutMs == 5000);
    }

    SECTION("Malformed file fails to load") {
        writeConfig(dir.path() / "config.json", "{ not json");

        ConfigManager manager(dir.path());
        CHECK_FALSE(manager.load());
    }

    SECTION("Startup scans without cidr are dropped") {
        writeConfig(dir.path() / "config.json",
                    R"({"discovery": {"startup_scans": [{"use_snmp": false}, {"cidr": "10.1.0.0/28"}]}})");

        ConfigManager manager(dir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().startupScans.size() == 1);
        CHECK(manager.config().startupScans[0].cidr == "10.1.0.0/28");
    }
}

TEST_CASE("ConfigManager validation", "[ConfigManager]") {
    SECTION("Defaults are valid") {
        AppConfig config;
        CHECK(ConfigManager::validate(config) == 0);
    }

    SECTION("Out-of-range values are clamped") {
        AppConfig config;
        config.maxRetries = 0;
        config.defaultPriority = 7;
        config.stormPriority = -5;
        config.probeTimeoutMs = 10;
        config.discoveryMaxHosts = 1000000;

        CHECK(ConfigManager::validate(config) == 5);
        CHECK(config.maxRetries == 1);
        CHECK(config.defaultPriority == 2);
        CHECK(config.stormPriority == -2);
        CHECK(config.probeTimeoutMs == 100);
        CHECK(config.discoveryMaxHosts == 65534);
    }

    SECTION("Unknown log level falls back to info") {
        AppConfig config;
        config.logLevel = "verbose";
        CHECK(ConfigManager::validate(config) == 1);
        CHECK(config.logLevel == "info");
    }

    SECTION("Empty community list is replaced") {
        AppConfig config;
        config.discoveryCommunities.clear();
        ConfigManager::validate(config);
        CHECK(config.discoveryCommunities == std::vector<std::string>{"public"});
    }
}

TEST_CASE("ConfigManager secure values", "[ConfigManager]") {
    TempDir dir("beamstate_config_secure");

    {
        ConfigManager manager(dir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.setSecureValue(ConfigManager::PUSHOVER_TOKEN_KEY, "azGDORePK8gMaC0QOYAMyEEuzJnyUi"));
        CHECK(manager.getSecureValue(ConfigManager::PUSHOVER_TOKEN_KEY) ==
              "azGDORePK8gMaC0QOYAMyEEuzJnyUi");
        CHECK_FALSE(manager.getSecureValue(ConfigManager::PUSHOVER_USER_KEY).has_value());
    }

    SECTION("Secrets are not stored in clear text") {
        std::ifstream file(dir.path() / "config.json");
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        CHECK(content.find("azGDORePK8gMaC0QOYAMyEEuzJnyUi") == std::string::npos);
        CHECK(content.find("bs1:") != std::string::npos);
    }

    SECTION("Secrets survive a reload") {
        ConfigManager reloaded(dir.path());
        REQUIRE(reloaded.load());
        CHECK(reloaded.getSecureValue(ConfigManager::PUSHOVER_TOKEN_KEY) ==
              "azGDORePK8gMaC0QOYAMyEEuzJnyUi");
    }
}
