#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace pingscope::infra;
using namespace pingscope::core;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "pingscope_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void writeConfig(const std::string& content) const {
        std::ofstream file(configDir_ / "config.json");
        file << content;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "pingscope_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::exists(tempPath));
        REQUIRE(std::filesystem::is_directory(tempPath));

        std::filesystem::remove_all(tempPath);
    }

    SECTION("Paths live under the config directory") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
        REQUIRE(manager.logPath() == testDir.path() / "logs" / "pingscope.log");
        REQUIRE(manager.configDir() == testDir.path().string());
    }
}

TEST_CASE("ConfigManager defaults", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Loading without a file writes defaults") {
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));
    }

    SECTION("Default values") {
        const auto& config = manager.config();
        REQUIRE(config.timeDisplay == TimeZoneMode::Local);
        REQUIRE(config.logLevel == "info");
        REQUIRE(config.apiBaseUrl == "http://localhost:8000/api");
        REQUIRE(config.widgetId == 0);
        REQUIRE(config.pingIntervalSeconds == 60);
        REQUIRE(config.fallbackIntervalSeconds == 30);
        REQUIRE(config.display == ThresholdConfig{});
        REQUIRE(config.compactCardThreshold == 3);
    }
}

TEST_CASE("ConfigManager save and load", "[ConfigManager]") {
    TestConfigDir testDir;

    {
        ConfigManager manager(testDir.path());
        auto& config = manager.config();
        config.timeDisplay = TimeZoneMode::Utc;
        config.logLevel = "debug";
        config.apiBaseUrl = "https://dash.example.org/api";
        config.widgetId = 42;
        config.requestTimeoutMs = 2500;
        config.pingIntervalSeconds = 15;
        config.fallbackIntervalSeconds = 90;
        config.display.latencyWarningMs = 50.0;
        config.display.latencyCriticalMs = 150.0;
        config.display.showStatistics = false;
        config.display.historyHours = 6;
        config.compactCardThreshold = 5;
        config.windowWidth = 800;
        config.windowMaximized = true;
        REQUIRE(manager.save());
    }

    ConfigManager reloaded(testDir.path());
    REQUIRE(reloaded.load());
    const auto& config = reloaded.config();

    REQUIRE(config.timeDisplay == TimeZoneMode::Utc);
    REQUIRE(config.logLevel == "debug");
    REQUIRE(config.apiBaseUrl == "https://dash.example.org/api");
    REQUIRE(config.widgetId == 42);
    REQUIRE(config.requestTimeoutMs == 2500);
    REQUIRE(config.pingIntervalSeconds == 15);
    REQUIRE(config.fallbackIntervalSeconds == 90);
    REQUIRE(config.display.latencyWarningMs == 50.0);
    REQUIRE(config.display.latencyCriticalMs == 150.0);
    REQUIRE_FALSE(config.display.showStatistics);
    REQUIRE(config.display.historyHours == 6);
    REQUIRE(config.compactCardThreshold == 5);
    REQUIRE(config.windowWidth == 800);
    REQUIRE(config.windowMaximized);
}

TEST_CASE("ConfigManager tolerates bad files", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Inverted thresholds fall back to defaults") {
        testDir.writeConfig(R"({"display": {"latency_warning_ms": 500,
                                            "latency_critical_ms": 100,
                                            "compact_card_threshold": 4}})");
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(manager.config().display == ThresholdConfig{});
        REQUIRE(manager.config().compactCardThreshold == 4);
    }

    SECTION("Missing sections keep defaults") {
        testDir.writeConfig(R"({"api": {"widget_id": 9}})");
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(manager.config().widgetId == 9);
        REQUIRE(manager.config().apiBaseUrl == "http://localhost:8000/api");
        REQUIRE(manager.config().pingIntervalSeconds == 60);
    }

    SECTION("Unknown time display reads as local") {
        testDir.writeConfig(R"({"general": {"time_display": "mars"}})");
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(manager.config().timeDisplay == TimeZoneMode::Local);
    }

    SECTION("Corrupt JSON fails to load") {
        testDir.writeConfig("{ not json");
        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager secure values", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Token survives a reload without being stored in clear text") {
        {
            ConfigManager manager(testDir.path());
            manager.setSecureValue(ConfigManager::API_TOKEN_KEY, "s3cr3t-token");
            REQUIRE(manager.getSecureValue(ConfigManager::API_TOKEN_KEY) ==
                    std::string("s3cr3t-token"));
        }

        std::ifstream file(testDir.path() / "config.json");
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        REQUIRE(content.find("s3cr3t-token") == std::string::npos);

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.getSecureValue(ConfigManager::API_TOKEN_KEY) ==
                std::string("s3cr3t-token"));
    }

    SECTION("Empty value removes the key") {
        ConfigManager manager(testDir.path());
        manager.setSecureValue(ConfigManager::API_TOKEN_KEY, "abc");
        manager.setSecureValue(ConfigManager::API_TOKEN_KEY, "");

        REQUIRE_FALSE(manager.getSecureValue(ConfigManager::API_TOKEN_KEY).has_value());
    }

    SECTION("Unknown key") {
        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.getSecureValue("missing").has_value());
    }
}

TEST_CASE("Time display names", "[ConfigManager]") {
    REQUIRE(timeDisplayToString(TimeZoneMode::Utc) == "utc");
    REQUIRE(timeDisplayToString(TimeZoneMode::Local) == "local");
    REQUIRE(timeDisplayFromString("utc") == TimeZoneMode::Utc);
    REQUIRE(timeDisplayFromString("local") == TimeZoneMode::Local);
}
