#pragma once

#include "core/graph/TimeWindow.hpp"
#include "core/types/ThresholdConfig.hpp"
#include "infrastructure/crypto/SecureStorage.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pingscope::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the backend connection, polling cadence, display defaults and
 * window state. Display thresholds are used until the first widget payload
 * supplies its own.
 */
struct AppConfig {
    // General settings
    core::TimeZoneMode timeDisplay{core::TimeZoneMode::Local}; ///< Timestamps in local time or UTC.
    std::string logLevel{"info"};  ///< spdlog level name.

    // Backend
    std::string apiBaseUrl{"http://localhost:8000/api"}; ///< Dashboard API base URL.
    int64_t widgetId{0};           ///< Uptime widget to display, 0 when unset.
    int requestTimeoutMs{10000};   ///< HTTP transfer timeout in milliseconds.

    // Polling
    int pingIntervalSeconds{60};      ///< Refresh interval on the primary endpoint.
    int fallbackIntervalSeconds{30};  ///< Refresh interval on the fallback endpoint.

    // Display defaults
    core::ThresholdConfig display;    ///< Used for fields a widget payload does not configure.
    int compactCardThreshold{3};      ///< Target count above which cards use compact mode.

    // Window state
    int windowX{100};            ///< Window X position.
    int windowY{100};            ///< Window Y position.
    int windowWidth{520};        ///< Window width in pixels.
    int windowHeight{720};       ///< Window height in pixels.
    bool windowMaximized{false}; ///< Window maximized state.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of application configuration from JSON files.
 * The API token is kept encrypted in the "secure" section.
 */
class ConfigManager {
public:
    /// Secure value key of the bearer token.
    static constexpr const char* API_TOKEN_KEY = "api_token";

    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk.
     *
     * A missing file is created with defaults. A corrupt file leaves the
     * defaults in place.
     *
     * @return True if loaded or created successfully, false otherwise.
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
     * @brief Stores a value in secure encrypted storage and saves.
     * @param key Key name for the value.
     * @param value Value to store. An empty value removes the key.
     */
    void setSecureValue(const std::string& key, const std::string& value);

    /**
     * @brief Retrieves a value from secure storage.
     * @return Decrypted value if found, nullopt otherwise.
     */
    std::optional<std::string> getSecureValue(const std::string& key) const;

    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path of the rotating log file.
     */
    std::filesystem::path logPath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
    std::unique_ptr<SecureStorage> secureStorage_;
    nlohmann::json secureValues_ = nlohmann::json::object();
};

/**
 * @brief Converts a time display mode to its config string ("local" or "utc").
 */
std::string timeDisplayToString(core::TimeZoneMode mode);

/**
 * @brief Parses a time display mode, defaulting to local time.
 */
core::TimeZoneMode timeDisplayFromString(const std::string& text);

} // namespace pingscope::infra
