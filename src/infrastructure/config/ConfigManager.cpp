#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace pingscope::infra {

std::string timeDisplayToString(core::TimeZoneMode mode) {
    return mode == core::TimeZoneMode::Utc ? "utc" : "local";
}

core::TimeZoneMode timeDisplayFromString(const std::string& text) {
    return text == "utc" ? core::TimeZoneMode::Utc : core::TimeZoneMode::Local;
}

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
    secureStorage_ = std::make_unique<SecureStorage>(configDir_ / ".key");
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
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

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // General
    j["general"]["time_display"] = timeDisplayToString(config_.timeDisplay);
    j["general"]["log_level"] = config_.logLevel;

    // Backend
    j["api"]["base_url"] = config_.apiBaseUrl;
    j["api"]["widget_id"] = config_.widgetId;
    j["api"]["request_timeout_ms"] = config_.requestTimeoutMs;

    // Polling
    j["polling"]["ping_interval_seconds"] = config_.pingIntervalSeconds;
    j["polling"]["fallback_interval_seconds"] = config_.fallbackIntervalSeconds;

    // Display defaults
    const auto& d = config_.display;
    j["display"]["latency_warning_ms"] = d.latencyWarningMs;
    j["display"]["latency_critical_ms"] = d.latencyCriticalMs;
    j["display"]["loss_warning_percent"] = d.lossWarningPercent;
    j["display"]["loss_critical_percent"] = d.lossCriticalPercent;
    j["display"]["show_jitter"] = d.showJitter;
    j["display"]["show_packet_loss"] = d.showPacketLoss;
    j["display"]["show_statistics"] = d.showStatistics;
    j["display"]["graph_height"] = d.graphHeightPx;
    j["display"]["history_hours"] = d.historyHours;
    j["display"]["compact_card_threshold"] = config_.compactCardThreshold;

    // Window state
    j["window"]["x"] = config_.windowX;
    j["window"]["y"] = config_.windowY;
    j["window"]["width"] = config_.windowWidth;
    j["window"]["height"] = config_.windowHeight;
    j["window"]["maximized"] = config_.windowMaximized;

    // Encrypted values
    if (!secureValues_.empty()) {
        j["secure"] = secureValues_;
    }

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    // General
    if (j.contains("general")) {
        const auto& g = j["general"];
        config_.timeDisplay = timeDisplayFromString(g.value("time_display", "local"));
        config_.logLevel = g.value("log_level", defaults.logLevel);
    }

    // Backend
    if (j.contains("api")) {
        const auto& a = j["api"];
        config_.apiBaseUrl = a.value("base_url", defaults.apiBaseUrl);
        config_.widgetId = a.value("widget_id", defaults.widgetId);
        config_.requestTimeoutMs = a.value("request_timeout_ms", defaults.requestTimeoutMs);
    }

    // Polling
    if (j.contains("polling")) {
        const auto& p = j["polling"];
        config_.pingIntervalSeconds = p.value("ping_interval_seconds", defaults.pingIntervalSeconds);
        config_.fallbackIntervalSeconds =
            p.value("fallback_interval_seconds", defaults.fallbackIntervalSeconds);
    }

    // Display defaults
    if (j.contains("display")) {
        const auto& d = j["display"];
        auto& t = config_.display;
        t.latencyWarningMs = d.value("latency_warning_ms", defaults.display.latencyWarningMs);
        t.latencyCriticalMs = d.value("latency_critical_ms", defaults.display.latencyCriticalMs);
        t.lossWarningPercent = d.value("loss_warning_percent", defaults.display.lossWarningPercent);
        t.lossCriticalPercent =
            d.value("loss_critical_percent", defaults.display.lossCriticalPercent);
        t.showJitter = d.value("show_jitter", defaults.display.showJitter);
        t.showPacketLoss = d.value("show_packet_loss", defaults.display.showPacketLoss);
        t.showStatistics = d.value("show_statistics", defaults.display.showStatistics);
        t.graphHeightPx = d.value("graph_height", defaults.display.graphHeightPx);
        t.historyHours = d.value("history_hours", defaults.display.historyHours);
        config_.compactCardThreshold =
            d.value("compact_card_threshold", defaults.compactCardThreshold);

        if (!t.isValid()) {
            spdlog::warn("Invalid display thresholds in config, using defaults");
            t = defaults.display;
        }
    }

    // Window state
    if (j.contains("window")) {
        const auto& w = j["window"];
        config_.windowX = w.value("x", defaults.windowX);
        config_.windowY = w.value("y", defaults.windowY);
        config_.windowWidth = w.value("width", defaults.windowWidth);
        config_.windowHeight = w.value("height", defaults.windowHeight);
        config_.windowMaximized = w.value("maximized", defaults.windowMaximized);
    }

    // Secure values
    if (j.contains("secure") && j["secure"].is_object()) {
        secureValues_ = j["secure"];
    }
}

void ConfigManager::setSecureValue(const std::string& key, const std::string& value) {
    if (value.empty()) {
        if (secureValues_.erase(key) > 0) {
            save();
        }
        return;
    }

    auto sealed = secureStorage_->seal(value);
    if (!sealed.empty()) {
        secureValues_[key] = sealed;
        save();
    }
}

std::optional<std::string> ConfigManager::getSecureValue(const std::string& key) const {
    auto it = secureValues_.find(key);
    if (it == secureValues_.end() || !it->is_string()) {
        return std::nullopt;
    }
    return secureStorage_->open(it->get<std::string>());
}

std::filesystem::path ConfigManager::logPath() const {
    return configDir_ / "logs" / "pingscope.log";
}

} // namespace pingscope::infra
