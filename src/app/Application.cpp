#include "app/Application.hpp"

#include "ui/windows/MainWindow.hpp"

#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>

namespace pingscope::app {

namespace {

std::filesystem::path appDataDir() {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation).toStdString();
}

} // namespace

Application* Application::instance_ = nullptr;

Application::Application(int& argc, char** argv) {
    instance_ = this;

    qtApp_ = std::make_unique<QApplication>(argc, argv);
    qtApp_->setApplicationName("PingScope");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("PingScope");

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::info("Application shutting down...");

    if (widgetViewModel_) {
        widgetViewModel_->deactivate();
    }
    if (detailViewModel_) {
        detailViewModel_->close();
    }

    instance_ = nullptr;
}

void Application::initializeLogging() {
    auto logDir = appDataDir() / "logs";
    std::filesystem::create_directories(logDir);

    auto logPath = logDir / "pingscope.log";

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("pingscope", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("PingScope {} starting...", qtApp_->applicationVersion().toStdString());
    spdlog::info("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    // Configuration
    config_ = std::make_unique<infra::ConfigManager>(appDataDir());
    config_->load();

    // Backend access
    httpClient_ = std::make_unique<infra::HttpClient>();
    apiClient_ = std::make_shared<infra::PingApiClient>(*httpClient_, apiSettings());

    // ViewModels
    widgetViewModel_ = std::make_unique<viewmodels::PingWidgetViewModel>(apiClient_);
    detailViewModel_ = std::make_unique<viewmodels::TargetDetailViewModel>(apiClient_);

    applyConfig();

    spdlog::info("Application components initialized");
}

infra::ApiSettings Application::apiSettings() const {
    const auto& config = config_->config();

    infra::ApiSettings settings;
    settings.baseUrl = config.apiBaseUrl;
    settings.token = config_->getSecureValue(infra::ConfigManager::API_TOKEN_KEY).value_or("");
    settings.timeoutMs = config.requestTimeoutMs;
    settings.displayDefaults = config.display;
    return settings;
}

void Application::applyConfig() {
    const auto& config = config_->config();

    auto level = spdlog::level::from_str(config.logLevel);
    if (level == spdlog::level::off && config.logLevel != "off") {
        spdlog::warn("Unknown log level '{}', using info", config.logLevel);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);

    apiClient_->setSettings(apiSettings());

    widgetViewModel_->setPollInterval(std::chrono::seconds(config.pingIntervalSeconds));
    widgetViewModel_->setFallbackInterval(std::chrono::seconds(config.fallbackIntervalSeconds));
    if (widgetViewModel_->widgetId() != config.widgetId) {
        widgetViewModel_->setWidgetId(config.widgetId);
    }
}

int Application::run() {
    // Create and show main window
    ui::MainWindow mainWindow;

    if (config_->config().windowMaximized) {
        mainWindow.showMaximized();
    } else {
        mainWindow.setGeometry(config_->config().windowX, config_->config().windowY,
                               config_->config().windowWidth, config_->config().windowHeight);
        mainWindow.show();
    }

    // Start polling
    widgetViewModel_->activate();

    return qtApp_->exec();
}

Application& Application::instance() {
    return *instance_;
}

} // namespace pingscope::app
