#pragma once

#include "infrastructure/api/PingApiClient.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "viewmodels/PingWidgetViewModel.hpp"
#include "viewmodels/TargetDetailViewModel.hpp"

#include <QApplication>
#include <memory>

namespace pingscope::app {

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    int run();

    /**
     * @brief Pushes the current configuration to the API client, the view
     *        models and the logger.
     */
    void applyConfig();

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::PingApiClient& apiClient() { return *apiClient_; }

    viewmodels::PingWidgetViewModel& widgetViewModel() { return *widgetViewModel_; }
    viewmodels::TargetDetailViewModel& detailViewModel() { return *detailViewModel_; }

    static Application& instance();

private:
    void initializeLogging();
    void initializeComponents();
    infra::ApiSettings apiSettings() const;

    std::unique_ptr<QApplication> qtApp_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::HttpClient> httpClient_;
    std::shared_ptr<infra::PingApiClient> apiClient_;

    std::unique_ptr<viewmodels::PingWidgetViewModel> widgetViewModel_;
    std::unique_ptr<viewmodels::TargetDetailViewModel> detailViewModel_;

    static Application* instance_;
};

} // namespace pingscope::app
