/**
 * @file PingApiClient.hpp
 * @brief HTTP implementation of the reachability data source.
 */

#pragma once

#include "core/services/IPingDataSource.hpp"
#include "core/types/ThresholdConfig.hpp"
#include "infrastructure/network/HttpClient.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace pingscope::infra {

/**
 * @brief Connection settings for the dashboard backend.
 */
struct ApiSettings {
    std::string baseUrl{"http://localhost:8000/api"}; ///< Base URL without trailing slash
    std::string token;                                ///< Bearer token, empty for none
    int timeoutMs{10000};                             ///< Per-request transfer timeout
    core::ThresholdConfig displayDefaults;            ///< Used where a widget payload has no config

    bool operator==(const ApiSettings& other) const = default;
};

/**
 * @brief Fetches widget snapshots, history and statistics over HTTP.
 *
 * Endpoints:
 * - GET  {base}/ping/widget/{id}/data          primary widget payload
 * - POST {base}/widgets/{id}/data              current-status fallback
 * - GET  {base}/ping/history/{target}?hours=H  per-period history
 * - GET  {base}/ping/statistics/{target}?hours=H
 *
 * Responses are parsed with PingPayloadParser. Transport and parse failures
 * are delivered as failed results; nothing is thrown to the caller.
 */
class PingApiClient : public core::IPingDataSource {
public:
    PingApiClient(HttpClient& http, ApiSettings settings);

    core::RequestId fetchWidgetData(int64_t widgetId, Callback<core::PingWidgetData> callback) override;
    core::RequestId fetchCurrentStatus(int64_t widgetId,
                                       Callback<core::PingWidgetData> callback) override;
    core::RequestId fetchHistory(const std::string& target, int hours,
                                 std::optional<int64_t> widgetId,
                                 Callback<core::PingSeries> callback) override;
    core::RequestId fetchStatistics(const std::string& target, int hours,
                                    std::optional<int64_t> widgetId,
                                    Callback<core::PingStatistics> callback) override;
    void cancel(core::RequestId id) override;

    [[nodiscard]] const ApiSettings& settings() const { return settings_; }
    void setSettings(ApiSettings settings);

    [[nodiscard]] std::string widgetDataUrl(int64_t widgetId) const;
    [[nodiscard]] std::string currentStatusUrl(int64_t widgetId) const;
    [[nodiscard]] std::string historyUrl(const std::string& target, int hours,
                                         std::optional<int64_t> widgetId) const;
    [[nodiscard]] std::string statisticsUrl(const std::string& target, int hours,
                                            std::optional<int64_t> widgetId) const;

private:
    [[nodiscard]] HttpHeaders headers() const;
    [[nodiscard]] std::string baseUrl() const;

    HttpClient& http_;
    ApiSettings settings_;
};

} // namespace pingscope::infra
