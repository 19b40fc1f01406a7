#include "infrastructure/api/PingApiClient.hpp"

#include "infrastructure/api/PingPayloadParser.hpp"

#include <QUrl>
#include <spdlog/spdlog.h>

namespace pingscope::infra {

namespace {

std::string encodePathSegment(const std::string& segment) {
    return QUrl::toPercentEncoding(QString::fromStdString(segment)).toStdString();
}

std::string periodQuery(int hours, std::optional<int64_t> widgetId) {
    std::string query = "?hours=" + std::to_string(hours);
    if (widgetId) {
        query += "&widget_id=" + std::to_string(*widgetId);
    }
    return query;
}

template <typename T>
core::FetchResult<T> transportFailure(const HttpResponse& response) {
    core::FetchResult<T> result;
    result.success = false;
    result.errorMessage = response.errorMessage.empty()
                              ? "HTTP error: " + std::to_string(response.statusCode)
                              : response.errorMessage;
    return result;
}

} // namespace

PingApiClient::PingApiClient(HttpClient& http, ApiSettings settings)
    : http_(http), settings_(std::move(settings)) {}

void PingApiClient::setSettings(ApiSettings settings) {
    settings_ = std::move(settings);
    spdlog::info("Ping API endpoint set to {}", settings_.baseUrl);
}

std::string PingApiClient::baseUrl() const {
    std::string base = settings_.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base;
}

HttpHeaders PingApiClient::headers() const {
    HttpHeaders headers{{"Accept", "application/json"}};
    if (!settings_.token.empty()) {
        headers["Authorization"] = "Bearer " + settings_.token;
    }
    return headers;
}

std::string PingApiClient::widgetDataUrl(int64_t widgetId) const {
    return baseUrl() + "/ping/widget/" + std::to_string(widgetId) + "/data";
}

std::string PingApiClient::currentStatusUrl(int64_t widgetId) const {
    return baseUrl() + "/widgets/" + std::to_string(widgetId) + "/data";
}

std::string PingApiClient::historyUrl(const std::string& target, int hours,
                                      std::optional<int64_t> widgetId) const {
    return baseUrl() + "/ping/history/" + encodePathSegment(target) +
           periodQuery(hours, widgetId);
}

std::string PingApiClient::statisticsUrl(const std::string& target, int hours,
                                         std::optional<int64_t> widgetId) const {
    return baseUrl() + "/ping/statistics/" + encodePathSegment(target) +
           periodQuery(hours, widgetId);
}

core::RequestId PingApiClient::fetchWidgetData(int64_t widgetId,
                                               Callback<core::PingWidgetData> callback) {
    const auto url = widgetDataUrl(widgetId);
    spdlog::debug("Fetching widget {} data", widgetId);
    return http_.getAsync(url, headers(), settings_.timeoutMs,
                          [callback = std::move(callback),
                           defaults = settings_.displayDefaults](const HttpResponse& response) {
                              if (!response.success) {
                                  callback(transportFailure<core::PingWidgetData>(response));
                                  return;
                              }
                              callback(PingPayloadParser::parseWidgetData(
                                  response.body, std::chrono::system_clock::now(), defaults));
                          });
}

core::RequestId PingApiClient::fetchCurrentStatus(int64_t widgetId,
                                                  Callback<core::PingWidgetData> callback) {
    const auto url = currentStatusUrl(widgetId);
    spdlog::debug("Fetching widget {} current status", widgetId);
    return http_.postAsync(url, "{}", headers(), settings_.timeoutMs,
                           [callback = std::move(callback),
                            defaults = settings_.displayDefaults](const HttpResponse& response) {
                               if (!response.success) {
                                   callback(transportFailure<core::PingWidgetData>(response));
                                   return;
                               }
                               callback(PingPayloadParser::parseCurrentStatus(
                                   response.body, std::chrono::system_clock::now(), defaults));
                           });
}

core::RequestId PingApiClient::fetchHistory(const std::string& target, int hours,
                                            std::optional<int64_t> widgetId,
                                            Callback<core::PingSeries> callback) {
    spdlog::debug("Fetching {}h history for {}", hours, target);
    return http_.getAsync(historyUrl(target, hours, widgetId), headers(), settings_.timeoutMs,
                          [callback = std::move(callback)](const HttpResponse& response) {
                              if (!response.success) {
                                  callback(transportFailure<core::PingSeries>(response));
                                  return;
                              }
                              callback(PingPayloadParser::parseHistory(response.body));
                          });
}

core::RequestId PingApiClient::fetchStatistics(const std::string& target, int hours,
                                               std::optional<int64_t> widgetId,
                                               Callback<core::PingStatistics> callback) {
    spdlog::debug("Fetching {}h statistics for {}", hours, target);
    return http_.getAsync(statisticsUrl(target, hours, widgetId), headers(),
                          settings_.timeoutMs,
                          [callback = std::move(callback)](const HttpResponse& response) {
                              if (!response.success) {
                                  callback(transportFailure<core::PingStatistics>(response));
                                  return;
                              }
                              callback(PingPayloadParser::parseStatistics(response.body));
                          });
}

void PingApiClient::cancel(core::RequestId id) {
    if (id != core::INVALID_REQUEST_ID) {
        http_.cancel(id);
    }
}

} // namespace pingscope::infra
