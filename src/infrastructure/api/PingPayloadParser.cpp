#include "infrastructure/api/PingPayloadParser.hpp"

#include <QDateTime>
#include <QRegularExpression>
#include <QString>
#include <QTimeZone>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace pingscope::infra {

namespace {

std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

double numberOr(const nlohmann::json& j, const char* key, double fallback) {
    return optionalNumber(j, key).value_or(fallback);
}

// JSON numbers are unbounded; clamp before narrowing
int intOr(const nlohmann::json& j, const char* key, int fallback, int lowest = 0,
          int highest = std::numeric_limits<int>::max()) {
    auto value = optionalNumber(j, key);
    if (!value) {
        return fallback;
    }
    return static_cast<int>(
        std::clamp(*value, static_cast<double>(lowest), static_cast<double>(highest)));
}

bool boolOr(const nlohmann::json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

std::string stringOr(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<PingPayloadParser::TimePoint> timestampField(const nlohmann::json& j,
                                                           const char* key) {
    auto text = optionalString(j, key);
    if (!text) {
        return std::nullopt;
    }
    return PingPayloadParser::parseTimestamp(*text);
}

core::PingSeries seriesFromJson(const nlohmann::json& array) {
    core::PingSeries series;
    if (!array.is_array()) {
        return series;
    }
    series.reserve(array.size());
    for (const auto& item : array) {
        if (!item.is_object()) {
            continue;
        }
        if (!timestampField(item, "timestamp")) {
            spdlog::warn("Skipping history point with invalid timestamp");
            continue;
        }
        series.push_back(PingPayloadParser::sampleFromJson(item));
    }
    return series;
}

template <typename T>
core::FetchResult<T> failure(const std::string& message) {
    core::FetchResult<T> result;
    result.success = false;
    result.errorMessage = message;
    return result;
}

} // namespace

std::optional<PingPayloadParser::TimePoint>
PingPayloadParser::parseTimestamp(const std::string& text) {
    static const QRegularExpression fraction(R"((T\d{2}:\d{2}:\d{2})\.(\d+))");

    QString iso = QString::fromStdString(text).trimmed();
    if (iso.isEmpty()) {
        return std::nullopt;
    }

    // Truncate, rather than round, fractional seconds to milliseconds
    auto match = fraction.match(iso);
    if (match.hasMatch()) {
        QString digits = match.captured(2).left(3).leftJustified(3, '0');
        iso.replace(match.capturedStart(0), match.capturedLength(0),
                    match.captured(1) + "." + digits);
    }

    QDateTime dt = QDateTime::fromString(iso, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return std::nullopt;
    }

    static const QRegularExpression offset(R"((Z|[+-]\d{2}(:?\d{2})?)$)");
    const qsizetype timeStart = iso.indexOf('T');
    const QString timePart = timeStart >= 0 ? iso.mid(timeStart) : QString();
    if (!offset.match(timePart).hasMatch()) {
        dt = QDateTime(dt.date(), dt.time(), QTimeZone::utc());
    }

    return core::fromEpochMs(dt.toMSecsSinceEpoch());
}

core::PingSample PingPayloadParser::sampleFromJson(const nlohmann::json& j) {
    core::PingSample sample;
    sample.timestamp = timestampField(j, "timestamp").value_or(TimePoint{});
    sample.isReachable = boolOr(j, "is_reachable", false);
    sample.latencyMin = optionalNumber(j, "latency_min");
    sample.latencyAvg = optionalNumber(j, "latency_avg");
    sample.latencyMax = optionalNumber(j, "latency_max");
    sample.jitter = optionalNumber(j, "jitter");
    sample.packetLossPercent = numberOr(j, "packet_loss_percent", 0.0);
    return sample;
}

core::PingStatistics PingPayloadParser::statisticsFromJson(const nlohmann::json& j) {
    core::PingStatistics stats;
    stats.totalMeasurements = intOr(j, "total_measurements", 0);
    stats.avgLatency = optionalNumber(j, "avg_latency");
    stats.minLatency = optionalNumber(j, "min_latency");
    stats.maxLatency = optionalNumber(j, "max_latency");
    stats.avgJitter = optionalNumber(j, "avg_jitter");
    stats.avgPacketLoss = numberOr(j, "avg_packet_loss", 0.0);
    stats.uptimePercent = numberOr(j, "uptime_percent", 0.0);
    stats.outages = intOr(j, "outages", 0);
    return stats;
}

core::ThresholdConfig PingPayloadParser::configFromJson(const nlohmann::json& j,
                                                        const core::ThresholdConfig& defaults) {
    core::ThresholdConfig config = defaults;
    if (!j.is_object()) {
        return config;
    }
    config.latencyWarningMs = numberOr(j, "latency_warning", config.latencyWarningMs);
    config.latencyCriticalMs = numberOr(j, "latency_critical", config.latencyCriticalMs);
    config.lossWarningPercent = numberOr(j, "loss_warning", config.lossWarningPercent);
    config.lossCriticalPercent = numberOr(j, "loss_critical", config.lossCriticalPercent);
    config.showJitter = boolOr(j, "show_jitter", config.showJitter);
    config.showPacketLoss = boolOr(j, "show_packet_loss", config.showPacketLoss);
    config.showStatistics = boolOr(j, "show_statistics", config.showStatistics);
    config.graphHeightPx = intOr(j, "graph_height", config.graphHeightPx, 1);
    config.historyHours = intOr(j, "history_hours", config.historyHours, 1);
    return config;
}

core::FetchResult<core::PingWidgetData>
PingPayloadParser::parseWidgetData(const std::string& body, TimePoint receivedAt,
                                      const core::ThresholdConfig& defaults) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object()) {
            return failure<core::PingWidgetData>("Widget payload is not an object");
        }

        core::PingWidgetData data;
        data.hasHistory = true;
        data.config = configFromJson(j.value("config", nlohmann::json::object()), defaults);
        data.fetchedAt = timestampField(j, "fetched_at").value_or(receivedAt);
        data.error = optionalString(j, "error");

        for (const auto& item : j.value("targets", nlohmann::json::array())) {
            if (!item.is_object()) {
                continue;
            }
            core::PingTarget target;
            target.address = stringOr(item, "target", "");
            target.name = stringOr(item, "name", target.address);

            if (auto current = item.find("current");
                current != item.end() && current->is_object()) {
                target.current = sampleFromJson(*current);
                target.errorMessage = stringOr(*current, "error_message", "");
                if (auto status = optionalString(*current, "status")) {
                    target.status = core::statusFromString(*status);
                }
            }
            if (auto status = optionalString(item, "status")) {
                target.status = core::statusFromString(*status);
            }

            target.history = seriesFromJson(item.value("history", nlohmann::json::array()));

            if (auto stats = item.find("statistics"); stats != item.end() && stats->is_object()) {
                target.statistics = statisticsFromJson(*stats);
            }

            data.targets.push_back(std::move(target));
        }

        return {true, std::move(data), {}};
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse widget payload: {}", e.what());
        return failure<core::PingWidgetData>(std::string("Invalid widget payload: ") + e.what());
    }
}

core::FetchResult<core::PingWidgetData>
PingPayloadParser::parseCurrentStatus(const std::string& body, TimePoint receivedAt,
                                      const core::ThresholdConfig& defaults) {
    try {
        auto envelope = nlohmann::json::parse(body);
        const auto& j = envelope.contains("data") ? envelope["data"] : envelope;
        if (!j.is_object()) {
            return failure<core::PingWidgetData>("Status payload is not an object");
        }

        core::PingWidgetData data;
        data.hasHistory = false;
        data.config = configFromJson(j.value("config", nlohmann::json::object()), defaults);
        data.fetchedAt = timestampField(j, "fetched_at").value_or(receivedAt);
        data.error = optionalString(j, "error");

        for (const auto& item : j.value("targets", nlohmann::json::array())) {
            if (!item.is_object()) {
                continue;
            }
            core::PingTarget target;
            target.address = stringOr(item, "target", "");
            target.name = stringOr(item, "name", target.address);
            target.current = sampleFromJson(item);
            if (!timestampField(item, "timestamp")) {
                target.current.timestamp = *data.fetchedAt;
            }
            target.errorMessage = stringOr(item, "error_message", "");
            if (auto status = optionalString(item, "status")) {
                target.status = core::statusFromString(*status);
            }
            data.targets.push_back(std::move(target));
        }

        return {true, std::move(data), {}};
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse status payload: {}", e.what());
        return failure<core::PingWidgetData>(std::string("Invalid status payload: ") + e.what());
    }
}

core::FetchResult<core::PingSeries> PingPayloadParser::parseHistory(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        auto data = j.find("data");
        if (!j.is_object() || data == j.end() || !data->is_array()) {
            return failure<core::PingSeries>("History payload has no data array");
        }
        return {true, seriesFromJson(*data), {}};
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse history payload: {}", e.what());
        return failure<core::PingSeries>(std::string("Invalid history payload: ") + e.what());
    }
}

core::FetchResult<core::PingStatistics>
PingPayloadParser::parseStatistics(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        auto stats = j.find("statistics");
        if (!j.is_object() || stats == j.end() || !stats->is_object()) {
            return failure<core::PingStatistics>("Statistics payload has no statistics object");
        }
        return {true, statisticsFromJson(*stats), {}};
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse statistics payload: {}", e.what());
        return failure<core::PingStatistics>(std::string("Invalid statistics payload: ") +
                                             e.what());
    }
}

} // namespace pingscope::infra
