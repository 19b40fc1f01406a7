/**
 * @file PingPayloadParser.hpp
 * @brief Conversion of dashboard backend JSON payloads to core types.
 */

#pragma once

#include "core/services/IPingDataSource.hpp"
#include "core/types/PingSample.hpp"
#include "core/types/PingTarget.hpp"
#include "core/types/PingWidgetData.hpp"
#include "core/types/ThresholdConfig.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pingscope::infra {

/**
 * @brief Parses the JSON documents served by the dashboard backend.
 *
 * All entry points take the raw response body and never throw: malformed
 * documents produce a failed FetchResult carrying the parser message.
 * Unknown fields are ignored and latency fields may be null.
 */
class PingPayloadParser {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Parses the primary widget payload with per-target history.
     * @param body Response body of the widget data endpoint.
     * @param receivedAt Stamped as fetch time when the payload carries none.
     * @param defaults Display config used for fields the payload leaves out.
     */
    static core::FetchResult<core::PingWidgetData>
    parseWidgetData(const std::string& body, TimePoint receivedAt,
                    const core::ThresholdConfig& defaults = {});

    /**
     * @brief Parses the current-status-only payload of the fallback endpoint.
     *
     * The document is wrapped in a "data" envelope and its targets are flat
     * current-status records. The result has empty histories and hasHistory
     * set to false.
     */
    static core::FetchResult<core::PingWidgetData>
    parseCurrentStatus(const std::string& body, TimePoint receivedAt,
                       const core::ThresholdConfig& defaults = {});

    /**
     * @brief Parses a history document of the form {"data": [...]}.
     */
    static core::FetchResult<core::PingSeries> parseHistory(const std::string& body);

    /**
     * @brief Parses a statistics document of the form {"statistics": {...}}.
     */
    static core::FetchResult<core::PingStatistics> parseStatistics(const std::string& body);

    /**
     * @brief Parses an ISO-8601 timestamp.
     *
     * Timestamps without an offset are taken as UTC. Sub-millisecond digits
     * are truncated.
     *
     * @return The instant, or nullopt if the text is not a valid timestamp.
     */
    static std::optional<TimePoint> parseTimestamp(const std::string& text);

    static core::PingSample sampleFromJson(const nlohmann::json& j);
    static core::PingStatistics statisticsFromJson(const nlohmann::json& j);
    static core::ThresholdConfig configFromJson(const nlohmann::json& j,
                                                const core::ThresholdConfig& defaults = {});
};

} // namespace pingscope::infra
