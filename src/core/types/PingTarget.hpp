/**
 * @file PingTarget.hpp
 * @brief Monitored target, its status and aggregated statistics.
 *
 * This file defines the per-target snapshot delivered by the data source:
 * identity, most recent sample, history and window statistics.
 */

#pragma once

#include "core/types/PingSample.hpp"
#include "core/types/ThresholdConfig.hpp"

#include <optional>
#include <string>

namespace pingscope::core {

/**
 * @brief Health classification of a target or sample.
 */
enum class TargetStatus : int {
    Ok = 0,      ///< Reachable with latency and loss below warning thresholds
    Warning = 1, ///< Reachable but degraded
    Critical = 2 ///< Unreachable or beyond critical thresholds
};

/**
 * @brief Coarse grading of an uptime percentage.
 */
enum class UptimeLevel : int {
    Good = 0,     ///< 99% and above
    Degraded = 1, ///< 95% and above
    Poor = 2      ///< Below 95%
};

/**
 * @brief Aggregated statistics for one target over the selected window.
 *
 * Computed by the data source for a given period. The client never derives
 * these from the series; a period change replaces them wholesale.
 */
struct PingStatistics {
    int totalMeasurements{0};          ///< Number of samples in the window
    std::optional<double> avgLatency;  ///< Mean of average latencies
    std::optional<double> minLatency;  ///< Lowest observed latency
    std::optional<double> maxLatency;  ///< Highest observed latency
    std::optional<double> avgJitter;   ///< Mean jitter
    double avgPacketLoss{0.0};         ///< Mean packet loss percentage
    double uptimePercent{0.0};         ///< Percentage of reachable samples
    int outages{0};                    ///< Number of unreachable samples

    bool operator==(const PingStatistics& other) const = default;
};

/**
 * @brief A monitored target with its latest sample and history.
 */
struct PingTarget {
    std::string address;                  ///< IP address or hostname that is probed
    std::string name;                     ///< Display name, falls back to address
    PingSample current;                   ///< Most recent measurement
    std::optional<TargetStatus> status;   ///< Status as classified by the backend, if sent
    std::string errorMessage;             ///< Probe error for unreachable targets
    PingSeries history;                   ///< Samples for the configured history window
    std::optional<PingStatistics> statistics; ///< Window statistics, if provided

    /**
     * @brief Returns the display name, or the address when no name is set.
     */
    [[nodiscard]] const std::string& displayName() const;

    /**
     * @brief Status reported by the backend, or evaluated locally from the
     *        current sample when the backend did not classify it.
     * @param config Thresholds used for local evaluation.
     */
    [[nodiscard]] TargetStatus effectiveStatus(const ThresholdConfig& config) const;

    bool operator==(const PingTarget& other) const = default;
};

/**
 * @brief Classifies a sample against the configured thresholds.
 *
 * Unreachable samples are critical. Otherwise packet loss is checked before
 * average latency, critical before warning.
 *
 * @param sample The sample to classify.
 * @param config Thresholds to compare against.
 * @return The resulting status.
 */
[[nodiscard]] TargetStatus evaluateStatus(const PingSample& sample, const ThresholdConfig& config);

/**
 * @brief Classifies an average latency against the latency thresholds only.
 *
 * Used to colour latency bands; a missing average is treated as ok.
 */
[[nodiscard]] TargetStatus latencyLevel(std::optional<double> avgLatencyMs,
                                        const ThresholdConfig& config);

/**
 * @brief Grades an uptime percentage.
 */
[[nodiscard]] UptimeLevel uptimeLevel(double uptimePercent);

/**
 * @brief Converts a status to its wire string ("ok", "warning", "critical").
 */
[[nodiscard]] std::string statusToString(TargetStatus status);

/**
 * @brief Parses a wire status string.
 * @return The status, or nullopt for unknown strings.
 */
[[nodiscard]] std::optional<TargetStatus> statusFromString(const std::string& str);

} // namespace pingscope::core
