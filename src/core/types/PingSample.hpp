/**
 * @file PingSample.hpp
 * @brief Reachability sample and series types.
 *
 * This file defines a single reachability measurement as delivered by the
 * dashboard backend and the ordered series of measurements for one target.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace pingscope::core {

/**
 * @brief One reachability measurement at a point in time.
 *
 * Latency fields are only meaningful for reachable samples. Consumers must
 * read them through the accessor functions, which hide any stray values
 * carried by an unreachable sample.
 */
struct PingSample {
    std::chrono::system_clock::time_point timestamp; ///< When the measurement was taken
    bool isReachable{false};              ///< Whether any reply was received
    std::optional<double> latencyMin;     ///< Fastest round trip in milliseconds
    std::optional<double> latencyAvg;     ///< Mean round trip in milliseconds
    std::optional<double> latencyMax;     ///< Slowest round trip in milliseconds
    std::optional<double> jitter;         ///< Latency variation in milliseconds
    double packetLossPercent{0.0};        ///< Lost packets, 0-100

    /**
     * @brief Minimum latency, or nullopt if the sample is unreachable.
     */
    [[nodiscard]] std::optional<double> minLatency() const {
        return isReachable ? latencyMin : std::nullopt;
    }

    /**
     * @brief Average latency, or nullopt if the sample is unreachable.
     */
    [[nodiscard]] std::optional<double> avgLatency() const {
        return isReachable ? latencyAvg : std::nullopt;
    }

    /**
     * @brief Maximum latency, or nullopt if the sample is unreachable.
     */
    [[nodiscard]] std::optional<double> maxLatency() const {
        return isReachable ? latencyMax : std::nullopt;
    }

    /**
     * @brief Jitter, or nullopt if the sample is unreachable.
     */
    [[nodiscard]] std::optional<double> effectiveJitter() const {
        return isReachable ? jitter : std::nullopt;
    }

    /**
     * @brief Checks whether the sample carries a full min/max latency band.
     * @return True if reachable and both bounds are present.
     */
    [[nodiscard]] bool hasLatencyBand() const;

    /**
     * @brief Timestamp as milliseconds since the Unix epoch.
     */
    [[nodiscard]] int64_t epochMs() const;

    bool operator==(const PingSample& other) const = default;
};

/**
 * @brief Ordered samples for one monitored target, oldest first.
 *
 * Producers are expected to sort by timestamp, but duplicates and
 * out-of-order entries must be tolerated by every consumer.
 */
using PingSeries = std::vector<PingSample>;

/**
 * @brief Converts a time point to milliseconds since the Unix epoch.
 */
[[nodiscard]] int64_t toEpochMs(std::chrono::system_clock::time_point tp);

/**
 * @brief Converts milliseconds since the Unix epoch to a time point.
 */
[[nodiscard]] std::chrono::system_clock::time_point fromEpochMs(int64_t ms);

/**
 * @brief Returns the largest plottable maximum latency in the series.
 * @param series Samples to scan.
 * @return The maximum over reachable samples, or nullopt if none has one.
 */
[[nodiscard]] std::optional<double> peakLatency(const PingSeries& series);

} // namespace pingscope::core
