/**
 * @file PingWidgetData.hpp
 * @brief Complete data payload for one uptime widget.
 */

#pragma once

#include "core/types/PingTarget.hpp"
#include "core/types/ThresholdConfig.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pingscope::core {

/**
 * @brief Number of targets in each status, shown in the widget header.
 */
struct StatusCounts {
    int ok{0};
    int warning{0};
    int critical{0};

    bool operator==(const StatusCounts& other) const = default;
};

/**
 * @brief Immutable snapshot returned by one widget data fetch.
 *
 * A new fetch always produces a new object which replaces the previous one;
 * nothing in the client mutates a received snapshot.
 */
struct PingWidgetData {
    std::vector<PingTarget> targets;  ///< Targets in configuration order
    ThresholdConfig config;           ///< Thresholds and display toggles
    std::optional<std::chrono::system_clock::time_point> fetchedAt; ///< Server or receipt time
    std::optional<std::string> error; ///< Backend-reported error, if any
    bool hasHistory{true};            ///< False for the current-status-only fallback payload

    /**
     * @brief Counts targets per effective status.
     */
    [[nodiscard]] StatusCounts statusCounts() const;

    /**
     * @brief Length of the longest target history.
     */
    [[nodiscard]] std::size_t maxHistoryLength() const;

    /**
     * @brief Finds a target by its probed address.
     * @return Pointer into this snapshot, or nullptr if not found.
     */
    [[nodiscard]] const PingTarget* findTarget(const std::string& address) const;

    bool operator==(const PingWidgetData& other) const = default;
};

} // namespace pingscope::core
