/**
 * @file ThresholdConfig.hpp
 * @brief Alerting thresholds and display toggles for a set of ping targets.
 */

#pragma once

namespace pingscope::core {

/**
 * @brief Threshold and display configuration shared by all targets of a widget.
 *
 * Supplied by the backend alongside each data payload. Defaults match the
 * backend's defaults so a payload without a config block still renders.
 */
struct ThresholdConfig {
    double latencyWarningMs{100.0};    ///< Average latency at which a sample turns warning
    double latencyCriticalMs{500.0};   ///< Average latency at which a sample turns critical
    double lossWarningPercent{5.0};    ///< Packet loss at which a target turns warning
    double lossCriticalPercent{20.0};  ///< Packet loss at which a target turns critical
    bool showJitter{true};             ///< Draw min/max bands and show jitter values
    bool showPacketLoss{true};         ///< Show packet loss badges
    bool showStatistics{true};         ///< Show the statistics row on cards
    int graphHeightPx{150};            ///< Height of the compact graph in pixels
    int historyHours{24};              ///< Hours of history included in the widget payload

    /**
     * @brief Validates the configuration.
     * @return True if thresholds are positive and ordered, loss percentages are
     *         within 0-100 and the graph height is positive.
     */
    [[nodiscard]] bool isValid() const;

    bool operator==(const ThresholdConfig& other) const = default;
};

} // namespace pingscope::core
