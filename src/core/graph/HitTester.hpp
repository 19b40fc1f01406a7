/**
 * @file HitTester.hpp
 * @brief Pointer to sample mapping for the detailed graph tooltip.
 */

#pragma once

#include "core/graph/TimeWindow.hpp"
#include "core/types/PingSample.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pingscope::core {

/**
 * @brief Text shown in the hover tooltip for one sample.
 */
struct TooltipContent {
    std::string timestamp;          ///< Formatted sample time
    bool offline{false};            ///< True for unreachable samples
    std::vector<std::string> lines; ///< Metric lines, or a single "Offline" line

    bool operator==(const TooltipContent& other) const = default;
};

/**
 * @brief Maps horizontal pointer positions to the nearest sample in time.
 *
 * The tester works in the same coordinate system the detailed graph drew:
 * a time window mapped onto [leftMargin, leftMargin + graphWidth]. A sample
 * is only accepted if it lies within a snap distance of the pointer, which is
 * the smaller of 5% of the window and 50 pixels worth of time.
 */
class HitTester {
public:
    /// Pointer distance, in pixels, beyond which no sample is matched.
    static constexpr double SNAP_PIXELS = 50.0;
    /// Fraction of the window beyond which no sample is matched.
    static constexpr double SNAP_WINDOW_FRACTION = 0.05;

    /**
     * @brief Constructs a tester for one drawn frame.
     * @param window Time window that was drawn.
     * @param graphWidth Width of the plot area in pixels.
     * @param leftMargin X coordinate of the plot area's left edge.
     */
    HitTester(const TimeWindow& window, double graphWidth, double leftMargin);

    /**
     * @brief Converts a pointer X coordinate to a time in epoch milliseconds.
     */
    [[nodiscard]] double timeAtPointer(double pointerX) const;

    /**
     * @brief Maximum accepted time distance in milliseconds.
     */
    [[nodiscard]] double snapDistanceMs() const;

    /**
     * @brief Index of the nearest sample within the snap distance.
     * @param pointerX Pointer X coordinate in surface pixels.
     * @param series Samples that were drawn.
     * @return Index into @p series, or nullopt when nothing is close enough.
     */
    [[nodiscard]] std::optional<std::size_t> nearestIndex(double pointerX,
                                                          const PingSeries& series) const;

private:
    TimeWindow window_;
    double graphWidth_;
    double leftMargin_;
};

/**
 * @brief Finds the sample nearest to a pointer position.
 *
 * Convenience wrapper over HitTester for one-off queries.
 *
 * @return A copy of the nearest sample, or nullopt if none is within reach.
 */
[[nodiscard]] std::optional<PingSample> nearestSample(double pointerX, const PingSeries& series,
                                                      std::chrono::system_clock::time_point windowStart,
                                                      std::chrono::milliseconds windowDuration,
                                                      double graphWidth, double leftMargin);

/**
 * @brief Formats a latency value for display.
 * @return "-" when absent, "<1" below one millisecond, else one decimal place.
 */
[[nodiscard]] std::string formatLatency(std::optional<double> latencyMs);

/**
 * @brief Builds tooltip text for a sample.
 *
 * Reachable samples list average, minimum and maximum latency, followed by
 * jitter when present and loss when non-zero. Unreachable samples only show
 * an offline indicator.
 */
[[nodiscard]] TooltipContent describeSample(const PingSample& sample,
                                            TimeZoneMode zone = TimeZoneMode::Local);

} // namespace pingscope::core
