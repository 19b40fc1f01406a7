/**
 * @file TimeWindow.hpp
 * @brief Visible time window resolution and axis label formatting.
 *
 * The detailed graph shows a window of fixed length anchored at the oldest
 * sample that the data source returned for the selected period, rather than
 * at wall-clock "now". Axis labels use a granularity derived from the period.
 */

#pragma once

#include "core/types/PingSample.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace pingscope::core {

/**
 * @brief A contiguous visualised time span [start, end).
 */
struct TimeWindow {
    std::chrono::system_clock::time_point start; ///< First instant of the window
    std::chrono::system_clock::time_point end;   ///< End of the window (exclusive)
    std::chrono::milliseconds duration{0};       ///< end - start

    /**
     * @brief Duration in milliseconds as a floating-point value.
     */
    [[nodiscard]] double durationMs() const { return static_cast<double>(duration.count()); }

    /**
     * @brief Fractional position of a time point within the window.
     * @return 0 at start, 1 at end; values outside [0, 1] lie outside the window.
     */
    [[nodiscard]] double ratioOf(std::chrono::system_clock::time_point t) const;

    /**
     * @brief Time point at a fractional position within the window.
     */
    [[nodiscard]] std::chrono::system_clock::time_point timeAt(double ratio) const;

    /**
     * @brief Checks whether a time point lies within [start, end].
     */
    [[nodiscard]] bool contains(std::chrono::system_clock::time_point t) const;

    bool operator==(const TimeWindow& other) const = default;
};

/**
 * @brief Axis label formats, from finest to coarsest.
 */
enum class LabelGranularity {
    TimeWithSeconds, ///< HH:MM:SS, periods up to 1 hour
    TimeOfDay,       ///< HH:MM, periods up to 24 hours
    WeekdayHour,     ///< weekday and hour, periods up to 7 days
    DayMonth,        ///< day and month, periods up to 30 days
    MonthYear        ///< month and year, anything longer
};

/**
 * @brief Whether timestamps are displayed in local time or UTC.
 */
enum class TimeZoneMode { Local, Utc };

/**
 * @brief Resolves the visible window for a series and period.
 *
 * With samples present the window starts at the oldest sample and spans the
 * full period. Without samples it ends at @p now so the axes can still be
 * drawn. Non-positive periods are treated as one hour.
 *
 * @param series Samples for the selected period.
 * @param periodHours Length of the selected period in hours.
 * @param now Reference time used only when the series is empty.
 * @return The resolved window.
 */
[[nodiscard]] TimeWindow resolveWindow(const PingSeries& series, int periodHours,
                                       std::chrono::system_clock::time_point now =
                                           std::chrono::system_clock::now());

/**
 * @brief Label granularity for a period length.
 */
[[nodiscard]] LabelGranularity labelGranularity(int periodHours);

/**
 * @brief Number of X axis labels drawn for a period length.
 * @return 6 up to 7 days, 7 up to 30 days, 8 beyond.
 */
[[nodiscard]] int xAxisLabelCount(int periodHours);

/**
 * @brief Formats an axis label.
 * @param t Instant to format.
 * @param granularity Label format to use.
 * @param zone Local time or UTC.
 */
[[nodiscard]] std::string formatTimeLabel(std::chrono::system_clock::time_point t,
                                          LabelGranularity granularity,
                                          TimeZoneMode zone = TimeZoneMode::Local);

/**
 * @brief Formats a full date and time ("YYYY-MM-DD HH:MM:SS") for tooltips.
 */
[[nodiscard]] std::string formatTimestamp(std::chrono::system_clock::time_point t,
                                          TimeZoneMode zone = TimeZoneMode::Local);

} // namespace pingscope::core
