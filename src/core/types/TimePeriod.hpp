/**
 * @file TimePeriod.hpp
 * @brief Selectable time periods for the detailed latency graph.
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace pingscope::core {

/**
 * @brief Discrete history windows offered by the detail view.
 */
enum class TimePeriod : int {
    OneHour = 1,
    SixHours = 6,
    OneDay = 24,
    SevenDays = 168,
    ThirtyDays = 720,
    NinetyDays = 2160,
    OneYear = 8760
};

/// Period shown when the detail view opens.
inline constexpr TimePeriod DEFAULT_DETAIL_PERIOD = TimePeriod::OneDay;

/**
 * @brief Length of a period in hours.
 */
[[nodiscard]] constexpr int periodHours(TimePeriod period) {
    return static_cast<int>(period);
}

/**
 * @brief Human-readable label such as "6 hours" or "1 year".
 */
[[nodiscard]] std::string periodLabel(TimePeriod period);

/**
 * @brief All periods in ascending order.
 */
[[nodiscard]] const std::array<TimePeriod, 7>& allPeriods();

/**
 * @brief Maps an hour count back to a period.
 * @return The matching period, or nullopt if the hours are not one of the
 *         supported values.
 */
[[nodiscard]] std::optional<TimePeriod> periodFromHours(int hours);

} // namespace pingscope::core
