#include "core/types/TimePeriod.hpp"

namespace pingscope::core {

std::string periodLabel(TimePeriod period) {
    switch (period) {
    case TimePeriod::OneHour:
        return "1 hour";
    case TimePeriod::SixHours:
        return "6 hours";
    case TimePeriod::OneDay:
        return "24 hours";
    case TimePeriod::SevenDays:
        return "7 days";
    case TimePeriod::ThirtyDays:
        return "30 days";
    case TimePeriod::NinetyDays:
        return "90 days";
    case TimePeriod::OneYear:
        return "1 year";
    }
    return "24 hours";
}

const std::array<TimePeriod, 7>& allPeriods() {
    static constexpr std::array<TimePeriod, 7> periods{
        TimePeriod::OneHour,    TimePeriod::SixHours,   TimePeriod::OneDay,
        TimePeriod::SevenDays,  TimePeriod::ThirtyDays, TimePeriod::NinetyDays,
        TimePeriod::OneYear};
    return periods;
}

std::optional<TimePeriod> periodFromHours(int hours) {
    for (auto period : allPeriods()) {
        if (periodHours(period) == hours) {
            return period;
        }
    }
    return std::nullopt;
}

} // namespace pingscope::core
