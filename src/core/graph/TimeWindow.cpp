#include "core/graph/TimeWindow.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>

namespace pingscope::core {

namespace {

constexpr int64_t MS_PER_HOUR = 3600LL * 1000LL;

std::tm toCalendarTime(std::chrono::system_clock::time_point t, TimeZoneMode zone) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(t);
    std::tm calendar{};
#ifdef _WIN32
    if (zone == TimeZoneMode::Utc) {
        gmtime_s(&calendar, &seconds);
    } else {
        localtime_s(&calendar, &seconds);
    }
#else
    if (zone == TimeZoneMode::Utc) {
        gmtime_r(&seconds, &calendar);
    } else {
        localtime_r(&seconds, &calendar);
    }
#endif
    return calendar;
}

std::string formatCalendar(const std::tm& calendar, const char* pattern) {
    char buffer[64];
    std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &calendar);
    return std::string(buffer, written);
}

} // namespace

double TimeWindow::ratioOf(std::chrono::system_clock::time_point t) const {
    if (duration.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(toEpochMs(t) - toEpochMs(start)) / durationMs();
}

std::chrono::system_clock::time_point TimeWindow::timeAt(double ratio) const {
    auto offset = static_cast<int64_t>(std::llround(durationMs() * ratio));
    return fromEpochMs(toEpochMs(start) + offset);
}

bool TimeWindow::contains(std::chrono::system_clock::time_point t) const {
    return t >= start && t <= end;
}

TimeWindow resolveWindow(const PingSeries& series, int periodHours,
                         std::chrono::system_clock::time_point now) {
    const int hours = std::max(1, periodHours);
    const std::chrono::milliseconds period{static_cast<int64_t>(hours) * MS_PER_HOUR};

    TimeWindow window;
    window.duration = period;

    if (series.empty()) {
        window.end = fromEpochMs(toEpochMs(now));
        window.start = fromEpochMs(toEpochMs(now) - period.count());
        return window;
    }

    // Anchor on the oldest sample, tolerating producers that send unsorted data
    auto oldest = std::min_element(
        series.begin(), series.end(),
        [](const PingSample& a, const PingSample& b) { return a.timestamp < b.timestamp; });

    window.start = fromEpochMs(oldest->epochMs());
    window.end = fromEpochMs(oldest->epochMs() + period.count());
    return window;
}

LabelGranularity labelGranularity(int periodHours) {
    if (periodHours <= 1)
        return LabelGranularity::TimeWithSeconds;
    if (periodHours <= 24)
        return LabelGranularity::TimeOfDay;
    if (periodHours <= 168)
        return LabelGranularity::WeekdayHour;
    if (periodHours <= 720)
        return LabelGranularity::DayMonth;
    return LabelGranularity::MonthYear;
}

int xAxisLabelCount(int periodHours) {
    if (periodHours > 720)
        return 8;
    if (periodHours > 168)
        return 7;
    return 6;
}

std::string formatTimeLabel(std::chrono::system_clock::time_point t,
                            LabelGranularity granularity, TimeZoneMode zone) {
    const std::tm calendar = toCalendarTime(t, zone);

    switch (granularity) {
    case LabelGranularity::TimeWithSeconds:
        return formatCalendar(calendar, "%H:%M:%S");
    case LabelGranularity::TimeOfDay:
        return formatCalendar(calendar, "%H:%M");
    case LabelGranularity::WeekdayHour:
        return formatCalendar(calendar, "%a %Hh");
    case LabelGranularity::DayMonth:
        return formatCalendar(calendar, "%d %b");
    case LabelGranularity::MonthYear:
        return formatCalendar(calendar, "%b %y");
    }
    return formatCalendar(calendar, "%H:%M");
}

std::string formatTimestamp(std::chrono::system_clock::time_point t, TimeZoneMode zone) {
    return formatCalendar(toCalendarTime(t, zone), "%Y-%m-%d %H:%M:%S");
}

} // namespace pingscope::core
