#include <catch2/catch_test_macros.hpp>

#include "core/types/TimePeriod.hpp"

using namespace pingscope::core;

TEST_CASE("TimePeriod hours and labels", "[TimePeriod]") {
    REQUIRE(periodHours(TimePeriod::OneHour) == 1);
    REQUIRE(periodHours(TimePeriod::SevenDays) == 168);
    REQUIRE(periodHours(TimePeriod::OneYear) == 8760);

    REQUIRE(periodLabel(TimePeriod::SixHours) == "6 hours");
    REQUIRE(periodLabel(TimePeriod::NinetyDays) == "90 days");

    REQUIRE(DEFAULT_DETAIL_PERIOD == TimePeriod::OneDay);
}

TEST_CASE("TimePeriod enumeration", "[TimePeriod]") {
    const auto& periods = allPeriods();

    REQUIRE(periods.size() == 7);
    REQUIRE(periods.front() == TimePeriod::OneHour);
    REQUIRE(periods.back() == TimePeriod::OneYear);
    for (std::size_t i = 1; i < periods.size(); ++i) {
        REQUIRE(periodHours(periods[i - 1]) < periodHours(periods[i]));
    }
}

TEST_CASE("periodFromHours", "[TimePeriod]") {
    REQUIRE(periodFromHours(720) == TimePeriod::ThirtyDays);
    REQUIRE(periodFromHours(24) == TimePeriod::OneDay);
    REQUIRE_FALSE(periodFromHours(12).has_value());
    REQUIRE_FALSE(periodFromHours(0).has_value());
}
