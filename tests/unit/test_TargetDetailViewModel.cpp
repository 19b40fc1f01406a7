#include <catch2/catch_test_macros.hpp>

#include "helpers/FakePingDataSource.hpp"
#include "helpers/SampleBuilders.hpp"
#include "viewmodels/TargetDetailViewModel.hpp"

#include <QApplication>

using namespace pingscope::core;
using namespace pingscope::viewmodels;
using namespace pingscope::testing;

using Kind = FakePingDataSource::Kind;

namespace {

bool ensureQApplication() {
    static int argc = 1;
    static char* argv[] = {const_cast<char*>("test")};
    static QApplication* app = nullptr;
    if (!QApplication::instance()) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
        app = new QApplication(argc, argv);
    }
    return true;
}

PingTarget seededTarget() {
    return makeTarget("8.8.8.8", reachable(0, 1, 2, 3),
                      {reachable(0, 1, 2, 3), reachable(60000, 1, 2, 3)},
                      makeStatistics(1440, 99.9, 1));
}

PingSeries weekSeries(std::size_t count) {
    PingSeries series;
    for (std::size_t i = 0; i < count; ++i) {
        series.push_back(reachable(static_cast<int64_t>(i) * 3600000, 5, 10, 15));
    }
    return series;
}

} // namespace

TEST_CASE("TargetDetailViewModel reuses the widget payload", "[TargetDetailViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    TargetDetailViewModel vm(source);
    int dataChanged = 0;
    QObject::connect(&vm, &TargetDetailViewModel::dataChanged, [&]() { ++dataChanged; });

    SECTION("Default period matching the payload window needs no fetch") {
        vm.open(seededTarget(), 7, 24);

        REQUIRE(vm.isOpen());
        REQUIRE(vm.period() == TimePeriod::OneDay);
        REQUIRE(vm.series().size() == 2);
        REQUIRE(vm.statistics()->totalMeasurements == 1440);
        REQUIRE_FALSE(vm.isLoading());
        REQUIRE(source->requests().empty());
        REQUIRE(dataChanged == 1);
    }

    SECTION("Without a widget scope the payload is all there is") {
        vm.open(seededTarget(), std::nullopt, 6);
        vm.selectPeriod(TimePeriod::SevenDays);

        REQUIRE(vm.period() == TimePeriod::SevenDays);
        REQUIRE(vm.series().size() == 2);
        REQUIRE(source->requests().empty());
    }

    SECTION("Payload window shorter than the default period is refetched") {
        vm.open(seededTarget(), 7, 6);

        REQUIRE(vm.isLoading());
        REQUIRE(vm.series().size() == 2);
        REQUIRE(source->last(Kind::History)->hours == 24);
        REQUIRE(source->last(Kind::Statistics)->scope == 7);
    }
}

TEST_CASE("TargetDetailViewModel period fetch", "[TargetDetailViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    TargetDetailViewModel vm(source);
    std::vector<bool> loading;
    QObject::connect(&vm, &TargetDetailViewModel::loadingChanged,
                     [&](bool l) { loading.push_back(l); });

    vm.open(seededTarget(), 7, 24);
    vm.selectPeriod(TimePeriod::SevenDays);

    REQUIRE(vm.isLoading());
    auto history = source->last(Kind::History);
    auto stats = source->last(Kind::Statistics);
    REQUIRE(history->target == "8.8.8.8");
    REQUIRE(history->hours == 168);
    REQUIRE(history->scope == 7);
    REQUIRE(stats->hours == 168);

    SECTION("Data swaps only once both halves arrived") {
        REQUIRE(source->complete(history->id, FakePingDataSource::ok(weekSeries(168))));
        REQUIRE(vm.isLoading());
        REQUIRE(vm.series().size() == 2);

        REQUIRE(source->complete(stats->id, FakePingDataSource::ok(makeStatistics(168, 95.0, 8))));
        REQUIRE_FALSE(vm.isLoading());
        REQUIRE(vm.series().size() == 168);
        REQUIRE(vm.statistics()->outages == 8);
        REQUIRE(loading == std::vector<bool>{true, false});
    }

    SECTION("Statistics may arrive first") {
        REQUIRE(source->complete(stats->id, FakePingDataSource::ok(makeStatistics(168, 95.0, 8))));
        REQUIRE(vm.statistics()->outages == 1);

        REQUIRE(source->complete(history->id, FakePingDataSource::ok(weekSeries(3))));
        REQUIRE(vm.series().size() == 3);
        REQUIRE(vm.statistics()->outages == 8);
    }

    SECTION("Failure keeps previous data and reports the error") {
        REQUIRE(source->complete(history->id,
                                 FakePingDataSource::failed<PingSeries>("HTTP error: 502")));

        REQUIRE_FALSE(vm.isLoading());
        REQUIRE(vm.errorMessage() == "HTTP error: 502");
        REQUIRE(vm.series().size() == 2);
        REQUIRE(source->wasCancelled(stats->id));
    }

    SECTION("Switching back to the payload period drops the fetch") {
        vm.selectPeriod(TimePeriod::OneDay);

        REQUIRE_FALSE(vm.isLoading());
        REQUIRE(source->wasCancelled(history->id));
        REQUIRE(source->wasCancelled(stats->id));
        REQUIRE(vm.series().size() == 2);
    }

    SECTION("Selecting the current period again while loading does nothing") {
        auto before = source->requests().size();
        vm.selectPeriod(TimePeriod::SevenDays);
        REQUIRE(source->requests().size() == before);
    }

    SECTION("Selecting the failed period again retries it") {
        REQUIRE(source->complete(history->id,
                                 FakePingDataSource::failed<PingSeries>("HTTP error: 502")));
        auto before = source->count(Kind::History);

        vm.selectPeriod(TimePeriod::SevenDays);

        REQUIRE(source->count(Kind::History) == before + 1);
        auto retry = source->last(Kind::History);
        REQUIRE(retry->hours == 168);
        REQUIRE(retry->id != history->id);
        REQUIRE(vm.isLoading());
        REQUIRE(vm.errorMessage().isEmpty());

        REQUIRE(source->complete(retry->id, FakePingDataSource::ok(weekSeries(168))));
        REQUIRE(source->complete(source->last(Kind::Statistics)->id,
                                 FakePingDataSource::ok(makeStatistics(168, 95.0, 8))));
        REQUIRE(vm.series().size() == 168);
        REQUIRE(vm.statistics()->outages == 8);
    }
}

TEST_CASE("TargetDetailViewModel ignores superseded responses", "[TargetDetailViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    source->setHonourCancel(false);
    TargetDetailViewModel vm(source);

    vm.open(seededTarget(), 7, 24);
    vm.selectPeriod(TimePeriod::SevenDays);
    auto weekHistory = source->last(Kind::History)->id;
    auto weekStats = source->last(Kind::Statistics)->id;

    vm.selectPeriod(TimePeriod::ThirtyDays);
    auto monthHistory = source->last(Kind::History)->id;
    auto monthStats = source->last(Kind::Statistics)->id;

    SECTION("Responses for the old period are dropped") {
        source->complete(weekHistory, FakePingDataSource::ok(weekSeries(168)));
        source->complete(weekStats, FakePingDataSource::ok(makeStatistics(168, 90.0, 2)));

        REQUIRE(vm.isLoading());
        REQUIRE(vm.series().size() == 2);

        source->complete(monthHistory, FakePingDataSource::ok(weekSeries(720)));
        source->complete(monthStats, FakePingDataSource::ok(makeStatistics(720, 98.0, 4)));

        REQUIRE_FALSE(vm.isLoading());
        REQUIRE(vm.period() == TimePeriod::ThirtyDays);
        REQUIRE(vm.series().size() == 720);
    }

    SECTION("Late sibling after a failure is dropped") {
        source->complete(monthHistory, FakePingDataSource::failed<PingSeries>("boom"));
        source->complete(monthStats, FakePingDataSource::ok(makeStatistics(720, 98.0, 4)));

        REQUIRE(vm.statistics()->totalMeasurements == 1440);
        REQUIRE(vm.errorMessage() == "boom");
    }
}

TEST_CASE("TargetDetailViewModel close and reopen", "[TargetDetailViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    TargetDetailViewModel vm(source);
    std::vector<TimePeriod> periods;
    QObject::connect(&vm, &TargetDetailViewModel::periodChanged,
                     [&](TimePeriod p) { periods.push_back(p); });

    vm.open(seededTarget(), 7, 24);
    vm.selectPeriod(TimePeriod::NinetyDays);
    auto history = source->last(Kind::History)->id;

    SECTION("Close cancels outstanding requests") {
        vm.close();

        REQUIRE_FALSE(vm.isOpen());
        REQUIRE_FALSE(vm.isLoading());
        REQUIRE(source->wasCancelled(history));
        REQUIRE(source->pendingCount() == 0);
    }

    SECTION("Period changes are ignored while closed") {
        vm.close();
        vm.selectPeriod(TimePeriod::OneHour);
        REQUIRE(vm.period() == TimePeriod::NinetyDays);
    }

    SECTION("Reopening resets to the default period") {
        vm.close();
        vm.open(makeTarget("1.1.1.1", reachable(0, 1, 2, 3)), 7, 24);

        REQUIRE(vm.period() == TimePeriod::OneDay);
        REQUIRE(vm.target().address == "1.1.1.1");
        REQUIRE(vm.series().empty());
        REQUIRE_FALSE(vm.statistics().has_value());
        REQUIRE(periods == std::vector<TimePeriod>{TimePeriod::NinetyDays, TimePeriod::OneDay});
    }
}
