#include <catch2/catch_test_macros.hpp>

#include "helpers/FakePingDataSource.hpp"
#include "helpers/SampleBuilders.hpp"
#include "viewmodels/PingWidgetViewModel.hpp"

#include <QApplication>

#include <vector>

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

PingWidgetData snapshot(std::initializer_list<std::string> addresses) {
    PingWidgetData data;
    for (const auto& address : addresses) {
        data.targets.push_back(makeTarget(address, reachable(0, 1, 2, 3), {reachable(0, 1, 2, 3)}));
    }
    data.fetchedAt = at(0);
    return data;
}

struct SignalLog {
    std::vector<WidgetState> states;
    int dataChanged{0};
    int dataReady{0};
    std::vector<QString> errors;
    std::vector<QString> zoomOpened;
    int zoomClosed{0};

    explicit SignalLog(PingWidgetViewModel& vm) {
        QObject::connect(&vm, &PingWidgetViewModel::stateChanged,
                         [this](WidgetState s) { states.push_back(s); });
        QObject::connect(&vm, &PingWidgetViewModel::dataChanged, [this]() { ++dataChanged; });
        QObject::connect(&vm, &PingWidgetViewModel::dataReady,
                         [this](const PingWidgetData&) { ++dataReady; });
        QObject::connect(&vm, &PingWidgetViewModel::errorChanged,
                         [this](const QString& e) { errors.push_back(e); });
        QObject::connect(&vm, &PingWidgetViewModel::zoomOpened,
                         [this](const QString& t) { zoomOpened.push_back(t); });
        QObject::connect(&vm, &PingWidgetViewModel::zoomClosed, [this]() { ++zoomClosed; });
    }
};

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("PingWidgetViewModel initial state", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    PingWidgetViewModel vm(source);

    REQUIRE(vm.state() == WidgetState::Idle);
    REQUIRE_FALSE(vm.data().has_value());
    REQUIRE_FALSE(vm.isActive());
    REQUIRE_FALSE(vm.hasValidWidgetId());
    REQUIRE(vm.pollInterval() == std::chrono::seconds(60));
    REQUIRE(vm.fallbackInterval() == std::chrono::seconds(30));
    REQUIRE(source->requests().empty());
}

TEST_CASE("PingWidgetViewModel missing widget id", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    PingWidgetViewModel vm(source);
    SignalLog log(vm);

    vm.activate();

    REQUIRE(vm.state() == WidgetState::Error);
    REQUIRE(vm.errorMessage() == "Widget id missing - please reconfigure the widget");
    REQUIRE(source->requests().empty());
    REQUIRE_FALSE(vm.isPollScheduled());

    SECTION("Configuring an id starts fetching") {
        vm.setWidgetId(4);

        REQUIRE(vm.state() == WidgetState::Loading);
        REQUIRE(source->last(Kind::WidgetData)->widgetId == 4);
    }
}

TEST_CASE("PingWidgetViewModel primary fetch", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    PingWidgetViewModel vm(source);
    SignalLog log(vm);
    vm.setWidgetId(7);

    vm.activate();
    REQUIRE(vm.state() == WidgetState::Loading);
    REQUIRE(source->count(Kind::WidgetData) == 1);

    auto first = source->last(Kind::WidgetData)->id;
    REQUIRE(source->complete(first, FakePingDataSource::ok(snapshot({"a", "b"}))));

    REQUIRE(vm.state() == WidgetState::Data);
    REQUIRE(vm.data()->targets.size() == 2);
    REQUIRE(vm.data()->hasHistory);
    REQUIRE_FALSE(vm.usingFallback());
    REQUIRE(vm.isPollScheduled());
    REQUIRE(vm.currentInterval() == std::chrono::seconds(60));
    REQUIRE(log.dataChanged == 1);
    REQUIRE(log.dataReady == 1);
    REQUIRE(log.states == std::vector<WidgetState>{WidgetState::Loading, WidgetState::Data});

    SECTION("Refresh keeps the snapshot visible") {
        vm.refresh();
        REQUIRE(vm.state() == WidgetState::Refreshing);
        REQUIRE(vm.data().has_value());

        auto second = source->last(Kind::WidgetData)->id;
        REQUIRE(source->complete(second, FakePingDataSource::ok(snapshot({"c"}))));

        REQUIRE(vm.state() == WidgetState::Data);
        REQUIRE(vm.data()->targets.size() == 1);
        REQUIRE(log.dataReady == 2);
    }

    SECTION("Backend error keeps the stale snapshot") {
        vm.refresh();
        auto data = snapshot({});
        data.error = "Widget not found";
        REQUIRE(source->complete(source->last(Kind::WidgetData)->id,
                                 FakePingDataSource::ok(data)));

        REQUIRE(vm.state() == WidgetState::Error);
        REQUIRE(vm.errorMessage() == "Widget not found");
        REQUIRE(vm.data()->targets.size() == 2);
        REQUIRE(source->count(Kind::CurrentStatus) == 0);
        REQUIRE(vm.isPollScheduled());
    }

    SECTION("Next success clears the error") {
        vm.refresh();
        auto data = snapshot({});
        data.error = "Temporary";
        source->complete(source->last(Kind::WidgetData)->id, FakePingDataSource::ok(data));
        REQUIRE_FALSE(vm.errorMessage().isEmpty());

        vm.refresh();
        source->complete(source->last(Kind::WidgetData)->id,
                         FakePingDataSource::ok(snapshot({"a"})));
        REQUIRE(vm.state() == WidgetState::Data);
        REQUIRE(vm.errorMessage().isEmpty());
    }
}

// =============================================================================
// Fallback
// =============================================================================

TEST_CASE("PingWidgetViewModel fallback endpoint", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    PingWidgetViewModel vm(source);
    SignalLog log(vm);
    vm.setWidgetId(7);
    vm.activate();

    REQUIRE(source->complete(source->last(Kind::WidgetData)->id,
                             FakePingDataSource::failed<PingWidgetData>("HTTP error: 500")));

    REQUIRE(vm.state() == WidgetState::Loading);
    REQUIRE(source->count(Kind::CurrentStatus) == 1);
    REQUIRE(source->last(Kind::CurrentStatus)->widgetId == 7);

    SECTION("Fallback success switches to the fallback interval") {
        auto data = snapshot({"a"});
        data.hasHistory = false;
        REQUIRE(source->complete(source->last(Kind::CurrentStatus)->id,
                                 FakePingDataSource::ok(data)));

        REQUIRE(vm.state() == WidgetState::Data);
        REQUIRE(vm.usingFallback());
        REQUIRE(vm.currentInterval() == std::chrono::seconds(30));
        REQUIRE_FALSE(vm.data()->hasHistory);

        SECTION("Primary recovery switches back") {
            vm.refresh();
            REQUIRE(source->complete(source->last(Kind::WidgetData)->id,
                                     FakePingDataSource::ok(snapshot({"a"}))));
            REQUIRE_FALSE(vm.usingFallback());
            REQUIRE(vm.currentInterval() == std::chrono::seconds(60));
        }
    }

    SECTION("Both endpoints failing reports a generic error") {
        REQUIRE(source->complete(source->last(Kind::CurrentStatus)->id,
                                 FakePingDataSource::failed<PingWidgetData>("timeout")));

        REQUIRE(vm.state() == WidgetState::Error);
        REQUIRE(vm.errorMessage() == "Unable to fetch ping data");
        REQUIRE_FALSE(vm.data().has_value());
        REQUIRE(vm.isPollScheduled());
        REQUIRE(log.dataChanged == 0);
    }
}

// =============================================================================
// Ordering and cancellation
// =============================================================================

TEST_CASE("PingWidgetViewModel discards superseded responses", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    PingWidgetViewModel vm(source);
    SignalLog log(vm);
    vm.setWidgetId(7);

    SECTION("Refresh cancels the request in flight") {
        vm.activate();
        auto first = source->last(Kind::WidgetData)->id;

        vm.refresh();
        auto second = source->last(Kind::WidgetData)->id;

        REQUIRE(first != second);
        REQUIRE(source->wasCancelled(first));
        REQUIRE_FALSE(source->complete(first, FakePingDataSource::ok(snapshot({"old"}))));
        REQUIRE(source->isPending(second));
    }

    SECTION("Late answers to cancelled requests are ignored") {
        source->setHonourCancel(false);
        vm.activate();
        auto first = source->last(Kind::WidgetData)->id;
        vm.refresh();
        auto second = source->last(Kind::WidgetData)->id;

        REQUIRE(source->complete(second, FakePingDataSource::ok(snapshot({"new"}))));
        REQUIRE(source->complete(first, FakePingDataSource::ok(snapshot({"old", "older"}))));

        REQUIRE(vm.data()->targets.size() == 1);
        REQUIRE(vm.data()->targets[0].address == "new");
        REQUIRE(log.dataChanged == 1);
    }

    SECTION("Stale failures do not trigger a fallback") {
        source->setHonourCancel(false);
        vm.activate();
        auto first = source->last(Kind::WidgetData)->id;
        vm.refresh();

        REQUIRE(source->complete(first, FakePingDataSource::failed<PingWidgetData>("late")));
        REQUIRE(source->count(Kind::CurrentStatus) == 0);
        REQUIRE(vm.state() == WidgetState::Loading);
    }
}

TEST_CASE("PingWidgetViewModel deactivation", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    PingWidgetViewModel vm(source);
    vm.setWidgetId(7);
    vm.activate();

    SECTION("While loading returns to idle") {
        auto id = source->last(Kind::WidgetData)->id;
        vm.deactivate();

        REQUIRE(vm.state() == WidgetState::Idle);
        REQUIRE(source->wasCancelled(id));
        REQUIRE(source->pendingCount() == 0);
        REQUIRE_FALSE(vm.isPollScheduled());
    }

    SECTION("While refreshing keeps the snapshot") {
        source->complete(source->last(Kind::WidgetData)->id,
                         FakePingDataSource::ok(snapshot({"a"})));
        vm.refresh();
        vm.deactivate();

        REQUIRE(vm.state() == WidgetState::Data);
        REQUIRE(vm.data().has_value());
        REQUIRE_FALSE(vm.isPollScheduled());
    }

    SECTION("Refresh is ignored while inactive") {
        vm.deactivate();
        auto before = source->requests().size();
        vm.refresh();
        REQUIRE(source->requests().size() == before);
    }

    SECTION("Reactivation starts a new cycle") {
        vm.deactivate();
        vm.activate();
        REQUIRE(source->count(Kind::WidgetData) == 2);
        REQUIRE(vm.state() == WidgetState::Loading);
    }
}

TEST_CASE("PingWidgetViewModel widget id changes", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    auto source = std::make_shared<FakePingDataSource>();
    PingWidgetViewModel vm(source);
    SignalLog log(vm);
    vm.setWidgetId(7);
    vm.activate();
    source->complete(source->last(Kind::WidgetData)->id, FakePingDataSource::ok(snapshot({"a"})));
    vm.openZoom("a");

    SECTION("Switching while active drops data and refetches") {
        vm.setWidgetId(8);

        REQUIRE_FALSE(vm.data().has_value());
        REQUIRE(log.dataChanged == 2);
        REQUIRE(log.zoomClosed == 1);
        REQUIRE(vm.state() == WidgetState::Loading);
        REQUIRE(source->last(Kind::WidgetData)->widgetId == 8);
    }

    SECTION("Switching while inactive goes idle") {
        vm.deactivate();
        vm.setWidgetId(8);

        REQUIRE(vm.state() == WidgetState::Idle);
        REQUIRE(vm.errorMessage().isEmpty());
        REQUIRE(source->count(Kind::WidgetData) == 1);
    }

    SECTION("Same id is a no-op") {
        vm.setWidgetId(7);
        REQUIRE(vm.data().has_value());
        REQUIRE(source->count(Kind::WidgetData) == 1);
    }
}

// =============================================================================
// Settings and zoom
// =============================================================================

TEST_CASE("PingWidgetViewModel intervals", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    PingWidgetViewModel vm(std::make_shared<FakePingDataSource>());

    vm.setPollInterval(std::chrono::seconds(15));
    vm.setFallbackInterval(std::chrono::seconds(0));

    REQUIRE(vm.pollInterval() == std::chrono::seconds(15));
    REQUIRE(vm.fallbackInterval() == std::chrono::seconds(1));
    REQUIRE(vm.currentInterval() == std::chrono::seconds(15));
}

TEST_CASE("PingWidgetViewModel zoom requests", "[PingWidgetViewModel]") {
    REQUIRE(ensureQApplication());
    PingWidgetViewModel vm(std::make_shared<FakePingDataSource>());
    SignalLog log(vm);

    vm.openZoom("8.8.8.8");
    REQUIRE(vm.zoomedTarget() == std::string("8.8.8.8"));
    REQUIRE(log.zoomOpened == std::vector<QString>{"8.8.8.8"});

    vm.closeZoom();
    vm.closeZoom();
    REQUIRE_FALSE(vm.zoomedTarget().has_value());
    REQUIRE(log.zoomClosed == 1);
}

TEST_CASE("WidgetState names", "[PingWidgetViewModel]") {
    REQUIRE(widgetStateToString(WidgetState::Idle) == "idle");
    REQUIRE(widgetStateToString(WidgetState::Refreshing) == "refreshing");
    REQUIRE(widgetStateToString(WidgetState::Error) == "error");
}
