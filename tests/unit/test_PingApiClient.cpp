#include <catch2/catch_test_macros.hpp>

#include "infrastructure/api/PingApiClient.hpp"

#include <QApplication>

using namespace pingscope::infra;

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

} // namespace

TEST_CASE("PingApiClient endpoint URLs", "[PingApiClient]") {
    REQUIRE(ensureQApplication());
    HttpClient http;
    PingApiClient client(http, ApiSettings{"https://monitor.example.com/api", "", 5000});

    SECTION("Widget endpoints") {
        REQUIRE(client.widgetDataUrl(7) == "https://monitor.example.com/api/ping/widget/7/data");
        REQUIRE(client.currentStatusUrl(7) == "https://monitor.example.com/api/widgets/7/data");
    }

    SECTION("History and statistics carry the period") {
        REQUIRE(client.historyUrl("8.8.8.8", 24, std::nullopt) ==
                "https://monitor.example.com/api/ping/history/8.8.8.8?hours=24");
        REQUIRE(client.statisticsUrl("8.8.8.8", 168, 3) ==
                "https://monitor.example.com/api/ping/statistics/8.8.8.8?hours=168&widget_id=3");
    }

    SECTION("Targets are percent-encoded") {
        REQUIRE(client.historyUrl("fe80::1", 1, std::nullopt) ==
                "https://monitor.example.com/api/ping/history/fe80%3A%3A1?hours=1");
        REQUIRE(client.historyUrl("my host/1", 1, std::nullopt) ==
                "https://monitor.example.com/api/ping/history/my%20host%2F1?hours=1");
    }
}

TEST_CASE("PingApiClient settings", "[PingApiClient]") {
    REQUIRE(ensureQApplication());
    HttpClient http;
    PingApiClient client(http, ApiSettings{});

    SECTION("Defaults point at the local backend") {
        REQUIRE(client.settings().baseUrl == "http://localhost:8000/api");
        REQUIRE(client.settings().timeoutMs == 10000);
        REQUIRE(client.settings().displayDefaults == pingscope::core::ThresholdConfig{});
        REQUIRE(client.widgetDataUrl(1) == "http://localhost:8000/api/ping/widget/1/data");
    }

    SECTION("Trailing slashes are ignored") {
        client.setSettings(ApiSettings{"http://host:9000/api//", "secret", 2000});

        REQUIRE(client.settings().token == "secret");
        REQUIRE(client.currentStatusUrl(2) == "http://host:9000/api/widgets/2/data");
    }

    SECTION("Cancelling an unknown request is harmless") {
        client.cancel(12345);
        REQUIRE(http.pendingCount() == 0);
    }
}
