#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/graph/HitTester.hpp"
#include "core/graph/TimeWindow.hpp"
#include "helpers/SampleBuilders.hpp"
#include "ui/graph/CompactGraphRenderer.hpp"
#include "ui/graph/DetailedGraphRenderer.hpp"

#include <QApplication>
#include <QImage>

using namespace pingscope::core;
using namespace pingscope::ui;
using namespace pingscope::testing;

namespace {

constexpr std::size_t SAMPLE_COUNT = 10000;

bool ensureQApplication() {
    static int argc = 1;
    static char* argv[] = {const_cast<char*>("bench")};
    static QApplication* app = nullptr;
    if (!QApplication::instance()) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
        app = new QApplication(argc, argv);
    }
    return true;
}

// One sample a minute with an outage every 97 minutes and loss every 13
PingSeries largeSeries() {
    PingSeries series;
    series.reserve(SAMPLE_COUNT);
    for (std::size_t i = 0; i < SAMPLE_COUNT; ++i) {
        const auto offset = static_cast<int64_t>(i) * 60000;
        if (i % 97 == 0) {
            series.push_back(unreachable(offset));
            continue;
        }
        const double avg = 20.0 + static_cast<double>(i % 50);
        const double loss = i % 13 == 0 ? 5.0 : 0.0;
        series.push_back(reachable(offset, avg - 5.0, avg, avg + 15.0, loss, 1.5));
    }
    return series;
}

} // namespace

// =============================================================================
// Graph Layout Benchmarks
// =============================================================================

TEST_CASE("Compact graph benchmarks", "[benchmark][CompactGraph]") {
    REQUIRE(ensureQApplication());
    const auto series = largeSeries();
    CompactGraphRenderer renderer;

    BENCHMARK("Compact layout of 10k samples") {
        return renderer.layout(series, QSizeF(300, 100));
    };

    QImage surface(300, 100, QImage::Format_ARGB32_Premultiplied);
    BENCHMARK("Compact raster of 10k samples") {
        renderCompact(surface, series, CompactGraphOptions{});
        return surface.pixel(0, 0);
    };
}

TEST_CASE("Detailed graph benchmarks", "[benchmark][DetailedGraph]") {
    REQUIRE(ensureQApplication());
    const auto series = largeSeries();
    DetailedGraphOptions options;
    options.period = TimePeriod::SevenDays;
    options.timeZone = TimeZoneMode::Utc;
    DetailedGraphRenderer renderer(options);

    BENCHMARK("Detailed layout of 10k samples") {
        return renderer.layout(series, QSizeF(760, 340));
    };

    QImage surface(760, 340, QImage::Format_ARGB32_Premultiplied);
    BENCHMARK("Detailed raster of 10k samples") {
        renderDetailed(surface, series, options);
        return surface.pixel(0, 0);
    };
}

TEST_CASE("Hit testing benchmarks", "[benchmark][HitTester]") {
    const auto series = largeSeries();
    const auto window = resolveWindow(series, periodHours(TimePeriod::SevenDays));
    HitTester tester(window, 680.0, 60.0);

    BENCHMARK("Nearest sample in 10k samples") {
        return tester.nearestIndex(400.0, series);
    };
}
