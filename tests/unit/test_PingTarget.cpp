#include <catch2/catch_test_macros.hpp>

#include "core/types/PingTarget.hpp"
#include "core/types/PingWidgetData.hpp"
#include "helpers/SampleBuilders.hpp"

using namespace pingscope::core;
using namespace pingscope::testing;

TEST_CASE("evaluateStatus", "[PingTarget]") {
    ThresholdConfig config;

    SECTION("Unreachable sample is critical") {
        REQUIRE(evaluateStatus(unreachable(0), config) == TargetStatus::Critical);
    }

    SECTION("Packet loss is checked before latency") {
        REQUIRE(evaluateStatus(reachable(0, 1, 2, 3, 20.0), config) == TargetStatus::Critical);
        REQUIRE(evaluateStatus(reachable(0, 1, 2, 3, 5.0), config) == TargetStatus::Warning);
        REQUIRE(evaluateStatus(reachable(0, 1, 2, 3, 4.9), config) == TargetStatus::Ok);
    }

    SECTION("Latency thresholds are inclusive") {
        REQUIRE(evaluateStatus(reachable(0, 90, 99.9, 110), config) == TargetStatus::Ok);
        REQUIRE(evaluateStatus(reachable(0, 90, 100.0, 110), config) == TargetStatus::Warning);
        REQUIRE(evaluateStatus(reachable(0, 400, 500.0, 600), config) == TargetStatus::Critical);
    }

    SECTION("Custom thresholds are honoured") {
        config.latencyWarningMs = 10.0;
        config.latencyCriticalMs = 20.0;
        REQUIRE(evaluateStatus(reachable(0, 10, 15, 20), config) == TargetStatus::Warning);
    }
}

TEST_CASE("latencyLevel", "[PingTarget]") {
    ThresholdConfig config;

    REQUIRE(latencyLevel(std::nullopt, config) == TargetStatus::Ok);
    REQUIRE(latencyLevel(50.0, config) == TargetStatus::Ok);
    REQUIRE(latencyLevel(150.0, config) == TargetStatus::Warning);
    REQUIRE(latencyLevel(750.0, config) == TargetStatus::Critical);
}

TEST_CASE("uptimeLevel", "[PingTarget]") {
    REQUIRE(uptimeLevel(100.0) == UptimeLevel::Good);
    REQUIRE(uptimeLevel(99.0) == UptimeLevel::Good);
    REQUIRE(uptimeLevel(98.99) == UptimeLevel::Degraded);
    REQUIRE(uptimeLevel(95.0) == UptimeLevel::Degraded);
    REQUIRE(uptimeLevel(94.9) == UptimeLevel::Poor);
}

TEST_CASE("TargetStatus string conversion", "[PingTarget]") {
    REQUIRE(statusToString(TargetStatus::Ok) == "ok");
    REQUIRE(statusToString(TargetStatus::Warning) == "warning");
    REQUIRE(statusToString(TargetStatus::Critical) == "critical");

    REQUIRE(statusFromString("warning") == TargetStatus::Warning);
    REQUIRE_FALSE(statusFromString("degraded").has_value());
}

TEST_CASE("PingTarget display and status", "[PingTarget]") {
    auto target = makeTarget("10.0.0.1", reachable(0, 1, 150, 200));

    SECTION("Display name falls back to the address") {
        target.name.clear();
        REQUIRE(target.displayName() == "10.0.0.1");

        target.name = "Gateway";
        REQUIRE(target.displayName() == "Gateway");
    }

    SECTION("Locally evaluated status without backend status") {
        REQUIRE(target.effectiveStatus(ThresholdConfig{}) == TargetStatus::Warning);
    }

    SECTION("Backend status wins over local evaluation") {
        target.status = TargetStatus::Ok;
        REQUIRE(target.effectiveStatus(ThresholdConfig{}) == TargetStatus::Ok);
    }
}

TEST_CASE("ThresholdConfig validation", "[ThresholdConfig]") {
    ThresholdConfig config;
    REQUIRE(config.isValid());

    SECTION("Critical latency must exceed warning") {
        config.latencyCriticalMs = config.latencyWarningMs;
        REQUIRE_FALSE(config.isValid());
    }

    SECTION("Loss thresholds must be ordered and within range") {
        config.lossCriticalPercent = 120.0;
        REQUIRE_FALSE(config.isValid());

        config.lossCriticalPercent = 2.0;
        REQUIRE_FALSE(config.isValid());
    }

    SECTION("Graph height and history must be positive") {
        config.graphHeightPx = 0;
        REQUIRE_FALSE(config.isValid());
    }
}

TEST_CASE("PingWidgetData aggregates", "[PingWidgetData]") {
    PingWidgetData data;
    data.targets.push_back(makeTarget("a", reachable(0, 1, 10, 20), {reachable(0, 1, 2, 3)}));
    data.targets.push_back(makeTarget("b", reachable(0, 1, 200, 300),
                                      {reachable(0, 1, 2, 3), reachable(1, 1, 2, 3),
                                       unreachable(2)}));
    data.targets.push_back(makeTarget("c", unreachable(0)));

    SECTION("Status counts") {
        auto counts = data.statusCounts();
        REQUIRE(counts.ok == 1);
        REQUIRE(counts.warning == 1);
        REQUIRE(counts.critical == 1);
    }

    SECTION("Longest history") {
        REQUIRE(data.maxHistoryLength() == 3);
    }

    SECTION("Lookup by address") {
        REQUIRE(data.findTarget("b") == &data.targets[1]);
        REQUIRE(data.findTarget("missing") == nullptr);
    }
}
