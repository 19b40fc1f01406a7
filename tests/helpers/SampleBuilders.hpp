#pragma once

#include "core/types/PingSample.hpp"
#include "core/types/PingTarget.hpp"
#include "core/types/PingWidgetData.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace pingscope::testing {

/// 2023-11-14 22:13:20 UTC
inline constexpr int64_t BASE_EPOCH_MS = 1700000000000LL;

inline std::chrono::system_clock::time_point at(int64_t offsetMs) {
    return core::fromEpochMs(BASE_EPOCH_MS + offsetMs);
}

inline core::PingSample reachable(int64_t offsetMs, double minMs, double avgMs, double maxMs,
                                  double lossPercent = 0.0,
                                  std::optional<double> jitter = std::nullopt) {
    core::PingSample sample;
    sample.timestamp = at(offsetMs);
    sample.isReachable = true;
    sample.latencyMin = minMs;
    sample.latencyAvg = avgMs;
    sample.latencyMax = maxMs;
    sample.jitter = jitter;
    sample.packetLossPercent = lossPercent;
    return sample;
}

inline core::PingSample unreachable(int64_t offsetMs) {
    core::PingSample sample;
    sample.timestamp = at(offsetMs);
    sample.isReachable = false;
    sample.packetLossPercent = 100.0;
    return sample;
}

inline core::PingTarget makeTarget(const std::string& address, core::PingSample current,
                                   core::PingSeries history = {},
                                   std::optional<core::PingStatistics> statistics = std::nullopt) {
    core::PingTarget target;
    target.address = address;
    target.name = address;
    target.current = current;
    target.history = std::move(history);
    target.statistics = statistics;
    return target;
}

inline core::PingStatistics makeStatistics(int total, double uptime, int outages) {
    core::PingStatistics stats;
    stats.totalMeasurements = total;
    stats.avgLatency = 20.0;
    stats.minLatency = 8.0;
    stats.maxLatency = 95.5;
    stats.avgJitter = 3.25;
    stats.avgPacketLoss = 1.5;
    stats.uptimePercent = uptime;
    stats.outages = outages;
    return stats;
}

} // namespace pingscope::testing
