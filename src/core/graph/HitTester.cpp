#include "core/graph/HitTester.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace pingscope::core {

namespace {

std::string formatFixed(double value, int decimals) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return buffer;
}

} // namespace

HitTester::HitTester(const TimeWindow& window, double graphWidth, double leftMargin)
    : window_(window), graphWidth_(graphWidth), leftMargin_(leftMargin) {}

double HitTester::timeAtPointer(double pointerX) const {
    const double ratio = (pointerX - leftMargin_) / graphWidth_;
    return static_cast<double>(toEpochMs(window_.start)) + window_.durationMs() * ratio;
}

double HitTester::snapDistanceMs() const {
    const double duration = window_.durationMs();
    return std::min(duration * SNAP_WINDOW_FRACTION, SNAP_PIXELS * duration / graphWidth_);
}

std::optional<std::size_t> HitTester::nearestIndex(double pointerX,
                                                   const PingSeries& series) const {
    if (series.empty() || graphWidth_ <= 0.0 || window_.duration.count() <= 0) {
        return std::nullopt;
    }

    const double mouseTime = timeAtPointer(pointerX);

    std::size_t closestIndex = 0;
    double closestDistance = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < series.size(); ++i) {
        double distance = std::abs(static_cast<double>(series[i].epochMs()) - mouseTime);
        if (distance < closestDistance) {
            closestDistance = distance;
            closestIndex = i;
        }
    }

    if (closestDistance > snapDistanceMs()) {
        return std::nullopt;
    }
    return closestIndex;
}

std::optional<PingSample> nearestSample(double pointerX, const PingSeries& series,
                                        std::chrono::system_clock::time_point windowStart,
                                        std::chrono::milliseconds windowDuration,
                                        double graphWidth, double leftMargin) {
    TimeWindow window;
    window.start = windowStart;
    window.duration = windowDuration;
    window.end = windowStart + windowDuration;

    HitTester tester(window, graphWidth, leftMargin);
    auto index = tester.nearestIndex(pointerX, series);
    if (!index) {
        return std::nullopt;
    }
    return series[*index];
}

std::string formatLatency(std::optional<double> latencyMs) {
    if (!latencyMs) {
        return "-";
    }
    if (*latencyMs < 1.0) {
        return "<1";
    }
    return formatFixed(*latencyMs, 1);
}

TooltipContent describeSample(const PingSample& sample, TimeZoneMode zone) {
    TooltipContent content;
    content.timestamp = formatTimestamp(sample.timestamp, zone);

    if (!sample.isReachable) {
        content.offline = true;
        content.lines.emplace_back("Offline");
        return content;
    }

    content.lines.push_back("Avg: " + formatLatency(sample.avgLatency()) + " ms");
    content.lines.push_back("Min: " + formatLatency(sample.minLatency()) + " ms");
    content.lines.push_back("Max: " + formatLatency(sample.maxLatency()) + " ms");
    if (auto jitter = sample.effectiveJitter()) {
        content.lines.push_back("Jitter: ±" + formatLatency(jitter) + " ms");
    }
    if (sample.packetLossPercent > 0.0) {
        content.lines.push_back("Loss: " + formatFixed(sample.packetLossPercent, 1) + "%");
    }
    return content;
}

} // namespace pingscope::core
