#include "core/types/PingSample.hpp"

#include <algorithm>

namespace pingscope::core {

bool PingSample::hasLatencyBand() const {
    return minLatency().has_value() && maxLatency().has_value();
}

int64_t PingSample::epochMs() const {
    return toEpochMs(timestamp);
}

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMs(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(ms)));
}

std::optional<double> peakLatency(const PingSeries& series) {
    std::optional<double> peak;
    for (const auto& sample : series) {
        if (auto value = sample.maxLatency()) {
            peak = peak ? std::max(*peak, *value) : *value;
        }
    }
    return peak;
}

} // namespace pingscope::core
