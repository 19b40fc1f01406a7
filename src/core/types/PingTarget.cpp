#include "core/types/PingTarget.hpp"

namespace pingscope::core {

const std::string& PingTarget::displayName() const {
    return name.empty() ? address : name;
}

TargetStatus PingTarget::effectiveStatus(const ThresholdConfig& config) const {
    if (status) {
        return *status;
    }
    return evaluateStatus(current, config);
}

TargetStatus evaluateStatus(const PingSample& sample, const ThresholdConfig& config) {
    if (!sample.isReachable) {
        return TargetStatus::Critical;
    }
    if (sample.packetLossPercent >= config.lossCriticalPercent) {
        return TargetStatus::Critical;
    }
    if (sample.packetLossPercent >= config.lossWarningPercent) {
        return TargetStatus::Warning;
    }
    return latencyLevel(sample.avgLatency(), config);
}

TargetStatus latencyLevel(std::optional<double> avgLatencyMs, const ThresholdConfig& config) {
    if (!avgLatencyMs) {
        return TargetStatus::Ok;
    }
    if (*avgLatencyMs >= config.latencyCriticalMs) {
        return TargetStatus::Critical;
    }
    if (*avgLatencyMs >= config.latencyWarningMs) {
        return TargetStatus::Warning;
    }
    return TargetStatus::Ok;
}

UptimeLevel uptimeLevel(double uptimePercent) {
    if (uptimePercent >= 99.0)
        return UptimeLevel::Good;
    if (uptimePercent >= 95.0)
        return UptimeLevel::Degraded;
    return UptimeLevel::Poor;
}

std::string statusToString(TargetStatus status) {
    switch (status) {
    case TargetStatus::Ok:
        return "ok";
    case TargetStatus::Warning:
        return "warning";
    case TargetStatus::Critical:
        return "critical";
    }
    return "ok";
}

std::optional<TargetStatus> statusFromString(const std::string& str) {
    if (str == "ok")
        return TargetStatus::Ok;
    if (str == "warning")
        return TargetStatus::Warning;
    if (str == "critical")
        return TargetStatus::Critical;
    return std::nullopt;
}

} // namespace pingscope::core
