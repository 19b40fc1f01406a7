#include "core/types/ThresholdConfig.hpp"

namespace pingscope::core {

bool ThresholdConfig::isValid() const {
    return latencyWarningMs > 0.0 && latencyCriticalMs > latencyWarningMs &&
           lossWarningPercent >= 0.0 && lossCriticalPercent <= 100.0 &&
           lossCriticalPercent >= lossWarningPercent && graphHeightPx > 0 && historyHours > 0;
}

} // namespace pingscope::core
