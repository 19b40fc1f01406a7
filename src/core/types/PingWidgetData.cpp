#include "core/types/PingWidgetData.hpp"

#include <algorithm>

namespace pingscope::core {

StatusCounts PingWidgetData::statusCounts() const {
    StatusCounts counts;
    for (const auto& target : targets) {
        switch (target.effectiveStatus(config)) {
        case TargetStatus::Ok:
            ++counts.ok;
            break;
        case TargetStatus::Warning:
            ++counts.warning;
            break;
        case TargetStatus::Critical:
            ++counts.critical;
            break;
        }
    }
    return counts;
}

std::size_t PingWidgetData::maxHistoryLength() const {
    std::size_t longest = 0;
    for (const auto& target : targets) {
        longest = std::max(longest, target.history.size());
    }
    return longest;
}

const PingTarget* PingWidgetData::findTarget(const std::string& address) const {
    auto it = std::find_if(targets.begin(), targets.end(),
                           [&address](const PingTarget& t) { return t.address == address; });
    return it != targets.end() ? &*it : nullptr;
}

} // namespace pingscope::core
