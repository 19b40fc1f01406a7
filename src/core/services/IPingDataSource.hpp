/**
 * @file IPingDataSource.hpp
 * @brief Interface for the reachability dashboard backend.
 *
 * This file defines the abstract asynchronous interface through which the
 * widget fetches target snapshots, per-period history and statistics. The
 * core never talks to the network directly.
 */

#pragma once

#include "core/types/PingSample.hpp"
#include "core/types/PingTarget.hpp"
#include "core/types/PingWidgetData.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace pingscope::core {

/**
 * @brief Identifies an in-flight request so it can be cancelled.
 */
using RequestId = uint64_t;

/// Returned when a request could not be issued at all.
inline constexpr RequestId INVALID_REQUEST_ID = 0;

/**
 * @brief Outcome of an asynchronous fetch.
 */
template <typename T>
struct FetchResult {
    bool success{false};      ///< True if a value was received and parsed
    T value{};                ///< Parsed value, default-constructed on failure
    std::string errorMessage; ///< Transport or parse error on failure
};

/**
 * @brief Interface for the reachability data backend.
 *
 * Every fetch completes exactly once through its callback on the thread that
 * issued it, unless it is cancelled first, in which case the callback is
 * never invoked.
 */
class IPingDataSource {
public:
    template <typename T>
    using Callback = std::function<void(const FetchResult<T>&)>;

    virtual ~IPingDataSource() = default;

    /**
     * @brief Fetches all targets of a widget with their history and thresholds.
     * @param widgetId Dashboard widget identifier.
     * @param callback Receives the widget snapshot.
     */
    virtual RequestId fetchWidgetData(int64_t widgetId, Callback<PingWidgetData> callback) = 0;

    /**
     * @brief Fetches current status only, without history.
     *
     * Used when the primary endpoint is unavailable. The delivered snapshot
     * has empty histories and hasHistory set to false.
     */
    virtual RequestId fetchCurrentStatus(int64_t widgetId, Callback<PingWidgetData> callback) = 0;

    /**
     * @brief Fetches the history of one target for a number of hours.
     * @param target Probed address.
     * @param hours Length of the period.
     * @param widgetId Widget scope, if any.
     */
    virtual RequestId fetchHistory(const std::string& target, int hours,
                                   std::optional<int64_t> widgetId,
                                   Callback<PingSeries> callback) = 0;

    /**
     * @brief Fetches aggregate statistics of one target for a number of hours.
     */
    virtual RequestId fetchStatistics(const std::string& target, int hours,
                                      std::optional<int64_t> widgetId,
                                      Callback<PingStatistics> callback) = 0;

    /**
     * @brief Cancels an in-flight request. Unknown ids are ignored.
     */
    virtual void cancel(RequestId id) = 0;
};

} // namespace pingscope::core
