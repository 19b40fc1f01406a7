/**
 * @file PingWidgetViewModel.hpp
 * @brief ViewModel driving the uptime widget's fetch and poll cycle.
 *
 * This file defines the PingWidgetViewModel class which owns the widget's
 * current snapshot, its lifecycle state and the polling timer in the MVVM
 * architecture.
 */

#pragma once

#include "core/services/IPingDataSource.hpp"
#include "core/types/PingWidgetData.hpp"

#include <QObject>
#include <QString>
#include <QTimer>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pingscope::viewmodels {

/**
 * @brief Lifecycle state of the uptime widget.
 */
enum class WidgetState {
    Idle,       ///< Not activated, or deactivated before the first response
    Loading,    ///< First fetch in flight, nothing to show yet
    Data,       ///< A snapshot is available
    Refreshing, ///< A snapshot is shown while the next one is fetched
    Error       ///< Last cycle failed; a stale snapshot may still be shown
};

/**
 * @brief Returns a lowercase name for a widget state.
 */
std::string widgetStateToString(WidgetState state);

/**
 * @brief ViewModel for the uptime widget.
 *
 * Fetches the widget snapshot from the data source, falls back to the
 * current-status endpoint when the primary one fails, and re-arms a single
 * poll timer after every completed cycle. Every new request context bumps a
 * generation counter; responses from an older generation are discarded so
 * the most recent request always wins.
 */
class PingWidgetViewModel : public QObject {
    Q_OBJECT

public:
    static constexpr std::chrono::seconds DEFAULT_POLL_INTERVAL{60};
    static constexpr std::chrono::seconds DEFAULT_FALLBACK_INTERVAL{30};

    /**
     * @brief Constructs a PingWidgetViewModel.
     * @param source Data source used for all fetches.
     * @param parent Optional parent QObject for Qt ownership.
     */
    explicit PingWidgetViewModel(std::shared_ptr<core::IPingDataSource> source,
                                 QObject* parent = nullptr);

    /**
     * @brief Destroys the view model, cancelling any request in flight.
     */
    ~PingWidgetViewModel() override;

    /**
     * @brief Sets the widget to display and restarts the cycle if active.
     *
     * Switching widgets drops the current snapshot. Ids of zero or less are
     * a configuration error.
     */
    void setWidgetId(int64_t widgetId);

    /**
     * @brief Starts fetching and polling.
     */
    void activate();

    /**
     * @brief Stops polling and cancels the request in flight.
     */
    void deactivate();

    /**
     * @brief Fetches immediately, restarting the poll timer afterwards.
     */
    void refresh();

    /**
     * @brief Sets the primary poll interval. A pending poll is re-armed.
     */
    void setPollInterval(std::chrono::seconds interval);

    /**
     * @brief Sets the poll interval used while on the fallback endpoint.
     */
    void setFallbackInterval(std::chrono::seconds interval);

    /**
     * @brief Records the zoomed target and notifies the view.
     */
    void openZoom(const std::string& targetAddress);

    /**
     * @brief Clears the zoomed target. Does nothing if none is open.
     */
    void closeZoom();

    [[nodiscard]] WidgetState state() const { return state_; }
    [[nodiscard]] const std::optional<core::PingWidgetData>& data() const { return data_; }
    [[nodiscard]] const QString& errorMessage() const { return errorMessage_; }
    [[nodiscard]] bool usingFallback() const { return usingFallback_; }
    [[nodiscard]] bool isActive() const { return active_; }
    [[nodiscard]] int64_t widgetId() const { return widgetId_; }
    [[nodiscard]] bool hasValidWidgetId() const { return widgetId_ > 0; }
    [[nodiscard]] std::chrono::seconds pollInterval() const { return pollInterval_; }
    [[nodiscard]] std::chrono::seconds fallbackInterval() const { return fallbackInterval_; }
    [[nodiscard]] const std::optional<std::string>& zoomedTarget() const { return zoomedTarget_; }

    /**
     * @brief Interval the next poll uses, depending on the active endpoint.
     */
    [[nodiscard]] std::chrono::seconds currentInterval() const;

    /**
     * @brief Checks whether a poll is armed.
     */
    [[nodiscard]] bool isPollScheduled() const { return pollTimer_->isActive(); }

    /**
     * @brief Current request generation. Increases with every new context.
     */
    [[nodiscard]] uint64_t generation() const { return generation_; }

signals:
    /**
     * @brief Emitted when the lifecycle state changes.
     */
    void stateChanged(pingscope::viewmodels::WidgetState state);

    /**
     * @brief Emitted when the snapshot is replaced or dropped.
     */
    void dataChanged();

    /**
     * @brief Emitted when the error message changes. Empty when cleared.
     */
    void errorChanged(const QString& message);

    /**
     * @brief Emitted with every successfully fetched snapshot, for export.
     */
    void dataReady(const pingscope::core::PingWidgetData& data);

    void zoomOpened(const QString& targetAddress);
    void zoomClosed();

private:
    void startCycle();
    void fetchPrimary(uint64_t generation);
    void fetchFallback(uint64_t generation);
    void onPrimaryResult(uint64_t generation, const core::FetchResult<core::PingWidgetData>& result);
    void onFallbackResult(uint64_t generation,
                          const core::FetchResult<core::PingWidgetData>& result);
    void applySnapshot(core::PingWidgetData data, bool fallback);
    void fail(const QString& message);
    void scheduleNextPoll();
    void invalidate();
    bool isCurrent(uint64_t generation) const;
    void setState(WidgetState state);
    void setError(const QString& message);

    std::shared_ptr<core::IPingDataSource> source_;
    QTimer* pollTimer_;

    int64_t widgetId_{0};
    bool active_{false};
    WidgetState state_{WidgetState::Idle};
    std::optional<core::PingWidgetData> data_;
    QString errorMessage_;
    bool usingFallback_{false};
    std::optional<std::string> zoomedTarget_;

    std::chrono::seconds pollInterval_{DEFAULT_POLL_INTERVAL};
    std::chrono::seconds fallbackInterval_{DEFAULT_FALLBACK_INTERVAL};

    uint64_t generation_{0};
    core::RequestId inFlight_{core::INVALID_REQUEST_ID};
    uint64_t responses_{0};
};

} // namespace pingscope::viewmodels
