/**
 * @file TargetDetailViewModel.hpp
 * @brief ViewModel for the zoomed single-target view.
 */

#pragma once

#include "core/services/IPingDataSource.hpp"
#include "core/types/PingTarget.hpp"
#include "core/types/TimePeriod.hpp"

#include <QObject>
#include <QString>

#include <cstdint>
#include <memory>
#include <optional>

namespace pingscope::viewmodels {

/**
 * @brief ViewModel for the target detail view.
 *
 * Starts from the history and statistics that came with the widget payload
 * and reuses them while the selected period matches the payload's history
 * window. Any other period fetches history and statistics together; the
 * previous series stays visible until both have arrived.
 */
class TargetDetailViewModel : public QObject {
    Q_OBJECT

public:
    explicit TargetDetailViewModel(std::shared_ptr<core::IPingDataSource> source,
                                   QObject* parent = nullptr);
    ~TargetDetailViewModel() override;

    /**
     * @brief Opens the view for a target.
     * @param target Target snapshot from the widget payload.
     * @param widgetId Widget scope used for period fetches, if known.
     * @param payloadHistoryHours History window of the payload's series.
     */
    void open(const core::PingTarget& target, std::optional<int64_t> widgetId,
              int payloadHistoryHours);

    /**
     * @brief Selects a period, fetching its data unless the payload covers it.
     */
    void selectPeriod(core::TimePeriod period);

    /**
     * @brief Cancels requests in flight and ignores any late responses.
     */
    void close();

    [[nodiscard]] bool isOpen() const { return open_; }
    [[nodiscard]] const core::PingTarget& target() const { return target_; }
    [[nodiscard]] core::TimePeriod period() const { return period_; }
    [[nodiscard]] const core::PingSeries& series() const { return series_; }
    [[nodiscard]] const std::optional<core::PingStatistics>& statistics() const {
        return statistics_;
    }
    [[nodiscard]] bool isLoading() const { return loading_; }
    [[nodiscard]] const QString& errorMessage() const { return errorMessage_; }

signals:
    void periodChanged(pingscope::core::TimePeriod period);

    /**
     * @brief Emitted when the series and statistics were replaced.
     */
    void dataChanged();

    void loadingChanged(bool loading);
    void errorChanged(const QString& message);

private:
    struct PendingFetch {
        uint64_t generation{0};
        std::optional<core::PingSeries> series;
        std::optional<core::PingStatistics> statistics;
        bool failed{false};
    };

    void useSeededData();
    void fetchPeriod();
    void onHistory(uint64_t generation, const core::FetchResult<core::PingSeries>& result);
    void onStatistics(uint64_t generation, const core::FetchResult<core::PingStatistics>& result);
    void completeIfReady();
    void failFetch(const std::string& message);
    void cancelInFlight();
    void setLoading(bool loading);
    void setError(const QString& message);

    std::shared_ptr<core::IPingDataSource> source_;

    bool open_{false};
    core::PingTarget target_;
    std::optional<int64_t> widgetId_;
    int payloadHistoryHours_{24};

    core::TimePeriod period_{core::DEFAULT_DETAIL_PERIOD};
    core::PingSeries series_;
    std::optional<core::PingStatistics> statistics_;
    bool loading_{false};
    QString errorMessage_;

    uint64_t generation_{0};
    PendingFetch pending_;
    core::RequestId historyRequest_{core::INVALID_REQUEST_ID};
    core::RequestId statisticsRequest_{core::INVALID_REQUEST_ID};
};

} // namespace pingscope::viewmodels
