#include "viewmodels/TargetDetailViewModel.hpp"

#include <spdlog/spdlog.h>

namespace pingscope::viewmodels {

TargetDetailViewModel::TargetDetailViewModel(std::shared_ptr<core::IPingDataSource> source,
                                             QObject* parent)
    : QObject(parent), source_(std::move(source)) {}

TargetDetailViewModel::~TargetDetailViewModel() {
    cancelInFlight();
}

void TargetDetailViewModel::open(const core::PingTarget& target, std::optional<int64_t> widgetId,
                                 int payloadHistoryHours) {
    cancelInFlight();
    ++generation_;

    open_ = true;
    target_ = target;
    widgetId_ = widgetId;
    payloadHistoryHours_ = payloadHistoryHours;
    setError({});
    setLoading(false);

    spdlog::debug("Opened detail view for {}", target_.address);

    const bool periodChanging = period_ != core::DEFAULT_DETAIL_PERIOD;
    period_ = core::DEFAULT_DETAIL_PERIOD;
    if (periodChanging) {
        emit periodChanged(period_);
    }

    if (core::periodHours(period_) == payloadHistoryHours_ || !widgetId_) {
        useSeededData();
    } else {
        series_ = target_.history;
        statistics_ = target_.statistics;
        emit dataChanged();
        fetchPeriod();
    }
}

void TargetDetailViewModel::selectPeriod(core::TimePeriod period) {
    // Re-selecting the current period retries it after a failed fetch
    const bool retry = period == period_ && !errorMessage_.isEmpty();
    if (!open_ || (period == period_ && !retry)) {
        return;
    }

    if (retry) {
        spdlog::info("Detail view for {}: retrying {}", target_.address, core::periodLabel(period_));
    } else {
        spdlog::info("Detail view for {}: period {} -> {}", target_.address,
                     core::periodLabel(period_), core::periodLabel(period));
        period_ = period;
        emit periodChanged(period_);
    }

    cancelInFlight();
    ++generation_;
    setError({});

    // The payload already carries this window; without a widget scope it is all there is
    if (core::periodHours(period_) == payloadHistoryHours_ || !widgetId_) {
        setLoading(false);
        useSeededData();
        return;
    }

    fetchPeriod();
}

void TargetDetailViewModel::close() {
    if (!open_) {
        return;
    }
    cancelInFlight();
    ++generation_;
    open_ = false;
    setLoading(false);
    spdlog::debug("Closed detail view for {}", target_.address);
}

void TargetDetailViewModel::useSeededData() {
    series_ = target_.history;
    statistics_ = target_.statistics;
    emit dataChanged();
}

void TargetDetailViewModel::fetchPeriod() {
    const int hours = core::periodHours(period_);
    const uint64_t generation = generation_;
    pending_ = PendingFetch{generation, std::nullopt, std::nullopt, false};
    setLoading(true);

    spdlog::debug("Fetching {}h of data for {}", hours, target_.address);

    historyRequest_ = source_->fetchHistory(
        target_.address, hours, widgetId_,
        [this, generation](const core::FetchResult<core::PingSeries>& result) {
            onHistory(generation, result);
        });
    if (generation != generation_ || !loading_) {
        return;
    }
    statisticsRequest_ = source_->fetchStatistics(
        target_.address, hours, widgetId_,
        [this, generation](const core::FetchResult<core::PingStatistics>& result) {
            onStatistics(generation, result);
        });
}

void TargetDetailViewModel::onHistory(uint64_t generation,
                                      const core::FetchResult<core::PingSeries>& result) {
    if (generation != generation_ || pending_.generation != generation) {
        spdlog::debug("Discarding stale history response for {}", target_.address);
        return;
    }
    historyRequest_ = core::INVALID_REQUEST_ID;

    if (!result.success) {
        failFetch(result.errorMessage);
        return;
    }
    pending_.series = result.value;
    completeIfReady();
}

void TargetDetailViewModel::onStatistics(uint64_t generation,
                                         const core::FetchResult<core::PingStatistics>& result) {
    if (generation != generation_ || pending_.generation != generation) {
        spdlog::debug("Discarding stale statistics response for {}", target_.address);
        return;
    }
    statisticsRequest_ = core::INVALID_REQUEST_ID;

    if (!result.success) {
        failFetch(result.errorMessage);
        return;
    }
    pending_.statistics = result.value;
    completeIfReady();
}

void TargetDetailViewModel::completeIfReady() {
    if (pending_.failed || !pending_.series || !pending_.statistics) {
        return;
    }

    series_ = std::move(*pending_.series);
    statistics_ = *pending_.statistics;
    pending_ = PendingFetch{};

    spdlog::debug("Loaded {} samples for {} over {}", series_.size(), target_.address,
                  core::periodLabel(period_));
    setLoading(false);
    emit dataChanged();
}

void TargetDetailViewModel::failFetch(const std::string& message) {
    spdlog::error("Failed to load {} data for {}: {}", core::periodLabel(period_),
                  target_.address, message);

    // Drop the sibling request; the previous data stays visible
    cancelInFlight();
    ++generation_;
    pending_ = PendingFetch{};
    setLoading(false);
    setError(QString::fromStdString(message));
}

void TargetDetailViewModel::cancelInFlight() {
    if (historyRequest_ != core::INVALID_REQUEST_ID) {
        source_->cancel(historyRequest_);
        historyRequest_ = core::INVALID_REQUEST_ID;
    }
    if (statisticsRequest_ != core::INVALID_REQUEST_ID) {
        source_->cancel(statisticsRequest_);
        statisticsRequest_ = core::INVALID_REQUEST_ID;
    }
}

void TargetDetailViewModel::setLoading(bool loading) {
    if (loading == loading_) {
        return;
    }
    loading_ = loading;
    emit loadingChanged(loading_);
}

void TargetDetailViewModel::setError(const QString& message) {
    if (message == errorMessage_) {
        return;
    }
    errorMessage_ = message;
    emit errorChanged(errorMessage_);
}

} // namespace pingscope::viewmodels
