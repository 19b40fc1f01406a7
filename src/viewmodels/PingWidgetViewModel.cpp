#include "viewmodels/PingWidgetViewModel.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pingscope::viewmodels {

namespace {

const char* const MISSING_WIDGET_MESSAGE = "Widget id missing - please reconfigure the widget";
const char* const FETCH_FAILED_MESSAGE = "Unable to fetch ping data";

} // namespace

std::string widgetStateToString(WidgetState state) {
    switch (state) {
    case WidgetState::Idle:
        return "idle";
    case WidgetState::Loading:
        return "loading";
    case WidgetState::Data:
        return "data";
    case WidgetState::Refreshing:
        return "refreshing";
    case WidgetState::Error:
        return "error";
    }
    return "unknown";
}

PingWidgetViewModel::PingWidgetViewModel(std::shared_ptr<core::IPingDataSource> source,
                                         QObject* parent)
    : QObject(parent), source_(std::move(source)), pollTimer_(new QTimer(this)) {
    pollTimer_->setSingleShot(true);
    connect(pollTimer_, &QTimer::timeout, this, &PingWidgetViewModel::startCycle);
}

PingWidgetViewModel::~PingWidgetViewModel() {
    pollTimer_->stop();
    invalidate();
}

void PingWidgetViewModel::setWidgetId(int64_t widgetId) {
    if (widgetId == widgetId_) {
        return;
    }

    spdlog::info("Uptime widget switched from {} to {}", widgetId_, widgetId);
    widgetId_ = widgetId;
    pollTimer_->stop();
    invalidate();

    usingFallback_ = false;
    if (data_) {
        data_.reset();
        emit dataChanged();
    }
    closeZoom();

    if (active_) {
        startCycle();
    } else {
        setError({});
        setState(WidgetState::Idle);
    }
}

void PingWidgetViewModel::activate() {
    if (active_) {
        return;
    }
    active_ = true;
    startCycle();
}

void PingWidgetViewModel::deactivate() {
    if (!active_) {
        return;
    }
    active_ = false;
    pollTimer_->stop();
    invalidate();

    if (state_ == WidgetState::Loading) {
        setState(WidgetState::Idle);
    } else if (state_ == WidgetState::Refreshing) {
        setState(WidgetState::Data);
    }
    spdlog::debug("Uptime widget {} deactivated", widgetId_);
}

void PingWidgetViewModel::refresh() {
    if (!active_) {
        return;
    }
    pollTimer_->stop();
    startCycle();
}

void PingWidgetViewModel::setPollInterval(std::chrono::seconds interval) {
    pollInterval_ = std::max(interval, std::chrono::seconds{1});
    if (pollTimer_->isActive() && !usingFallback_) {
        pollTimer_->start(pollInterval_);
    }
}

void PingWidgetViewModel::setFallbackInterval(std::chrono::seconds interval) {
    fallbackInterval_ = std::max(interval, std::chrono::seconds{1});
    if (pollTimer_->isActive() && usingFallback_) {
        pollTimer_->start(fallbackInterval_);
    }
}

std::chrono::seconds PingWidgetViewModel::currentInterval() const {
    return usingFallback_ ? fallbackInterval_ : pollInterval_;
}

void PingWidgetViewModel::openZoom(const std::string& targetAddress) {
    zoomedTarget_ = targetAddress;
    emit zoomOpened(QString::fromStdString(targetAddress));
}

void PingWidgetViewModel::closeZoom() {
    if (!zoomedTarget_) {
        return;
    }
    zoomedTarget_.reset();
    emit zoomClosed();
}

void PingWidgetViewModel::startCycle() {
    invalidate();

    if (!hasValidWidgetId()) {
        spdlog::error("Uptime widget has no valid widget id ({})", widgetId_);
        setError(MISSING_WIDGET_MESSAGE);
        setState(WidgetState::Error);
        return;
    }

    setState(data_ ? WidgetState::Refreshing : WidgetState::Loading);
    fetchPrimary(generation_);
}

void PingWidgetViewModel::fetchPrimary(uint64_t generation) {
    spdlog::debug("Fetching widget {} (generation {})", widgetId_, generation);
    const auto answered = responses_;
    const auto id = source_->fetchWidgetData(
        widgetId_, [this, generation](const core::FetchResult<core::PingWidgetData>& result) {
            onPrimaryResult(generation, result);
        });
    // A source may answer synchronously, in which case the id is already spent
    if (responses_ == answered) {
        inFlight_ = id;
    }
}

void PingWidgetViewModel::fetchFallback(uint64_t generation) {
    const auto answered = responses_;
    const auto id = source_->fetchCurrentStatus(
        widgetId_, [this, generation](const core::FetchResult<core::PingWidgetData>& result) {
            onFallbackResult(generation, result);
        });
    if (responses_ == answered) {
        inFlight_ = id;
    }
}

void PingWidgetViewModel::onPrimaryResult(uint64_t generation,
                                          const core::FetchResult<core::PingWidgetData>& result) {
    ++responses_;
    if (!isCurrent(generation)) {
        spdlog::debug("Discarding stale widget response (generation {}, current {})",
                      generation, generation_);
        return;
    }
    inFlight_ = core::INVALID_REQUEST_ID;

    if (!result.success) {
        spdlog::warn("Widget {} primary endpoint failed: {}; trying current status",
                     widgetId_, result.errorMessage);
        fetchFallback(generation);
        return;
    }

    if (result.value.error) {
        spdlog::warn("Widget {} reported error: {}", widgetId_, *result.value.error);
        fail(QString::fromStdString(*result.value.error));
        return;
    }

    applySnapshot(result.value, false);
}

void PingWidgetViewModel::onFallbackResult(uint64_t generation,
                                           const core::FetchResult<core::PingWidgetData>& result) {
    ++responses_;
    if (!isCurrent(generation)) {
        spdlog::debug("Discarding stale fallback response (generation {}, current {})",
                      generation, generation_);
        return;
    }
    inFlight_ = core::INVALID_REQUEST_ID;

    if (!result.success) {
        spdlog::error("Widget {} fallback endpoint failed: {}", widgetId_, result.errorMessage);
        fail(FETCH_FAILED_MESSAGE);
        return;
    }

    if (result.value.error) {
        spdlog::warn("Widget {} reported error: {}", widgetId_, *result.value.error);
        fail(QString::fromStdString(*result.value.error));
        return;
    }

    applySnapshot(result.value, true);
}

void PingWidgetViewModel::applySnapshot(core::PingWidgetData data, bool fallback) {
    if (fallback && !usingFallback_) {
        spdlog::info("Widget {} using current-status fallback", widgetId_);
    }
    usingFallback_ = fallback;
    data_ = std::move(data);

    spdlog::debug("Widget {} updated with {} targets", widgetId_, data_->targets.size());

    setError({});
    setState(WidgetState::Data);
    emit dataChanged();
    emit dataReady(*data_);
    scheduleNextPoll();
}

void PingWidgetViewModel::fail(const QString& message) {
    setError(message);
    setState(WidgetState::Error);
    scheduleNextPoll();
}

void PingWidgetViewModel::scheduleNextPoll() {
    if (!active_) {
        return;
    }
    pollTimer_->start(currentInterval());
}

void PingWidgetViewModel::invalidate() {
    ++generation_;
    if (inFlight_ != core::INVALID_REQUEST_ID) {
        source_->cancel(inFlight_);
        inFlight_ = core::INVALID_REQUEST_ID;
    }
}

bool PingWidgetViewModel::isCurrent(uint64_t generation) const {
    return generation == generation_;
}

void PingWidgetViewModel::setState(WidgetState state) {
    if (state == state_) {
        return;
    }
    spdlog::debug("Uptime widget {}: {} -> {}", widgetId_, widgetStateToString(state_),
                  widgetStateToString(state));
    state_ = state;
    emit stateChanged(state_);
}

void PingWidgetViewModel::setError(const QString& message) {
    if (message == errorMessage_) {
        return;
    }
    errorMessage_ = message;
    emit errorChanged(errorMessage_);
}

} // namespace pingscope::viewmodels
