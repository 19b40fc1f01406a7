#include "ui/widgets/UptimePingWidget.hpp"

#include "ui/graph/GraphPalette.hpp"
#include "ui/widgets/TargetCard.hpp"
#include "ui/windows/TargetDetailDialog.hpp"
#include "viewmodels/PingWidgetViewModel.hpp"
#include "viewmodels/TargetDetailViewModel.hpp"

#include <QDateTime>
#include <QHBoxLayout>
#include <QResizeEvent>

#include <spdlog/spdlog.h>

namespace pingscope::ui {

namespace {

QLabel* createCountBadge(const QColor& color, const QString& tooltip, QWidget* parent) {
    auto* badge = new QLabel(parent);
    badge->setToolTip(tooltip);
    badge->setStyleSheet(
        QString("background-color: %1; color: white; border-radius: 8px; padding: 1px 7px;")
            .arg(color.name()));
    badge->hide();
    return badge;
}

void setCount(QLabel* badge, int count) {
    badge->setText(QString::number(count));
    badge->setVisible(count > 0);
}

} // namespace

UptimePingWidget::UptimePingWidget(viewmodels::PingWidgetViewModel* viewModel,
                                   viewmodels::TargetDetailViewModel* detailViewModel,
                                   QWidget* parent)
    : QWidget(parent), viewModel_(viewModel), detailViewModel_(detailViewModel) {
    setObjectName("UptimePingWidget");
    setupUi();

    connect(viewModel_, &viewmodels::PingWidgetViewModel::stateChanged, this,
            &UptimePingWidget::onStateChanged);
    connect(viewModel_, &viewmodels::PingWidgetViewModel::errorChanged, this,
            &UptimePingWidget::onStateChanged);
    connect(viewModel_, &viewmodels::PingWidgetViewModel::dataChanged, this,
            &UptimePingWidget::onDataChanged);
    connect(viewModel_, &viewmodels::PingWidgetViewModel::dataReady, this,
            &UptimePingWidget::dataReady);
    connect(viewModel_, &viewmodels::PingWidgetViewModel::zoomOpened, this,
            &UptimePingWidget::onZoomOpened);
    connect(viewModel_, &viewmodels::PingWidgetViewModel::zoomClosed, this,
            &UptimePingWidget::onZoomClosed);

    onDataChanged();
}

UptimePingWidget::~UptimePingWidget() {
    if (detailDialog_) {
        disconnect(detailDialog_, nullptr, this, nullptr);
    }
}

void UptimePingWidget::setupUi() {
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(8, 8, 8, 8);
    mainLayout->setSpacing(6);

    // Header
    auto* headerLayout = new QHBoxLayout();
    headerLayout->setSpacing(6);
    titleLabel_ = new QLabel("Monitoring", this);
    titleLabel_->setObjectName("UptimeTitle");
    QFont titleFont = titleLabel_->font();
    titleFont.setBold(true);
    titleLabel_->setFont(titleFont);
    headerLayout->addWidget(titleLabel_);

    refreshingLabel_ = new QLabel("Refreshing...", this);
    refreshingLabel_->setStyleSheet("color: #888; font-size: 11px;");
    refreshingLabel_->hide();
    headerLayout->addWidget(refreshingLabel_);
    headerLayout->addStretch();

    okBadge_ = createCountBadge(palette::ok(), "OK", this);
    warningBadge_ = createCountBadge(palette::warning(), "Warning", this);
    criticalBadge_ = createCountBadge(palette::critical(), "Critical", this);
    headerLayout->addWidget(okBadge_);
    headerLayout->addWidget(warningBadge_);
    headerLayout->addWidget(criticalBadge_);
    mainLayout->addLayout(headerLayout);

    errorBanner_ = new QLabel(this);
    errorBanner_->setObjectName("UptimeErrorBanner");
    errorBanner_->setWordWrap(true);
    errorBanner_->setStyleSheet(QString("background-color: %1; color: white; padding: 4px 8px;"
                                        " border-radius: 4px;")
                                    .arg(palette::critical(0.85).name(QColor::HexArgb)));
    errorBanner_->hide();
    mainLayout->addWidget(errorBanner_);

    // Body
    body_ = new QStackedWidget(this);

    loadingLabel_ = new QLabel("Loading...", body_);
    loadingLabel_->setAlignment(Qt::AlignCenter);
    loadingLabel_->setStyleSheet("color: #888;");
    body_->addWidget(loadingLabel_);

    messageLabel_ = new QLabel(body_);
    messageLabel_->setObjectName("UptimeMessage");
    messageLabel_->setAlignment(Qt::AlignCenter);
    messageLabel_->setWordWrap(true);
    body_->addWidget(messageLabel_);

    scrollArea_ = new QScrollArea(body_);
    scrollArea_->setWidgetResizable(true);
    scrollArea_->setFrameShape(QFrame::NoFrame);
    scrollArea_->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    cardContainer_ = new QWidget(scrollArea_);
    cardLayout_ = new QVBoxLayout(cardContainer_);
    cardLayout_->setContentsMargins(0, 0, 0, 0);
    cardLayout_->setSpacing(6);
    cardLayout_->addStretch();
    scrollArea_->setWidget(cardContainer_);
    body_->addWidget(scrollArea_);

    mainLayout->addWidget(body_, 1);

    // Footer
    footer_ = new QWidget(this);
    auto* footerLayout = new QHBoxLayout(footer_);
    footerLayout->setContentsMargins(0, 0, 0, 0);
    pointsLabel_ = new QLabel(footer_);
    pointsLabel_->setStyleSheet("color: #888; font-size: 11px;");
    footerLayout->addWidget(pointsLabel_);
    footerLayout->addStretch();
    updatedLabel_ = new QLabel(footer_);
    updatedLabel_->setStyleSheet("color: #888; font-size: 11px;");
    footerLayout->addWidget(updatedLabel_);
    footer_->hide();
    mainLayout->addWidget(footer_);
}

void UptimePingWidget::setTimeZone(core::TimeZoneMode zone) {
    if (timeZone_ == zone) {
        return;
    }
    timeZone_ = zone;
    onDataChanged();
}

void UptimePingWidget::setCompactThreshold(int targetCount) {
    compactThreshold_ = targetCount;
    updateCompactMode();
}

UptimePingWidget::Page UptimePingWidget::currentPage() const {
    if (body_->currentWidget() == scrollArea_) {
        return Page::Targets;
    }
    if (body_->currentWidget() == messageLabel_) {
        return Page::Message;
    }
    return Page::Loading;
}

void UptimePingWidget::onStateChanged() {
    const auto state = viewModel_->state();
    const auto& data = viewModel_->data();

    refreshingLabel_->setVisible(state == viewmodels::WidgetState::Refreshing);

    const bool failed = state == viewmodels::WidgetState::Error;
    if (!data) {
        errorBanner_->hide();
        if (failed) {
            showMessage(viewModel_->errorMessage(), true);
        } else {
            body_->setCurrentWidget(loadingLabel_);
        }
        return;
    }

    // Stale data stays visible under the banner
    errorBanner_->setText(viewModel_->errorMessage());
    errorBanner_->setVisible(failed && !viewModel_->errorMessage().isEmpty());

    if (data->targets.empty()) {
        showMessage("Configure targets to monitor", false);
    } else {
        body_->setCurrentWidget(scrollArea_);
    }
}

void UptimePingWidget::onDataChanged() {
    const auto& data = viewModel_->data();
    if (!data) {
        rebuildCards(core::PingWidgetData{});
        setCount(okBadge_, 0);
        setCount(warningBadge_, 0);
        setCount(criticalBadge_, 0);
        footer_->hide();
    } else {
        rebuildCards(*data);
        updateHeader(*data);
        updateFooter(*data);
    }
    onStateChanged();
}

void UptimePingWidget::rebuildCards(const core::PingWidgetData& data) {
    while (cards_.size() > data.targets.size()) {
        auto* card = cards_.back();
        cards_.pop_back();
        cardLayout_->removeWidget(card);
        card->deleteLater();
    }

    while (cards_.size() < data.targets.size()) {
        auto* card = new TargetCard(cardContainer_);
        connect(card, &TargetCard::zoomRequested, this,
                [this](const QString& address) { viewModel_->openZoom(address.toStdString()); });
        // Keep the trailing stretch last
        cardLayout_->insertWidget(cardLayout_->count() - 1, card);
        cards_.push_back(card);
    }

    for (std::size_t i = 0; i < data.targets.size(); ++i) {
        cards_[i]->setTarget(data.targets[i], data.config, data.hasHistory);
    }

    updateCompactMode();
}

void UptimePingWidget::updateHeader(const core::PingWidgetData& data) {
    const auto counts = data.statusCounts();
    setCount(okBadge_, counts.ok);
    setCount(warningBadge_, counts.warning);
    setCount(criticalBadge_, counts.critical);
}

void UptimePingWidget::updateFooter(const core::PingWidgetData& data) {
    const bool showPoints = data.hasHistory && !data.targets.empty();
    pointsLabel_->setVisible(showPoints);
    pointsLabel_->setText(QString("%1 points").arg(data.maxHistoryLength()));

    if (data.fetchedAt) {
        QDateTime fetched = QDateTime::fromMSecsSinceEpoch(core::toEpochMs(*data.fetchedAt));
        if (timeZone_ == core::TimeZoneMode::Utc) {
            fetched = fetched.toUTC();
        }
        updatedLabel_->setText(QString("Updated: %1").arg(fetched.toString("hh:mm:ss")));
    } else {
        updatedLabel_->clear();
    }
    updatedLabel_->setVisible(data.fetchedAt.has_value());

    footer_->setVisible(showPoints || data.fetchedAt.has_value());
}

void UptimePingWidget::updateCompactMode() {
    const bool compact = height() < SMALL_HEIGHT &&
                         static_cast<int>(cards_.size()) > compactThreshold_;
    compact_ = compact;
    for (auto* card : cards_) {
        card->setCompact(compact);
    }
}

void UptimePingWidget::showMessage(const QString& message, bool isError) {
    messageLabel_->setText(message);
    messageLabel_->setStyleSheet(
        isError ? QString("color: %1;").arg(palette::critical().name()) : QString("color: #888;"));
    body_->setCurrentWidget(messageLabel_);
}

void UptimePingWidget::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    updateCompactMode();
}

void UptimePingWidget::onZoomOpened(const QString& targetAddress) {
    const auto& data = viewModel_->data();
    const core::PingTarget* target =
        data ? data->findTarget(targetAddress.toStdString()) : nullptr;
    if (!target) {
        spdlog::warn("Zoom requested for unknown target {}", targetAddress.toStdString());
        viewModel_->closeZoom();
        return;
    }

    if (detailDialog_) {
        disconnect(detailDialog_, nullptr, this, nullptr);
        detailDialog_->deleteLater();
    }

    std::optional<int64_t> widgetId;
    if (viewModel_->hasValidWidgetId()) {
        widgetId = viewModel_->widgetId();
    }
    detailViewModel_->open(*target, widgetId, data->config.historyHours);

    detailDialog_ = new TargetDetailDialog(detailViewModel_, data->config, timeZone_, this);
    connect(detailDialog_, &QDialog::finished, this, &UptimePingWidget::onDialogFinished);
    detailDialog_->open();

    emit zoomOpened(targetAddress);
}

void UptimePingWidget::onZoomClosed() {
    if (detailDialog_) {
        TargetDetailDialog* dialog = detailDialog_;
        detailDialog_ = nullptr;
        disconnect(dialog, nullptr, this, nullptr);
        dialog->close();
        dialog->deleteLater();
    }
    emit zoomClosed();
}

void UptimePingWidget::onDialogFinished() {
    if (detailDialog_) {
        TargetDetailDialog* dialog = detailDialog_;
        detailDialog_ = nullptr;
        dialog->deleteLater();
    }
    viewModel_->closeZoom();
}

} // namespace pingscope::ui
