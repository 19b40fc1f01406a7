#include "ui/widgets/TargetCard.hpp"

#include "core/graph/HitTester.hpp"
#include "ui/graph/CompactGraphRenderer.hpp"
#include "ui/graph/GraphPalette.hpp"
#include "ui/widgets/CompactGraphWidget.hpp"

#include <QHBoxLayout>
#include <QStyle>
#include <QVBoxLayout>

namespace pingscope::ui {

namespace {

QString latencyText(std::optional<double> ms) {
    return QString::fromStdString(core::formatLatency(ms));
}

QString badgeStyle(const QColor& color) {
    return QString("background-color: %1; color: white; border-radius: 4px; padding: 1px 6px;")
        .arg(color.name());
}

QString dotStyle(const QColor& color, int size) {
    return QString("background-color: %1; border-radius: %2px;").arg(color.name()).arg(size / 2);
}

QString statusLabel(core::TargetStatus status) {
    switch (status) {
    case core::TargetStatus::Ok:
        return "OK";
    case core::TargetStatus::Warning:
        return "Warning";
    case core::TargetStatus::Critical:
        return "Critical";
    }
    return "OK";
}

} // namespace

TargetCard::TargetCard(QWidget* parent) : QFrame(parent) {
    setObjectName("TargetCard");

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(0);

    buildFullLayout();
    buildCompactLayout();
    layout->addWidget(fullView_);
    layout->addWidget(compactView_);

    compactView_->hide();
}

void TargetCard::buildFullLayout() {
    fullView_ = new QWidget(this);
    auto* layout = new QVBoxLayout(fullView_);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(6);

    auto* headerLayout = new QHBoxLayout();
    headerLayout->setSpacing(8);

    statusIcon_ = new QFrame(fullView_);
    statusIcon_->setObjectName("TargetStatusIcon");
    statusIcon_->setFixedSize(14, 14);
    headerLayout->addWidget(statusIcon_);

    auto* identity = new QVBoxLayout();
    identity->setSpacing(0);
    nameLabel_ = new QLabel(fullView_);
    nameLabel_->setObjectName("TargetName");
    QFont nameFont = nameLabel_->font();
    nameFont.setBold(true);
    nameLabel_->setFont(nameFont);
    identity->addWidget(nameLabel_);

    addressLabel_ = new QLabel(fullView_);
    addressLabel_->setObjectName("TargetAddress");
    addressLabel_->setStyleSheet("color: #888;");
    identity->addWidget(addressLabel_);
    headerLayout->addLayout(identity, 1);

    statusBadge_ = new QLabel(fullView_);
    statusBadge_->setObjectName("TargetStatusBadge");
    headerLayout->addWidget(statusBadge_);

    zoomButton_ = new QToolButton(fullView_);
    zoomButton_->setObjectName("TargetZoomButton");
    zoomButton_->setText(QString::fromUtf8("⤢"));
    zoomButton_->setToolTip("Enlarge graph");
    zoomButton_->setAutoRaise(true);
    connect(zoomButton_, &QToolButton::clicked, this, &TargetCard::requestZoom);
    headerLayout->addWidget(zoomButton_);
    layout->addLayout(headerLayout);

    metricsRow_ = new QWidget(fullView_);
    auto* metrics = new QHBoxLayout(metricsRow_);
    metrics->setContentsMargins(0, 0, 0, 0);
    metrics->setSpacing(12);
    latencyLabel_ = new QLabel(metricsRow_);
    latencyLabel_->setToolTip("Average latency");
    metrics->addWidget(latencyLabel_);
    jitterLabel_ = new QLabel(metricsRow_);
    jitterLabel_->setToolTip("Jitter (variation)");
    jitterLabel_->setStyleSheet("color: #888;");
    metrics->addWidget(jitterLabel_);
    lossBadge_ = new QLabel(metricsRow_);
    lossBadge_->setToolTip("Packet loss");
    lossBadge_->setStyleSheet(badgeStyle(palette::packetLoss()));
    metrics->addWidget(lossBadge_);
    metrics->addStretch();
    layout->addWidget(metricsRow_);

    errorLabel_ = new QLabel(fullView_);
    errorLabel_->setObjectName("TargetError");
    errorLabel_->setWordWrap(true);
    errorLabel_->setStyleSheet(QString("color: %1;").arg(palette::critical().name()));
    layout->addWidget(errorLabel_);

    graph_ = new CompactGraphWidget(fullView_);
    connect(graph_, &CompactGraphWidget::clicked, this, &TargetCard::requestZoom);
    layout->addWidget(graph_);

    statsRow_ = new QWidget(fullView_);
    auto* stats = new QHBoxLayout(statsRow_);
    stats->setContentsMargins(0, 0, 0, 0);
    stats->setSpacing(12);
    uptimeBadge_ = new QLabel(statsRow_);
    uptimeBadge_->setToolTip("Uptime");
    stats->addWidget(uptimeBadge_);
    statsMinLabel_ = new QLabel(statsRow_);
    statsMinLabel_->setStyleSheet("color: #888;");
    stats->addWidget(statsMinLabel_);
    statsMaxLabel_ = new QLabel(statsRow_);
    statsMaxLabel_->setStyleSheet("color: #888;");
    stats->addWidget(statsMaxLabel_);
    outagesBadge_ = new QLabel(statsRow_);
    outagesBadge_->setStyleSheet(badgeStyle(palette::critical()));
    stats->addWidget(outagesBadge_);
    stats->addStretch();
    layout->addWidget(statsRow_);
}

void TargetCard::buildCompactLayout() {
    compactView_ = new QWidget(this);
    auto* layout = new QHBoxLayout(compactView_);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(6);

    compactIcon_ = new QFrame(compactView_);
    compactIcon_->setFixedSize(10, 10);
    layout->addWidget(compactIcon_);

    compactName_ = new QLabel(compactView_);
    layout->addWidget(compactName_, 1);

    compactValue_ = new QLabel(compactView_);
    compactValue_->setStyleSheet("color: #888;");
    layout->addWidget(compactValue_);
}

void TargetCard::setTarget(const core::PingTarget& target, const core::ThresholdConfig& config,
                           bool showGraph) {
    target_ = target;
    config_ = config;
    showGraph_ = showGraph;
    status_ = target_.effectiveStatus(config_);

    setProperty("statusClass", QString::fromStdString(core::statusToString(status_)));

    if (compact_) {
        refreshCompact();
    } else {
        refreshFull();
    }

    style()->unpolish(this);
    style()->polish(this);
}

void TargetCard::setCompact(bool compact) {
    if (compact_ == compact) {
        return;
    }
    compact_ = compact;
    fullView_->setVisible(!compact_);
    compactView_->setVisible(compact_);

    if (compact_) {
        refreshCompact();
    } else {
        refreshFull();
    }
}

QString TargetCard::compactValueText() const {
    if (!target_.current.isReachable) {
        return "DOWN";
    }
    return latencyText(target_.current.avgLatency()) + "ms";
}

void TargetCard::refreshFull() {
    const auto& current = target_.current;
    const bool reachable = current.isReachable;

    statusIcon_->setStyleSheet(
        dotStyle(reachable ? palette::ok() : palette::critical(), statusIcon_->width()));
    nameLabel_->setText(QString::fromStdString(target_.displayName()));
    addressLabel_->setText(QString::fromStdString(target_.address));
    statusBadge_->setText(statusLabel(status_));
    statusBadge_->setStyleSheet(badgeStyle(palette::forStatus(status_)));

    const bool hasGraph = showGraph_ && !target_.history.empty();
    zoomButton_->setVisible(hasGraph);

    metricsRow_->setVisible(reachable);
    latencyLabel_->setText(latencyText(current.avgLatency()) + " ms");

    const auto jitter = current.effectiveJitter();
    jitterLabel_->setVisible(config_.showJitter && jitter.has_value());
    jitterLabel_->setText(QString::fromUtf8("±") + latencyText(jitter) + " ms");

    lossBadge_->setVisible(config_.showPacketLoss && current.packetLossPercent > 0.0);
    lossBadge_->setText(QString("%1% loss").arg(current.packetLossPercent, 0, 'f', 1));

    errorLabel_->setVisible(!reachable && !target_.errorMessage.empty());
    errorLabel_->setText(QString::fromStdString(target_.errorMessage));

    graph_->setVisible(hasGraph);
    graph_->setOptions(CompactGraphOptions::fromConfig(config_));
    graph_->setSeries(target_.history);

    refreshStatistics();
}

void TargetCard::refreshStatistics() {
    const auto& stats = target_.statistics;
    const bool visible = config_.showStatistics && stats && stats->totalMeasurements > 0;
    statsRow_->setVisible(visible);
    if (!visible) {
        return;
    }

    uptimeBadge_->setText(QString("%1% uptime").arg(stats->uptimePercent, 0, 'f', 1));
    uptimeBadge_->setStyleSheet(badgeStyle(palette::forUptime(core::uptimeLevel(stats->uptimePercent))));
    statsMinLabel_->setText(QString("Min: %1 ms").arg(latencyText(stats->minLatency)));
    statsMaxLabel_->setText(QString("Max: %1 ms").arg(latencyText(stats->maxLatency)));
    outagesBadge_->setVisible(stats->outages > 0);
    outagesBadge_->setText(QString("%1 outages").arg(stats->outages));
}

void TargetCard::refreshCompact() {
    const QColor color = target_.current.isReachable ? palette::forStatus(status_)
                                                     : palette::critical();
    compactIcon_->setStyleSheet(dotStyle(color, compactIcon_->width()));
    compactName_->setText(QString::fromStdString(target_.displayName()));
    compactValue_->setText(compactValueText());
}

void TargetCard::requestZoom() {
    if (compact_ || !showGraph_ || target_.history.empty()) {
        return;
    }
    emit zoomRequested(QString::fromStdString(target_.address));
}

} // namespace pingscope::ui
