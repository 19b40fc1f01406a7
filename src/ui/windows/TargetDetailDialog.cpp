#include "ui/windows/TargetDetailDialog.hpp"

#include "core/graph/HitTester.hpp"
#include "ui/graph/GraphPalette.hpp"
#include "ui/widgets/DetailedGraphWidget.hpp"
#include "viewmodels/TargetDetailViewModel.hpp"

#include <QGridLayout>
#include <QHBoxLayout>
#include <QVBoxLayout>

namespace pingscope::ui {

namespace {

constexpr double HIGH_LOSS_PERCENT = 5.0;

struct TileInfo {
    StatTile tile;
    const char* title;
};

constexpr std::array<TileInfo, 8> TILE_INFOS{{
    {StatTile::Min, "Min latency"},
    {StatTile::Avg, "Avg latency"},
    {StatTile::Max, "Max latency"},
    {StatTile::Jitter, "Avg jitter"},
    {StatTile::Loss, "Avg loss"},
    {StatTile::Samples, "Samples"},
    {StatTile::Outages, "Outages"},
    {StatTile::Uptime, "Uptime"},
}};

QString latencyText(std::optional<double> ms) {
    return QString::fromStdString(core::formatLatency(ms));
}

QWidget* legendEntry(const QString& text, const QString& swatchStyle, QWidget* parent) {
    auto* entry = new QWidget(parent);
    auto* layout = new QHBoxLayout(entry);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    auto* swatch = new QFrame(entry);
    swatch->setFixedSize(16, 8);
    swatch->setStyleSheet(swatchStyle);
    layout->addWidget(swatch);

    auto* label = new QLabel(text, entry);
    label->setStyleSheet("color: #aaa; font-size: 11px;");
    layout->addWidget(label);
    return entry;
}

QString fillStyle(const QColor& color) {
    return QString("background-color: %1;").arg(color.name(QColor::HexArgb));
}

QString dashStyle(const QColor& color) {
    return QString("border-top: 2px dashed %1; background: transparent;").arg(color.name());
}

} // namespace

TargetDetailDialog::TargetDetailDialog(viewmodels::TargetDetailViewModel* viewModel,
                                       const core::ThresholdConfig& config,
                                       core::TimeZoneMode timeZone, QWidget* parent)
    : QDialog(parent), viewModel_(viewModel), config_(config), timeZone_(timeZone) {
    setObjectName("TargetDetailDialog");
    setMinimumSize(720, 560);

    setupUi();

    connect(viewModel_, &viewmodels::TargetDetailViewModel::periodChanged, this,
            &TargetDetailDialog::onPeriodChanged);
    connect(viewModel_, &viewmodels::TargetDetailViewModel::dataChanged, this,
            &TargetDetailDialog::onDataChanged);
    connect(viewModel_, &viewmodels::TargetDetailViewModel::loadingChanged, this,
            &TargetDetailDialog::onLoadingChanged);
    connect(viewModel_, &viewmodels::TargetDetailViewModel::errorChanged, this,
            &TargetDetailDialog::onErrorChanged);

    updateHeader();
    onPeriodChanged(viewModel_->period());
    onDataChanged();
    onLoadingChanged(viewModel_->isLoading());
    onErrorChanged(viewModel_->errorMessage());
}

void TargetDetailDialog::setupUi() {
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(10);

    // Header
    auto* headerLayout = new QHBoxLayout();
    auto* identity = new QVBoxLayout();
    nameLabel_ = new QLabel(this);
    nameLabel_->setObjectName("DetailTargetName");
    QFont nameFont = nameLabel_->font();
    nameFont.setPointSize(nameFont.pointSize() + 4);
    nameFont.setBold(true);
    nameLabel_->setFont(nameFont);
    identity->addWidget(nameLabel_);

    addressLabel_ = new QLabel(this);
    addressLabel_->setStyleSheet("color: #888;");
    identity->addWidget(addressLabel_);
    headerLayout->addLayout(identity, 1);

    uptimeBadge_ = new QLabel(this);
    uptimeBadge_->setObjectName("DetailUptimeBadge");
    headerLayout->addWidget(uptimeBadge_);
    mainLayout->addLayout(headerLayout);

    // Period selection
    auto* periodLayout = new QHBoxLayout();
    periodLayout->setSpacing(4);
    periodGroup_ = new QButtonGroup(this);
    periodGroup_->setExclusive(true);
    for (auto period : core::allPeriods()) {
        auto* button = new QPushButton(QString::fromStdString(core::periodLabel(period)), this);
        button->setCheckable(true);
        periodGroup_->addButton(button, core::periodHours(period));
        periodLayout->addWidget(button);
    }
    periodLayout->addStretch();
    connect(periodGroup_, &QButtonGroup::idClicked, this, [this](int hours) {
        if (auto period = core::periodFromHours(hours)) {
            viewModel_->selectPeriod(*period);
        }
    });
    mainLayout->addLayout(periodLayout);

    graph_ = new DetailedGraphWidget(this);
    mainLayout->addWidget(graph_, 1);

    errorLabel_ = new QLabel(this);
    errorLabel_->setObjectName("DetailError");
    errorLabel_->setWordWrap(true);
    errorLabel_->setStyleSheet(QString("color: %1;").arg(palette::critical().name()));
    errorLabel_->hide();
    mainLayout->addWidget(errorLabel_);

    mainLayout->addWidget(createLegend());
    mainLayout->addWidget(createStatTiles());
}

QWidget* TargetDetailDialog::createLegend() {
    auto* legend = new QWidget(this);
    auto* layout = new QHBoxLayout(legend);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(16);

    layout->addWidget(legendEntry("Average latency", fillStyle(palette::averageLine()), legend));
    layout->addWidget(legendEntry("Jitter (min-max)", fillStyle(palette::ok(0.35)), legend));
    layout->addWidget(legendEntry("Warning threshold", dashStyle(palette::warning()), legend));
    layout->addWidget(legendEntry("Critical threshold", dashStyle(palette::critical()), legend));
    layout->addWidget(legendEntry("Packet loss",
                                  fillStyle(palette::packetLoss()) + " border-radius: 4px;", legend));
    layout->addStretch();
    return legend;
}

QWidget* TargetDetailDialog::createStatTiles() {
    auto* container = new QWidget(this);
    auto* grid = new QGridLayout(container);
    grid->setContentsMargins(0, 0, 0, 0);
    grid->setSpacing(8);

    int index = 0;
    for (const auto& info : TILE_INFOS) {
        auto* tile = new QFrame(container);
        tile->setObjectName("DetailStatTile");
        tile->setFrameShape(QFrame::StyledPanel);
        auto* tileLayout = new QVBoxLayout(tile);
        tileLayout->setContentsMargins(8, 6, 8, 6);

        auto* title = new QLabel(info.title, tile);
        title->setStyleSheet("color: #888; font-size: 11px;");
        tileLayout->addWidget(title);

        auto* value = new QLabel("-", tile);
        QFont valueFont = value->font();
        valueFont.setBold(true);
        value->setFont(valueFont);
        tileLayout->addWidget(value);

        tiles_[static_cast<std::size_t>(info.tile)] = value;
        grid->addWidget(tile, index / 4, index % 4);
        ++index;
    }
    return container;
}

QPushButton* TargetDetailDialog::periodButton(core::TimePeriod period) const {
    return qobject_cast<QPushButton*>(periodGroup_->button(core::periodHours(period)));
}

QLabel* TargetDetailDialog::tileValue(StatTile tile) const {
    return tiles_[static_cast<std::size_t>(tile)];
}

void TargetDetailDialog::done(int result) {
    viewModel_->close();
    QDialog::done(result);
}

void TargetDetailDialog::onPeriodChanged(core::TimePeriod period) {
    if (auto* button = periodButton(period)) {
        button->setChecked(true);
    }
}

void TargetDetailDialog::onDataChanged() {
    auto options = DetailedGraphOptions::fromConfig(config_, viewModel_->period());
    options.timeZone = timeZone_;
    graph_->setOptions(options);
    graph_->setSeries(viewModel_->series());

    updateHeader();
    updateStatistics();
}

void TargetDetailDialog::onLoadingChanged(bool loading) {
    graph_->setLoading(loading);
    for (auto* button : periodGroup_->buttons()) {
        button->setEnabled(!loading);
    }
}

void TargetDetailDialog::onErrorChanged(const QString& message) {
    errorLabel_->setText(message);
    errorLabel_->setVisible(!message.isEmpty());
}

void TargetDetailDialog::updateHeader() {
    const auto& target = viewModel_->target();
    nameLabel_->setText(QString::fromStdString(target.displayName()));
    addressLabel_->setText(QString::fromStdString(target.address));
    setWindowTitle(QString::fromStdString(target.displayName()));

    const auto& stats = viewModel_->statistics();
    uptimeBadge_->setVisible(stats.has_value());
    if (stats) {
        const QColor color = palette::forUptime(core::uptimeLevel(stats->uptimePercent));
        uptimeBadge_->setText(QString("%1% Uptime").arg(stats->uptimePercent, 0, 'f', 2));
        uptimeBadge_->setStyleSheet(
            QString("background-color: %1; color: white; border-radius: 4px; padding: 2px 8px;")
                .arg(color.name()));
    }
}

void TargetDetailDialog::updateStatistics() {
    const auto& stats = viewModel_->statistics();
    if (!stats) {
        for (auto* tile : tiles_) {
            tile->setText("-");
            tile->setStyleSheet(QString());
        }
        return;
    }

    setTile(StatTile::Min, latencyText(stats->minLatency) + " ms");
    setTile(StatTile::Avg, latencyText(stats->avgLatency) + " ms");
    setTile(StatTile::Max, latencyText(stats->maxLatency) + " ms");
    setTile(StatTile::Jitter, QString::fromUtf8("±") + latencyText(stats->avgJitter) + " ms");
    setTile(StatTile::Loss, QString("%1%").arg(stats->avgPacketLoss, 0, 'f', 2),
            stats->avgPacketLoss > HIGH_LOSS_PERCENT ? palette::critical() : QColor());
    setTile(StatTile::Samples, QString::number(stats->totalMeasurements));
    setTile(StatTile::Outages, QString::number(stats->outages),
            stats->outages > 0 ? palette::critical() : QColor());
    setTile(StatTile::Uptime, QString("%1%").arg(stats->uptimePercent, 0, 'f', 2),
            palette::forUptime(core::uptimeLevel(stats->uptimePercent)));
}

void TargetDetailDialog::setTile(StatTile tile, const QString& text, const QColor& color) {
    auto* label = tileValue(tile);
    label->setText(text);
    label->setStyleSheet(color.isValid() ? QString("color: %1;").arg(color.name()) : QString());
}

} // namespace pingscope::ui
