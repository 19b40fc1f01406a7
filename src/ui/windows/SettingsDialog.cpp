#include "ui/windows/SettingsDialog.hpp"

#include "app/Application.hpp"

#include <QDialogButtonBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QMessageBox>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>

#include <spdlog/spdlog.h>

namespace pingscope::ui {

SettingsDialog::SettingsDialog(QWidget* parent) : QDialog(parent) {
    setWindowTitle("Settings");
    setMinimumSize(450, 500);

    setupUi();
    loadSettings();
}

void SettingsDialog::setupUi() {
    auto* mainLayout = new QVBoxLayout(this);

    auto* tabWidget = new QTabWidget(this);

    // General tab
    auto* generalTab = new QWidget(this);
    auto* generalLayout = new QVBoxLayout(generalTab);

    auto* appearanceGroup = new QGroupBox("Appearance", generalTab);
    auto* appearanceLayout = new QFormLayout(appearanceGroup);

    timeDisplayCombo_ = new QComboBox(this);
    timeDisplayCombo_->addItem("Local time", "local");
    timeDisplayCombo_->addItem("UTC", "utc");
    appearanceLayout->addRow("Timestamps:", timeDisplayCombo_);

    generalLayout->addWidget(appearanceGroup);

    auto* loggingGroup = new QGroupBox("Logging", generalTab);
    auto* loggingLayout = new QFormLayout(loggingGroup);

    logLevelCombo_ = new QComboBox(this);
    for (const char* level : {"trace", "debug", "info", "warning", "error", "critical", "off"}) {
        logLevelCombo_->addItem(level);
    }
    loggingLayout->addRow("Log level:", logLevelCombo_);

    generalLayout->addWidget(loggingGroup);
    generalLayout->addStretch();

    tabWidget->addTab(generalTab, "General");

    // Connection tab
    auto* connectionTab = new QWidget(this);
    auto* connectionLayout = new QVBoxLayout(connectionTab);

    auto* backendGroup = new QGroupBox("Dashboard Backend", connectionTab);
    auto* backendLayout = new QFormLayout(backendGroup);

    baseUrlEdit_ = new QLineEdit(this);
    baseUrlEdit_->setPlaceholderText("http://localhost:8000/api");
    backendLayout->addRow("API URL:", baseUrlEdit_);

    widgetIdSpin_ = new QSpinBox(this);
    widgetIdSpin_->setRange(0, 1000000000);
    widgetIdSpin_->setSpecialValueText("Not set");
    backendLayout->addRow("Widget id:", widgetIdSpin_);

    tokenEdit_ = new QLineEdit(this);
    tokenEdit_->setEchoMode(QLineEdit::Password);
    tokenEdit_->setPlaceholderText("Bearer token");
    backendLayout->addRow("API token:", tokenEdit_);

    requestTimeoutSpin_ = new QSpinBox(this);
    requestTimeoutSpin_->setRange(1000, 120000);
    requestTimeoutSpin_->setSingleStep(1000);
    requestTimeoutSpin_->setSuffix(" ms");
    backendLayout->addRow("Request timeout:", requestTimeoutSpin_);

    connectionLayout->addWidget(backendGroup);

    auto* pollingGroup = new QGroupBox("Polling", connectionTab);
    auto* pollingLayout = new QFormLayout(pollingGroup);

    pingIntervalSpin_ = new QSpinBox(this);
    pingIntervalSpin_->setRange(5, 3600);
    pingIntervalSpin_->setSuffix(" seconds");
    pollingLayout->addRow("Refresh interval:", pingIntervalSpin_);

    fallbackIntervalSpin_ = new QSpinBox(this);
    fallbackIntervalSpin_->setRange(5, 3600);
    fallbackIntervalSpin_->setSuffix(" seconds");
    pollingLayout->addRow("Fallback interval:", fallbackIntervalSpin_);

    connectionLayout->addWidget(pollingGroup);
    connectionLayout->addStretch();

    tabWidget->addTab(connectionTab, "Connection");

    // Display tab
    auto* displayTab = new QWidget(this);
    auto* displayLayout = new QVBoxLayout(displayTab);

    auto* thresholdsGroup = new QGroupBox("Default Thresholds", displayTab);
    auto* thresholdsLayout = new QFormLayout(thresholdsGroup);

    latencyWarningSpin_ = new QSpinBox(this);
    latencyWarningSpin_->setRange(1, 10000);
    latencyWarningSpin_->setSuffix(" ms");
    thresholdsLayout->addRow("Latency warning:", latencyWarningSpin_);

    latencyCriticalSpin_ = new QSpinBox(this);
    latencyCriticalSpin_->setRange(1, 30000);
    latencyCriticalSpin_->setSuffix(" ms");
    thresholdsLayout->addRow("Latency critical:", latencyCriticalSpin_);

    lossWarningSpin_ = new QDoubleSpinBox(this);
    lossWarningSpin_->setRange(0.0, 100.0);
    lossWarningSpin_->setDecimals(1);
    lossWarningSpin_->setSuffix(" %");
    thresholdsLayout->addRow("Loss warning:", lossWarningSpin_);

    lossCriticalSpin_ = new QDoubleSpinBox(this);
    lossCriticalSpin_->setRange(0.0, 100.0);
    lossCriticalSpin_->setDecimals(1);
    lossCriticalSpin_->setSuffix(" %");
    thresholdsLayout->addRow("Loss critical:", lossCriticalSpin_);

    displayLayout->addWidget(thresholdsGroup);

    auto* cardsGroup = new QGroupBox("Cards", displayTab);
    auto* cardsLayout = new QFormLayout(cardsGroup);

    showJitterCheck_ = new QCheckBox("Show jitter", this);
    cardsLayout->addRow("", showJitterCheck_);
    showPacketLossCheck_ = new QCheckBox("Show packet loss", this);
    cardsLayout->addRow("", showPacketLossCheck_);
    showStatisticsCheck_ = new QCheckBox("Show statistics", this);
    cardsLayout->addRow("", showStatisticsCheck_);

    graphHeightSpin_ = new QSpinBox(this);
    graphHeightSpin_->setRange(40, 600);
    graphHeightSpin_->setSuffix(" px");
    cardsLayout->addRow("Graph height:", graphHeightSpin_);

    historyHoursSpin_ = new QSpinBox(this);
    historyHoursSpin_->setRange(1, 8760);
    historyHoursSpin_->setSuffix(" hours");
    cardsLayout->addRow("History window:", historyHoursSpin_);

    compactThresholdSpin_ = new QSpinBox(this);
    compactThresholdSpin_->setRange(1, 100);
    cardsLayout->addRow("Compact above:", compactThresholdSpin_);

    displayLayout->addWidget(cardsGroup);
    displayLayout->addStretch();

    tabWidget->addTab(displayTab, "Display");

    mainLayout->addWidget(tabWidget);

    // Buttons
    auto* buttonBox =
        new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel | QDialogButtonBox::Apply,
                             this);

    connect(buttonBox, &QDialogButtonBox::accepted, this, &SettingsDialog::onAccept);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(buttonBox->button(QDialogButtonBox::Apply), &QPushButton::clicked, this,
            &SettingsDialog::onApply);

    mainLayout->addWidget(buttonBox);
}

void SettingsDialog::loadSettings() {
    auto& manager = app::Application::instance().config();
    const auto& config = manager.config();

    // General
    timeDisplayCombo_->setCurrentIndex(
        timeDisplayCombo_->findData(QString::fromStdString(infra::timeDisplayToString(config.timeDisplay))));
    logLevelCombo_->setCurrentText(QString::fromStdString(config.logLevel));

    // Connection
    baseUrlEdit_->setText(QString::fromStdString(config.apiBaseUrl));
    widgetIdSpin_->setValue(static_cast<int>(config.widgetId));
    tokenEdit_->setText(
        QString::fromStdString(manager.getSecureValue(infra::ConfigManager::API_TOKEN_KEY).value_or("")));
    requestTimeoutSpin_->setValue(config.requestTimeoutMs);

    // Polling
    pingIntervalSpin_->setValue(config.pingIntervalSeconds);
    fallbackIntervalSpin_->setValue(config.fallbackIntervalSeconds);

    // Display
    latencyWarningSpin_->setValue(static_cast<int>(config.display.latencyWarningMs));
    latencyCriticalSpin_->setValue(static_cast<int>(config.display.latencyCriticalMs));
    lossWarningSpin_->setValue(config.display.lossWarningPercent);
    lossCriticalSpin_->setValue(config.display.lossCriticalPercent);
    showJitterCheck_->setChecked(config.display.showJitter);
    showPacketLossCheck_->setChecked(config.display.showPacketLoss);
    showStatisticsCheck_->setChecked(config.display.showStatistics);
    graphHeightSpin_->setValue(config.display.graphHeightPx);
    historyHoursSpin_->setValue(config.display.historyHours);
    compactThresholdSpin_->setValue(config.compactCardThreshold);
}

bool SettingsDialog::saveSettings() {
    core::ThresholdConfig display;
    display.latencyWarningMs = latencyWarningSpin_->value();
    display.latencyCriticalMs = latencyCriticalSpin_->value();
    display.lossWarningPercent = lossWarningSpin_->value();
    display.lossCriticalPercent = lossCriticalSpin_->value();
    display.showJitter = showJitterCheck_->isChecked();
    display.showPacketLoss = showPacketLossCheck_->isChecked();
    display.showStatistics = showStatisticsCheck_->isChecked();
    display.graphHeightPx = graphHeightSpin_->value();
    display.historyHours = historyHoursSpin_->value();

    if (!display.isValid()) {
        QMessageBox::warning(this, "Invalid Thresholds",
                             "Warning thresholds must be below their critical thresholds.");
        return false;
    }

    auto& app = app::Application::instance();
    auto& config = app.config().config();

    // General
    config.timeDisplay =
        infra::timeDisplayFromString(timeDisplayCombo_->currentData().toString().toStdString());
    config.logLevel = logLevelCombo_->currentText().toStdString();

    // Connection
    config.apiBaseUrl = baseUrlEdit_->text().trimmed().toStdString();
    config.widgetId = widgetIdSpin_->value();
    config.requestTimeoutMs = requestTimeoutSpin_->value();

    // Polling
    config.pingIntervalSeconds = pingIntervalSpin_->value();
    config.fallbackIntervalSeconds = fallbackIntervalSpin_->value();

    // Display
    config.display = display;
    config.compactCardThreshold = compactThresholdSpin_->value();

    app.config().setSecureValue(infra::ConfigManager::API_TOKEN_KEY,
                                tokenEdit_->text().trimmed().toStdString());
    if (!app.config().save()) {
        spdlog::error("Failed to save settings to {}", app.config().configPath().string());
    }

    app.applyConfig();
    return true;
}

void SettingsDialog::onAccept() {
    if (saveSettings()) {
        accept();
    }
}

void SettingsDialog::onApply() {
    saveSettings();
}

} // namespace pingscope::ui
