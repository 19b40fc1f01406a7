#pragma once

#include <QCheckBox>
#include <QComboBox>
#include <QDialog>
#include <QDoubleSpinBox>
#include <QLineEdit>
#include <QSpinBox>

namespace pingscope::ui {

class SettingsDialog : public QDialog {
    Q_OBJECT

public:
    explicit SettingsDialog(QWidget* parent = nullptr);

private slots:
    void onAccept();
    void onApply();

private:
    void setupUi();
    void loadSettings();
    bool saveSettings();

    // General
    QComboBox* timeDisplayCombo_{nullptr};
    QComboBox* logLevelCombo_{nullptr};

    // Connection
    QLineEdit* baseUrlEdit_{nullptr};
    QSpinBox* widgetIdSpin_{nullptr};
    QLineEdit* tokenEdit_{nullptr};
    QSpinBox* requestTimeoutSpin_{nullptr};

    // Polling
    QSpinBox* pingIntervalSpin_{nullptr};
    QSpinBox* fallbackIntervalSpin_{nullptr};

    // Display defaults
    QSpinBox* latencyWarningSpin_{nullptr};
    QSpinBox* latencyCriticalSpin_{nullptr};
    QDoubleSpinBox* lossWarningSpin_{nullptr};
    QDoubleSpinBox* lossCriticalSpin_{nullptr};
    QCheckBox* showJitterCheck_{nullptr};
    QCheckBox* showPacketLossCheck_{nullptr};
    QCheckBox* showStatisticsCheck_{nullptr};
    QSpinBox* graphHeightSpin_{nullptr};
    QSpinBox* historyHoursSpin_{nullptr};
    QSpinBox* compactThresholdSpin_{nullptr};
};

} // namespace pingscope::ui
