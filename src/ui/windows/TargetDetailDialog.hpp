#pragma once

#include "core/graph/TimeWindow.hpp"
#include "core/types/ThresholdConfig.hpp"
#include "core/types/TimePeriod.hpp"

#include <QButtonGroup>
#include <QDialog>
#include <QLabel>
#include <QPushButton>

#include <array>

namespace pingscope::viewmodels {
class TargetDetailViewModel;
}

namespace pingscope::ui {

class DetailedGraphWidget;

/**
 * @brief Statistic tiles shown below the detailed graph.
 */
enum class StatTile { Min, Avg, Max, Jitter, Loss, Samples, Outages, Uptime };

/**
 * @brief Zoomed view of one target with period selection.
 *
 * Binds a TargetDetailViewModel to a detailed graph, a legend and a grid of
 * statistic tiles. The view model must be opened before the dialog is shown
 * and is closed when the dialog finishes.
 */
class TargetDetailDialog : public QDialog {
    Q_OBJECT

public:
    TargetDetailDialog(viewmodels::TargetDetailViewModel* viewModel,
                       const core::ThresholdConfig& config, core::TimeZoneMode timeZone,
                       QWidget* parent = nullptr);

    [[nodiscard]] DetailedGraphWidget* graph() const { return graph_; }
    [[nodiscard]] QPushButton* periodButton(core::TimePeriod period) const;
    [[nodiscard]] QLabel* tileValue(StatTile tile) const;
    [[nodiscard]] QLabel* uptimeBadge() const { return uptimeBadge_; }
    [[nodiscard]] QLabel* errorLabel() const { return errorLabel_; }

    void done(int result) override;

private slots:
    void onPeriodChanged(core::TimePeriod period);
    void onDataChanged();
    void onLoadingChanged(bool loading);
    void onErrorChanged(const QString& message);

private:
    void setupUi();
    QWidget* createLegend();
    QWidget* createStatTiles();
    void updateHeader();
    void updateStatistics();
    void setTile(StatTile tile, const QString& text, const QColor& color = QColor());

    viewmodels::TargetDetailViewModel* viewModel_;
    core::ThresholdConfig config_;
    core::TimeZoneMode timeZone_;

    QLabel* nameLabel_{nullptr};
    QLabel* addressLabel_{nullptr};
    QLabel* uptimeBadge_{nullptr};
    QButtonGroup* periodGroup_{nullptr};
    DetailedGraphWidget* graph_{nullptr};
    QLabel* errorLabel_{nullptr};
    std::array<QLabel*, 8> tiles_{};
};

} // namespace pingscope::ui
