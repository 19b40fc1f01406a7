#pragma once

#include "core/types/PingTarget.hpp"
#include "core/types/ThresholdConfig.hpp"

#include <QFrame>
#include <QLabel>
#include <QToolButton>

namespace pingscope::ui {

class CompactGraphWidget;

/**
 * @brief Card showing one monitored target.
 *
 * In full mode the card shows the target's identity, status badge, current
 * latency figures, its compact graph and a statistics row. Compact mode
 * reduces it to a single line with the name and latency, or "DOWN".
 */
class TargetCard : public QFrame {
    Q_OBJECT

public:
    explicit TargetCard(QWidget* parent = nullptr);

    /**
     * @brief Shows a target snapshot with the widget's display settings.
     * @param showGraph Whether history is available for the graph and zoom.
     */
    void setTarget(const core::PingTarget& target, const core::ThresholdConfig& config,
                   bool showGraph = true);

    void setCompact(bool compact);
    [[nodiscard]] bool isCompact() const { return compact_; }

    [[nodiscard]] const core::PingTarget& target() const { return target_; }
    [[nodiscard]] core::TargetStatus status() const { return status_; }

    /**
     * @brief Text of the one-line latency value shown in compact mode.
     */
    [[nodiscard]] QString compactValueText() const;

    [[nodiscard]] QLabel* statusBadge() const { return statusBadge_; }
    [[nodiscard]] QLabel* latencyLabel() const { return latencyLabel_; }
    [[nodiscard]] QLabel* jitterLabel() const { return jitterLabel_; }
    [[nodiscard]] QLabel* lossBadge() const { return lossBadge_; }
    [[nodiscard]] QLabel* errorLabel() const { return errorLabel_; }
    [[nodiscard]] QWidget* statisticsRow() const { return statsRow_; }
    [[nodiscard]] QToolButton* zoomButton() const { return zoomButton_; }
    [[nodiscard]] CompactGraphWidget* graph() const { return graph_; }

signals:
    void zoomRequested(const QString& targetAddress);

private:
    void buildFullLayout();
    void buildCompactLayout();
    void refreshFull();
    void refreshCompact();
    void refreshStatistics();
    void requestZoom();

    core::PingTarget target_;
    core::ThresholdConfig config_;
    core::TargetStatus status_{core::TargetStatus::Ok};
    bool showGraph_{true};
    bool compact_{false};

    QWidget* fullView_{nullptr};
    QFrame* statusIcon_{nullptr};
    QLabel* nameLabel_{nullptr};
    QLabel* addressLabel_{nullptr};
    QLabel* statusBadge_{nullptr};
    QToolButton* zoomButton_{nullptr};
    QWidget* metricsRow_{nullptr};
    QLabel* latencyLabel_{nullptr};
    QLabel* jitterLabel_{nullptr};
    QLabel* lossBadge_{nullptr};
    QLabel* errorLabel_{nullptr};
    CompactGraphWidget* graph_{nullptr};
    QWidget* statsRow_{nullptr};
    QLabel* uptimeBadge_{nullptr};
    QLabel* statsMinLabel_{nullptr};
    QLabel* statsMaxLabel_{nullptr};
    QLabel* outagesBadge_{nullptr};

    QWidget* compactView_{nullptr};
    QFrame* compactIcon_{nullptr};
    QLabel* compactName_{nullptr};
    QLabel* compactValue_{nullptr};
};

} // namespace pingscope::ui
