#pragma once

#include "core/graph/TimeWindow.hpp"
#include "core/types/PingWidgetData.hpp"

#include <QLabel>
#include <QPointer>
#include <QScrollArea>
#include <QStackedWidget>
#include <QVBoxLayout>
#include <QWidget>

#include <vector>

namespace pingscope::viewmodels {
class PingWidgetViewModel;
class TargetDetailViewModel;
} // namespace pingscope::viewmodels

namespace pingscope::ui {

class TargetCard;
class TargetDetailDialog;

/**
 * @brief Uptime widget showing the status of every monitored target.
 *
 * Renders the PingWidgetViewModel's snapshot as a list of target cards with
 * a status summary header and a footer. Zooming a card opens a
 * TargetDetailDialog driven by the detail view model. Cards switch to their
 * one-line mode when the widget is short and holds many targets.
 */
class UptimePingWidget : public QWidget {
    Q_OBJECT

public:
    /// Widgets lower than this are considered small
    static constexpr int SMALL_HEIGHT = 320;

    UptimePingWidget(viewmodels::PingWidgetViewModel* viewModel,
                     viewmodels::TargetDetailViewModel* detailViewModel,
                     QWidget* parent = nullptr);
    ~UptimePingWidget() override;

    void setTimeZone(core::TimeZoneMode zone);
    void setCompactThreshold(int targetCount);

    [[nodiscard]] bool isCompactMode() const { return compact_; }
    [[nodiscard]] const std::vector<TargetCard*>& cards() const { return cards_; }
    [[nodiscard]] QLabel* okCountBadge() const { return okBadge_; }
    [[nodiscard]] QLabel* warningCountBadge() const { return warningBadge_; }
    [[nodiscard]] QLabel* criticalCountBadge() const { return criticalBadge_; }
    [[nodiscard]] QLabel* pointsLabel() const { return pointsLabel_; }
    [[nodiscard]] QLabel* updatedLabel() const { return updatedLabel_; }
    [[nodiscard]] QLabel* errorBanner() const { return errorBanner_; }
    [[nodiscard]] QLabel* messageLabel() const { return messageLabel_; }
    [[nodiscard]] TargetDetailDialog* detailDialog() const { return detailDialog_; }

    /**
     * @brief Page currently shown in the body.
     */
    enum class Page { Loading, Message, Targets };
    [[nodiscard]] Page currentPage() const;

signals:
    void dataReady(const pingscope::core::PingWidgetData& data);
    void zoomOpened(const QString& targetAddress);
    void zoomClosed();

protected:
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void onStateChanged();
    void onDataChanged();
    void onZoomOpened(const QString& targetAddress);
    void onZoomClosed();
    void onDialogFinished();

private:
    void setupUi();
    void rebuildCards(const core::PingWidgetData& data);
    void updateHeader(const core::PingWidgetData& data);
    void updateFooter(const core::PingWidgetData& data);
    void updateCompactMode();
    void showMessage(const QString& message, bool isError);

    viewmodels::PingWidgetViewModel* viewModel_;
    viewmodels::TargetDetailViewModel* detailViewModel_;
    core::TimeZoneMode timeZone_{core::TimeZoneMode::Local};
    int compactThreshold_{3};
    bool compact_{false};

    QLabel* titleLabel_{nullptr};
    QLabel* refreshingLabel_{nullptr};
    QLabel* okBadge_{nullptr};
    QLabel* warningBadge_{nullptr};
    QLabel* criticalBadge_{nullptr};
    QLabel* errorBanner_{nullptr};
    QStackedWidget* body_{nullptr};
    QLabel* loadingLabel_{nullptr};
    QLabel* messageLabel_{nullptr};
    QScrollArea* scrollArea_{nullptr};
    QWidget* cardContainer_{nullptr};
    QVBoxLayout* cardLayout_{nullptr};
    QWidget* footer_{nullptr};
    QLabel* pointsLabel_{nullptr};
    QLabel* updatedLabel_{nullptr};

    std::vector<TargetCard*> cards_;
    QPointer<TargetDetailDialog> detailDialog_;
};

} // namespace pingscope::ui
