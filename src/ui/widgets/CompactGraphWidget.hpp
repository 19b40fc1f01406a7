#pragma once

#include "core/types/PingSample.hpp"
#include "ui/graph/CompactGraphRenderer.hpp"

#include <QWidget>

namespace pingscope::ui {

/**
 * @brief Card-sized latency graph. Clicking it requests the detail view.
 */
class CompactGraphWidget : public QWidget {
    Q_OBJECT

public:
    explicit CompactGraphWidget(QWidget* parent = nullptr);

    void setSeries(core::PingSeries series);
    void setOptions(const CompactGraphOptions& options);

    [[nodiscard]] const core::PingSeries& series() const { return series_; }
    [[nodiscard]] const CompactGraphOptions& options() const { return renderer_.options(); }

    /**
     * @brief Draw plan for the widget's current size.
     */
    [[nodiscard]] GraphFrame currentFrame() const;

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

signals:
    void clicked();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    core::PingSeries series_;
    CompactGraphRenderer renderer_;
};

} // namespace pingscope::ui
