#pragma once

#include "core/graph/HitTester.hpp"
#include "core/types/PingSample.hpp"
#include "ui/graph/DetailedGraphRenderer.hpp"

#include <QWidget>

#include <cstddef>
#include <optional>

namespace pingscope::ui {

/**
 * @brief Time-scaled latency graph with hover tooltips.
 *
 * The frame drawn by the last paint is cached, and pointer positions are
 * hit-tested against its time window and plot area, so the tooltip always
 * refers to what is on screen. While a period is loading the last frame stays
 * visible under a translucent overlay.
 */
class DetailedGraphWidget : public QWidget {
    Q_OBJECT

public:
    explicit DetailedGraphWidget(QWidget* parent = nullptr);

    void setSeries(core::PingSeries series);
    void setOptions(const DetailedGraphOptions& options);
    void setLoading(bool loading);

    [[nodiscard]] const core::PingSeries& series() const { return series_; }
    [[nodiscard]] const DetailedGraphOptions& options() const { return options_; }
    [[nodiscard]] bool isLoading() const { return loading_; }

    /**
     * @brief Hit-tests a pointer position and updates the hover state.
     * @return Index of the hovered sample, or nullopt if none is close enough.
     */
    std::optional<std::size_t> hoverAt(const QPointF& position);

    /**
     * @brief Clears the hover state and hides the tooltip.
     */
    void clearHover();

    [[nodiscard]] std::optional<std::size_t> hoveredIndex() const { return hoveredIndex_; }
    [[nodiscard]] const std::optional<core::TooltipContent>& tooltip() const { return tooltip_; }

    /**
     * @brief Frame used for painting and hit-testing at the current size.
     */
    [[nodiscard]] const GraphFrame& frame();

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

private:
    void invalidateFrame();
    QString tooltipHtml(const core::TooltipContent& content) const;

    core::PingSeries series_;
    DetailedGraphOptions options_;
    std::optional<GraphFrame> frame_;
    bool loading_{false};
    std::optional<std::size_t> hoveredIndex_;
    std::optional<core::TooltipContent> tooltip_;
};

} // namespace pingscope::ui
