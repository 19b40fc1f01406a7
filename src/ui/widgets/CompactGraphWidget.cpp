#include "ui/widgets/CompactGraphWidget.hpp"

#include <QMouseEvent>
#include <QPainter>

#include <algorithm>

namespace pingscope::ui {

namespace {
constexpr int MIN_GRAPH_WIDTH = 120;
constexpr int MIN_GRAPH_HEIGHT = 40;
} // namespace

CompactGraphWidget::CompactGraphWidget(QWidget* parent) : QWidget(parent) {
    setObjectName("CompactGraph");
    setCursor(Qt::PointingHandCursor);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
    setFixedHeight(std::max(renderer_.options().heightPx, MIN_GRAPH_HEIGHT));
    setToolTip("Click to zoom");
}

void CompactGraphWidget::setSeries(core::PingSeries series) {
    series_ = std::move(series);
    update();
}

void CompactGraphWidget::setOptions(const CompactGraphOptions& options) {
    if (options == renderer_.options()) {
        return;
    }
    renderer_ = CompactGraphRenderer(options);
    setFixedHeight(std::max(options.heightPx, MIN_GRAPH_HEIGHT));
    update();
}

GraphFrame CompactGraphWidget::currentFrame() const {
    return renderer_.layout(series_, QSizeF(size()));
}

QSize CompactGraphWidget::sizeHint() const {
    return {300, renderer_.options().heightPx};
}

QSize CompactGraphWidget::minimumSizeHint() const {
    return {MIN_GRAPH_WIDTH, MIN_GRAPH_HEIGHT};
}

void CompactGraphWidget::paintEvent(QPaintEvent* /*event*/) {
    // Laid out from the current series and size on every paint, so resizes
    // never draw stale data
    QPainter painter(this);
    renderer_.render(painter, series_, QSizeF(size()));
}

void CompactGraphWidget::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton && rect().contains(event->position().toPoint())) {
        emit clicked();
    }
    QWidget::mouseReleaseEvent(event);
}

} // namespace pingscope::ui
