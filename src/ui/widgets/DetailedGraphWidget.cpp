#include "ui/widgets/DetailedGraphWidget.hpp"

#include "ui/graph/GraphPainter.hpp"

#include <QMouseEvent>
#include <QPainter>
#include <QToolTip>

namespace pingscope::ui {

namespace {
constexpr int GRAPH_HEIGHT = 300;
const QColor OVERLAY_COLOR(0, 0, 0, 90);
const QColor OVERLAY_TEXT(0xdd, 0xdd, 0xdd);
} // namespace

DetailedGraphWidget::DetailedGraphWidget(QWidget* parent) : QWidget(parent) {
    setObjectName("DetailedGraph");
    setMouseTracking(true);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
}

void DetailedGraphWidget::setSeries(core::PingSeries series) {
    series_ = std::move(series);
    // Pin the empty-window anchor so repeated paints draw the same frame
    options_.referenceTime = std::chrono::system_clock::now();
    clearHover();
    invalidateFrame();
}

void DetailedGraphWidget::setOptions(const DetailedGraphOptions& options) {
    options_ = options;
    clearHover();
    invalidateFrame();
}

void DetailedGraphWidget::setLoading(bool loading) {
    if (loading_ == loading) {
        return;
    }
    loading_ = loading;
    update();
}

const GraphFrame& DetailedGraphWidget::frame() {
    if (!frame_ || frame_->size != QSizeF(size())) {
        frame_ = DetailedGraphRenderer(options_).layout(series_, QSizeF(size()));
    }
    return *frame_;
}

std::optional<std::size_t> DetailedGraphWidget::hoverAt(const QPointF& position) {
    const auto& current = frame();
    if (!current.window || series_.empty()) {
        clearHover();
        return std::nullopt;
    }

    core::HitTester tester(*current.window, current.plotArea.width(), current.plotArea.left());
    auto index = tester.nearestIndex(position.x(), series_);
    if (!index) {
        clearHover();
        return std::nullopt;
    }

    if (index != hoveredIndex_) {
        hoveredIndex_ = index;
        tooltip_ = core::describeSample(series_[*index], options_.timeZone);
    }
    return index;
}

void DetailedGraphWidget::clearHover() {
    if (!hoveredIndex_) {
        return;
    }
    hoveredIndex_.reset();
    tooltip_.reset();
    QToolTip::hideText();
}

QSize DetailedGraphWidget::sizeHint() const {
    return {640, GRAPH_HEIGHT};
}

QSize DetailedGraphWidget::minimumSizeHint() const {
    return {320, 200};
}

void DetailedGraphWidget::paintEvent(QPaintEvent* /*event*/) {
    QPainter painter(this);
    GraphPainter::paint(painter, frame());

    if (loading_) {
        painter.fillRect(rect(), OVERLAY_COLOR);
        painter.setPen(OVERLAY_TEXT);
        painter.drawText(rect(), Qt::AlignCenter, "Loading...");
    }
}

void DetailedGraphWidget::resizeEvent(QResizeEvent* event) {
    invalidateFrame();
    QWidget::resizeEvent(event);
}

void DetailedGraphWidget::mouseMoveEvent(QMouseEvent* event) {
    const QPointF position = event->position();
    if (hoverAt(position) && tooltip_) {
        QToolTip::showText(event->globalPosition().toPoint(), tooltipHtml(*tooltip_), this);
    }
    QWidget::mouseMoveEvent(event);
}

void DetailedGraphWidget::leaveEvent(QEvent* event) {
    clearHover();
    QWidget::leaveEvent(event);
}

void DetailedGraphWidget::invalidateFrame() {
    frame_.reset();
    update();
}

QString DetailedGraphWidget::tooltipHtml(const core::TooltipContent& content) const {
    QString html = QString("<b>%1</b>").arg(QString::fromStdString(content.timestamp).toHtmlEscaped());
    for (const auto& line : content.lines) {
        const QString text = QString::fromStdString(line).toHtmlEscaped();
        if (content.offline) {
            html += QString("<br><span style='color:#f44336'>%1</span>").arg(text);
        } else {
            html += "<br>" + text;
        }
    }
    return html;
}

} // namespace pingscope::ui
