#include "ui/graph/GraphPainter.hpp"

#include <QFontMetricsF>
#include <QPainter>

namespace pingscope::ui {

void GraphPainter::paint(QPainter& painter, const GraphFrame& frame) {
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing);

    for (const auto& line : frame.gridLines) {
        paintLine(painter, line);
    }
    for (const auto& line : frame.thresholdLines) {
        paintLine(painter, line);
    }

    painter.setPen(Qt::NoPen);
    for (const auto& bar : frame.bars) {
        painter.fillRect(bar.rect, bar.color);
    }

    for (const auto& path : frame.averageLine) {
        paintPath(painter, path);
    }
    for (const auto& path : frame.minLine) {
        paintPath(painter, path);
    }
    for (const auto& path : frame.maxLine) {
        paintPath(painter, path);
    }

    painter.setPen(Qt::NoPen);
    for (const auto& dot : frame.lossDots) {
        painter.setBrush(dot.color);
        painter.drawEllipse(dot.center, dot.radius, dot.radius);
    }
    painter.setBrush(Qt::NoBrush);

    for (const auto& axis : frame.axes) {
        paintLine(painter, axis);
    }
    for (const auto& label : frame.labels) {
        paintText(painter, label);
    }
    if (frame.placeholder) {
        paintText(painter, *frame.placeholder);
    }

    painter.restore();
}

void GraphPainter::paintLine(QPainter& painter, const GraphLine& line) {
    QPen pen(line.color, line.width);
    if (!line.dashPattern.isEmpty()) {
        pen.setDashPattern(line.dashPattern);
    }
    painter.setPen(pen);
    painter.drawLine(line.line);
}

void GraphPainter::paintPath(QPainter& painter, const GraphPath& path) {
    // A single point has no segment to stroke
    if (path.points.size() < 2) {
        return;
    }
    QPen pen(path.color, path.width);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawPolyline(path.points);
}

void GraphPainter::paintText(QPainter& painter, const GraphText& text) {
    QFont font = painter.font();
    font.setPixelSize(text.pixelSize);
    painter.setFont(font);
    painter.setPen(text.color);

    const qreal textWidth = QFontMetricsF(font).horizontalAdvance(text.text);
    qreal x = text.anchor.x();
    if (text.alignment & Qt::AlignRight) {
        x -= textWidth;
    } else if (text.alignment & Qt::AlignHCenter) {
        x -= textWidth / 2.0;
    }
    painter.drawText(QPointF(x, text.anchor.y()), text.text);
}

} // namespace pingscope::ui
