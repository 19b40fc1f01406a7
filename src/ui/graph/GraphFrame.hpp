/**
 * @file GraphFrame.hpp
 * @brief Resolution-independent draw plan produced by the graph renderers.
 *
 * Renderers first lay a series out into a GraphFrame, a flat list of
 * primitives in surface coordinates, and then hand it to GraphPainter. The
 * frame is a pure function of its inputs, which keeps redraws idempotent and
 * lets the geometry be inspected without rasterising.
 */

#pragma once

#include "core/graph/TimeWindow.hpp"
#include "core/types/PingTarget.hpp"

#include <QColor>
#include <QLineF>
#include <QPointF>
#include <QPolygonF>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QVector>

#include <cstddef>
#include <optional>
#include <vector>

namespace pingscope::ui {

/**
 * @brief Semantic kind of a vertical bar.
 */
enum class BarKind {
    Outage,       ///< Unreachable sample, full height
    BandOk,       ///< Min-max band with average below warning
    BandWarning,  ///< Min-max band with average at or above warning
    BandCritical  ///< Min-max band with average at or above critical
};

/**
 * @brief Band kind for a sample's latency level.
 */
inline BarKind bandKind(core::TargetStatus level) {
    switch (level) {
    case core::TargetStatus::Critical:
        return BarKind::BandCritical;
    case core::TargetStatus::Warning:
        return BarKind::BandWarning;
    default:
        return BarKind::BandOk;
    }
}

struct GraphBar {
    QRectF rect;
    BarKind kind{BarKind::BandOk};
    QColor color;
    std::size_t sampleIndex{0};
};

struct GraphLine {
    QLineF line;
    QColor color;
    qreal width{1.0};
    QVector<qreal> dashPattern; ///< Empty for a solid line
};

/**
 * @brief One pen-down run of a polyline. A gap in the data starts a new run.
 */
struct GraphPath {
    QPolygonF points;
    QColor color;
    qreal width{1.0};
};

struct LossDot {
    QPointF center;
    qreal radius{3.0};
    qreal opacity{0.0};
    QColor color;
    std::size_t sampleIndex{0};
};

/**
 * @brief Text anchored at a baseline point.
 *
 * Horizontal alignment is relative to the anchor: AlignLeft starts the text
 * there, AlignRight ends it there, AlignHCenter centres it.
 */
struct GraphText {
    QPointF anchor;
    QString text;
    QColor color;
    int pixelSize{11};
    Qt::Alignment alignment{Qt::AlignLeft};
};

/**
 * @brief Complete draw plan for one graph surface.
 */
struct GraphFrame {
    QSizeF size;                            ///< Surface size the frame was laid out for
    QRectF plotArea;                        ///< Area samples are mapped into
    double maxLatency{0.0};                 ///< Latency mapped to the top of the plot
    std::optional<core::TimeWindow> window; ///< Visible window, detailed graphs only

    std::vector<GraphLine> gridLines;
    std::vector<GraphLine> thresholdLines;
    std::vector<GraphBar> bars;
    std::vector<GraphPath> averageLine;
    std::vector<GraphPath> minLine;
    std::vector<GraphPath> maxLine;
    std::vector<LossDot> lossDots;
    std::vector<GraphLine> axes;
    std::vector<GraphText> labels;
    std::optional<GraphText> placeholder;   ///< "No data" style message

    /**
     * @brief True when no sample-derived primitive was produced.
     */
    [[nodiscard]] bool hasSampleGeometry() const {
        return !bars.empty() || !averageLine.empty() || !minLine.empty() ||
               !maxLine.empty() || !lossDots.empty();
    }
};

} // namespace pingscope::ui
