#pragma once

#include "ui/graph/GraphFrame.hpp"

class QPainter;

namespace pingscope::ui {

/**
 * @brief Rasterises a GraphFrame with QPainter.
 *
 * Paint order is fixed: grid, thresholds, bars, latency lines, loss dots,
 * axes, labels and finally the placeholder message.
 */
class GraphPainter {
public:
    static void paint(QPainter& painter, const GraphFrame& frame);

private:
    static void paintLine(QPainter& painter, const GraphLine& line);
    static void paintPath(QPainter& painter, const GraphPath& path);
    static void paintText(QPainter& painter, const GraphText& text);
};

} // namespace pingscope::ui
