#include "ui/graph/CompactGraphRenderer.hpp"

#include "core/types/PingTarget.hpp"
#include "ui/graph/GraphPainter.hpp"
#include "ui/graph/GraphPalette.hpp"

#include <QImage>
#include <QPainter>

#include <algorithm>

namespace pingscope::ui {

namespace {

constexpr qreal BAND_ALPHA = 0.4;
constexpr qreal THRESHOLD_ALPHA = 0.3;
constexpr qreal AVERAGE_WIDTH = 2.0;
constexpr qreal LOSS_DOT_RADIUS = 3.0;
// Loss percentage at which a dot becomes fully opaque
constexpr double LOSS_FULL_OPACITY = 50.0;

} // namespace

CompactGraphOptions CompactGraphOptions::fromConfig(const core::ThresholdConfig& config) {
    CompactGraphOptions options;
    options.heightPx = config.graphHeightPx;
    options.showJitter = config.showJitter;
    options.warningMs = config.latencyWarningMs;
    options.criticalMs = config.latencyCriticalMs;
    return options;
}

CompactGraphRenderer::CompactGraphRenderer(CompactGraphOptions options)
    : options_(options) {}

GraphFrame CompactGraphRenderer::layout(const core::PingSeries& series,
                                        const QSizeF& size) const {
    GraphFrame frame;
    frame.size = size;
    frame.plotArea = QRectF(QPointF(0, 0), size);

    const double width = size.width();
    const double height = size.height();
    if (width <= 0.0 || height <= 0.0) {
        return frame;
    }

    auto peak = core::peakLatency(series);
    if (!peak) {
        frame.placeholder = GraphText{QPointF(width / 2.0, height / 2.0), "No data",
                                      palette::placeholderText(), 12, Qt::AlignHCenter};
        return frame;
    }

    // Keep the warning threshold on screen even when every sample is below it
    double maxLatency = std::max(*peak, options_.warningMs);
    if (maxLatency <= 0.0) {
        maxLatency = 1.0;
    }
    frame.maxLatency = maxLatency;

    auto toY = [&](double latency) {
        return height - (latency / maxLatency) * (height - 2.0 * PADDING) - PADDING;
    };

    const QVector<qreal> dash{4.0, 4.0};
    const double warningY = toY(options_.warningMs);
    frame.thresholdLines.push_back(
        {QLineF(0.0, warningY, width, warningY), palette::warning(THRESHOLD_ALPHA), 1.0, dash});
    const double criticalY = toY(options_.criticalMs);
    if (criticalY > 0.0) {
        frame.thresholdLines.push_back({QLineF(0.0, criticalY, width, criticalY),
                                        palette::critical(THRESHOLD_ALPHA), 1.0, dash});
    }

    core::ThresholdConfig thresholds;
    thresholds.latencyWarningMs = options_.warningMs;
    thresholds.latencyCriticalMs = options_.criticalMs;

    const double slot = width / static_cast<double>(series.size());
    const double barWidth = std::max(slot - 1.0, 2.0);

    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto& sample = series[i];
        const double x = static_cast<double>(i) * slot;

        if (!sample.isReachable) {
            frame.bars.push_back({QRectF(x, 0.0, barWidth, height), BarKind::Outage,
                                  palette::outage(), i});
            continue;
        }
        if (!options_.showJitter || !sample.hasLatencyBand()) {
            continue;
        }

        const double top = toY(*sample.maxLatency());
        const double bottom = toY(*sample.minLatency());
        const auto level = core::latencyLevel(sample.avgLatency(), thresholds);
        frame.bars.push_back({QRectF(x, top, barWidth, bottom - top).normalized(),
                              bandKind(level), palette::forStatus(level, BAND_ALPHA), i});
    }

    GraphPath run{{}, palette::averageLine(), AVERAGE_WIDTH};
    auto liftPen = [&]() {
        if (!run.points.isEmpty()) {
            frame.averageLine.push_back(run);
            run.points.clear();
        }
    };

    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto& sample = series[i];
        auto avg = sample.avgLatency();
        if (!avg) {
            liftPen();
            continue;
        }

        const QPointF point(static_cast<double>(i) * slot + slot / 2.0, toY(*avg));
        run.points << point;

        if (sample.packetLossPercent > 0.0) {
            const qreal opacity = std::min(sample.packetLossPercent / LOSS_FULL_OPACITY, 1.0);
            frame.lossDots.push_back(
                {point, LOSS_DOT_RADIUS, opacity, palette::packetLoss(opacity), i});
        }
    }
    liftPen();

    return frame;
}

void CompactGraphRenderer::render(QPainter& painter, const core::PingSeries& series,
                                  const QSizeF& size) const {
    GraphPainter::paint(painter, layout(series, size));
}

void renderCompact(QImage& surface, const core::PingSeries& series,
                   const CompactGraphOptions& options) {
    if (surface.isNull()) {
        return;
    }
    surface.fill(Qt::transparent);
    QPainter painter(&surface);
    CompactGraphRenderer(options).render(painter, series, QSizeF(surface.size()));
}

} // namespace pingscope::ui
