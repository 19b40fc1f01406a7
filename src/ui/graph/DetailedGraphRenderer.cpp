#include "ui/graph/DetailedGraphRenderer.hpp"

#include "core/types/PingTarget.hpp"
#include "ui/graph/GraphPainter.hpp"
#include "ui/graph/GraphPalette.hpp"

#include <QImage>
#include <QPainter>

#include <algorithm>
#include <functional>

namespace pingscope::ui {

namespace {

constexpr qreal BAND_ALPHA = 0.35;
constexpr qreal THRESHOLD_ALPHA = 0.6;
constexpr qreal THRESHOLD_LABEL_ALPHA = 0.8;
constexpr qreal AVERAGE_WIDTH = 2.5;
constexpr qreal BOUND_WIDTH = 1.0;
constexpr double MIN_SLOT = 2.0;
constexpr double MAX_SLOT = 20.0;
constexpr double MIN_BAND_HEIGHT = 2.0;

} // namespace

DetailedGraphOptions DetailedGraphOptions::fromConfig(const core::ThresholdConfig& config,
                                                      core::TimePeriod period) {
    DetailedGraphOptions options;
    options.period = period;
    options.warningMs = config.latencyWarningMs;
    options.criticalMs = config.latencyCriticalMs;
    return options;
}

DetailedGraphRenderer::DetailedGraphRenderer(DetailedGraphOptions options)
    : options_(options) {}

GraphFrame DetailedGraphRenderer::layout(const core::PingSeries& series,
                                         const QSizeF& size) const {
    GraphFrame frame;
    frame.size = size;

    const double width = size.width();
    const double height = size.height();
    const double graphWidth = width - MARGIN_LEFT - MARGIN_RIGHT;
    const double graphHeight = height - MARGIN_TOP - MARGIN_BOTTOM;
    if (graphWidth <= 0.0 || graphHeight <= 0.0) {
        if (width > 0.0 && height > 0.0) {
            frame.placeholder = GraphText{QPointF(width / 2.0, height / 2.0), "No data",
                                          palette::placeholderText(), 12, Qt::AlignHCenter};
        }
        return frame;
    }

    const double left = MARGIN_LEFT;
    const double right = width - MARGIN_RIGHT;
    const double top = MARGIN_TOP;
    const double bottom = height - MARGIN_BOTTOM;
    frame.plotArea = QRectF(left, top, graphWidth, graphHeight);

    const int hours = core::periodHours(options_.period);
    const core::TimeWindow window = core::resolveWindow(series, hours, options_.referenceTime);
    frame.window = window;

    double maxLatency = std::max(options_.warningMs, options_.criticalMs);
    if (auto peak = core::peakLatency(series)) {
        maxLatency = std::max(maxLatency, *peak);
    }
    maxLatency *= HEADROOM;
    if (maxLatency <= 0.0) {
        maxLatency = 1.0;
    }
    frame.maxLatency = maxLatency;

    auto toY = [&](double latency) { return top + graphHeight - (latency / maxLatency) * graphHeight; };
    auto toX = [&](std::chrono::system_clock::time_point t) {
        return left + graphWidth * window.ratioOf(t);
    };

    // Latency grid with labels from the maximum down to zero
    for (int i = 0; i <= GRID_INTERVALS; ++i) {
        const double y = top + (graphHeight / GRID_INTERVALS) * i;
        frame.gridLines.push_back({QLineF(left, y, right, y), palette::gridLine(), 1.0, {}});

        const double value = maxLatency - (maxLatency / GRID_INTERVALS) * i;
        frame.labels.push_back({QPointF(left - 8.0, y + 4.0),
                                QString("%1 ms").arg(value, 0, 'f', 0), palette::axisLabel(),
                                11, Qt::AlignRight});
    }

    // Time labels span the selected period, not the data
    const auto granularity = core::labelGranularity(hours);
    const int labelCount = core::xAxisLabelCount(hours);
    for (int i = 0; i < labelCount; ++i) {
        const double ratio = static_cast<double>(i) / (labelCount - 1);
        const auto text = core::formatTimeLabel(window.timeAt(ratio), granularity,
                                                options_.timeZone);
        frame.labels.push_back({QPointF(left + graphWidth * ratio, height - 10.0),
                                QString::fromStdString(text), palette::axisLabel(), 11,
                                Qt::AlignHCenter});
    }

    const QVector<qreal> dash{6.0, 4.0};
    const double warningY = toY(options_.warningMs);
    frame.thresholdLines.push_back(
        {QLineF(left, warningY, right, warningY), palette::warning(THRESHOLD_ALPHA), 1.0, dash});
    frame.labels.push_back({QPointF(left + 4.0, warningY - 4.0), "Warning",
                            palette::warning(THRESHOLD_LABEL_ALPHA), 10, Qt::AlignLeft});

    const double criticalY = toY(options_.criticalMs);
    if (criticalY > top) {
        frame.thresholdLines.push_back({QLineF(left, criticalY, right, criticalY),
                                        palette::critical(THRESHOLD_ALPHA), 1.0, dash});
        frame.labels.push_back({QPointF(left + 4.0, criticalY - 4.0), "Critical",
                                palette::critical(THRESHOLD_LABEL_ALPHA), 10, Qt::AlignLeft});
    }

    frame.axes.push_back({QLineF(left, top, left, bottom), palette::axisLine(), 1.0, {}});
    frame.axes.push_back({QLineF(left, bottom, right, bottom), palette::axisLine(), 1.0, {}});

    if (series.empty()) {
        frame.placeholder = GraphText{QPointF(width / 2.0, height / 2.0),
                                      "No data for this period", palette::placeholderText(),
                                      14, Qt::AlignHCenter};
        return frame;
    }

    core::ThresholdConfig thresholds;
    thresholds.latencyWarningMs = options_.warningMs;
    thresholds.latencyCriticalMs = options_.criticalMs;

    const double slot =
        std::clamp(graphWidth / static_cast<double>(series.size()), MIN_SLOT, MAX_SLOT);
    auto visible = [&](double x) { return x >= left && x <= right; };

    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto& sample = series[i];
        const double x = toX(sample.timestamp);
        if (!visible(x)) {
            continue;
        }

        if (!sample.isReachable) {
            frame.bars.push_back({QRectF(x - slot / 2.0, top, slot, graphHeight),
                                  BarKind::Outage, palette::outage(), i});
            continue;
        }
        if (!sample.hasLatencyBand()) {
            continue;
        }

        const double yTop = toY(*sample.maxLatency());
        const double yBottom = toY(*sample.minLatency());
        const auto level = core::latencyLevel(sample.avgLatency(), thresholds);
        frame.bars.push_back(
            {QRectF(x - slot / 2.0, yTop, slot, std::max(yBottom - yTop, MIN_BAND_HEIGHT)),
             bandKind(level), palette::forStatus(level, BAND_ALPHA), i});
    }

    using Accessor = std::function<std::optional<double>(const core::PingSample&)>;
    auto tracePaths = [&](const Accessor& value, const QColor& color, qreal lineWidth) {
        std::vector<GraphPath> runs;
        GraphPath run{{}, color, lineWidth};
        for (const auto& sample : series) {
            const double x = toX(sample.timestamp);
            auto v = value(sample);
            if (!visible(x) || !v) {
                if (!run.points.isEmpty()) {
                    runs.push_back(run);
                    run.points.clear();
                }
                continue;
            }
            run.points << QPointF(x, toY(*v));
        }
        if (!run.points.isEmpty()) {
            runs.push_back(run);
        }
        return runs;
    };

    frame.averageLine = tracePaths([](const core::PingSample& s) { return s.avgLatency(); },
                                   palette::averageLine(), AVERAGE_WIDTH);
    frame.minLine = tracePaths([](const core::PingSample& s) { return s.minLatency(); },
                               palette::boundLine(), BOUND_WIDTH);
    frame.maxLine = tracePaths([](const core::PingSample& s) { return s.maxLatency(); },
                               palette::boundLine(), BOUND_WIDTH);

    for (std::size_t i = 0; i < series.size(); ++i) {
        const auto& sample = series[i];
        const double x = toX(sample.timestamp);
        auto avg = sample.avgLatency();
        if (!visible(x) || !avg || sample.packetLossPercent <= 0.0) {
            continue;
        }
        const qreal opacity = std::min(0.4 + sample.packetLossPercent / 100.0, 1.0);
        const qreal radius = 4.0 + sample.packetLossPercent / 20.0;
        frame.lossDots.push_back(
            {QPointF(x, toY(*avg)), radius, opacity, palette::packetLoss(opacity), i});
    }

    return frame;
}

void DetailedGraphRenderer::render(QPainter& painter, const core::PingSeries& series,
                                   const QSizeF& size) const {
    GraphPainter::paint(painter, layout(series, size));
}

void renderDetailed(QImage& surface, const core::PingSeries& series,
                    const DetailedGraphOptions& options) {
    if (surface.isNull()) {
        return;
    }
    surface.fill(Qt::transparent);
    QPainter painter(&surface);
    DetailedGraphRenderer(options).render(painter, series, QSizeF(surface.size()));
}

} // namespace pingscope::ui
