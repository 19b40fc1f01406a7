/**
 * @file DetailedGraphRenderer.hpp
 * @brief Time-scaled SmokePing-style graph for the target detail view.
 */

#pragma once

#include "core/graph/TimeWindow.hpp"
#include "core/types/PingSample.hpp"
#include "core/types/ThresholdConfig.hpp"
#include "core/types/TimePeriod.hpp"
#include "ui/graph/GraphFrame.hpp"

#include <chrono>

class QImage;
class QPainter;

namespace pingscope::ui {

/**
 * @brief Options for the detailed graph.
 */
struct DetailedGraphOptions {
    core::TimePeriod period{core::DEFAULT_DETAIL_PERIOD}; ///< Selected period
    double warningMs{100.0};                              ///< Warning latency threshold
    double criticalMs{500.0};                             ///< Critical latency threshold
    /// End of the placeholder window when the series is empty
    std::chrono::system_clock::time_point referenceTime{std::chrono::system_clock::now()};
    core::TimeZoneMode timeZone{core::TimeZoneMode::Local}; ///< Axis label time zone

    static DetailedGraphOptions fromConfig(const core::ThresholdConfig& config,
                                           core::TimePeriod period);
};

/**
 * @brief Lays out and paints the detailed graph.
 *
 * Samples are positioned by timestamp within the resolved time window.
 * Besides the compact graph's bands, outage bars and loss dots, the detailed
 * graph draws a labelled latency grid, time labels, labelled threshold lines
 * and faint minimum and maximum latency lines. When the series is empty all
 * chrome is kept and a centred message replaces the samples.
 */
class DetailedGraphRenderer {
public:
    static constexpr double MARGIN_LEFT = 60.0;
    static constexpr double MARGIN_RIGHT = 20.0;
    static constexpr double MARGIN_TOP = 20.0;
    static constexpr double MARGIN_BOTTOM = 40.0;
    /// Number of intervals in the latency grid
    static constexpr int GRID_INTERVALS = 5;
    /// Headroom above the highest plotted value
    static constexpr double HEADROOM = 1.1;

    explicit DetailedGraphRenderer(DetailedGraphOptions options = {});

    [[nodiscard]] const DetailedGraphOptions& options() const { return options_; }

    /**
     * @brief Computes the draw plan for a series on a surface of the given size.
     *
     * The returned frame carries the resolved window and plot area so that
     * hover lookups use exactly the geometry that was drawn.
     */
    [[nodiscard]] GraphFrame layout(const core::PingSeries& series, const QSizeF& size) const;

    void render(QPainter& painter, const core::PingSeries& series, const QSizeF& size) const;

private:
    DetailedGraphOptions options_;
};

/**
 * @brief Fully repaints @p surface with the detailed graph of @p series.
 */
void renderDetailed(QImage& surface, const core::PingSeries& series,
                    const DetailedGraphOptions& options);

} // namespace pingscope::ui
