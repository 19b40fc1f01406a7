/**
 * @file CompactGraphRenderer.hpp
 * @brief Axis-less SmokePing-style graph for target cards.
 */

#pragma once

#include "core/types/PingSample.hpp"
#include "core/types/ThresholdConfig.hpp"
#include "ui/graph/GraphFrame.hpp"

class QImage;
class QPainter;

namespace pingscope::ui {

/**
 * @brief Options for the compact graph.
 */
struct CompactGraphOptions {
    int heightPx{150};         ///< Height of the card graph surface
    bool showJitter{true};     ///< Draw min-max latency bands
    double warningMs{100.0};   ///< Warning latency threshold
    double criticalMs{500.0};  ///< Critical latency threshold

    /**
     * @brief Builds options from a widget's threshold configuration.
     */
    static CompactGraphOptions fromConfig(const core::ThresholdConfig& config);

    bool operator==(const CompactGraphOptions& other) const = default;
};

/**
 * @brief Lays out and paints the compact card graph.
 *
 * Samples occupy equal-width slots regardless of their timestamps. Each
 * unreachable sample fills its slot with a critical bar; reachable samples
 * draw a min-max band coloured by average latency, an average line that
 * breaks at every gap and a loss dot whose opacity grows with loss.
 */
class CompactGraphRenderer {
public:
    /// Vertical inset applied to the latency mapping.
    static constexpr double PADDING = 2.0;

    explicit CompactGraphRenderer(CompactGraphOptions options = {});

    [[nodiscard]] const CompactGraphOptions& options() const { return options_; }

    /**
     * @brief Computes the draw plan for a series on a surface of the given size.
     */
    [[nodiscard]] GraphFrame layout(const core::PingSeries& series, const QSizeF& size) const;

    /**
     * @brief Lays out and paints a series with an active painter.
     */
    void render(QPainter& painter, const core::PingSeries& series, const QSizeF& size) const;

private:
    CompactGraphOptions options_;
};

/**
 * @brief Fully repaints @p surface with the compact graph of @p series.
 */
void renderCompact(QImage& surface, const core::PingSeries& series,
                   const CompactGraphOptions& options);

} // namespace pingscope::ui
