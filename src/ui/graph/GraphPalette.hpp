#pragma once

#include "core/types/PingTarget.hpp"

#include <QColor>

namespace pingscope::ui::palette {

QColor ok(qreal alpha = 1.0);
QColor warning(qreal alpha = 1.0);
QColor critical(qreal alpha = 1.0);
QColor packetLoss(qreal alpha = 1.0);
/// Bar colour for unreachable samples
QColor outage();
QColor averageLine();
QColor boundLine();
QColor gridLine();
QColor axisLine();
QColor axisLabel();
QColor placeholderText();

/**
 * @brief Colour for a status, with the given opacity.
 */
QColor forStatus(core::TargetStatus status, qreal alpha = 1.0);

/**
 * @brief Colour for an uptime grade.
 */
QColor forUptime(core::UptimeLevel level);

} // namespace pingscope::ui::palette
