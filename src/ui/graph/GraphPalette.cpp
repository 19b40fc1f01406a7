#include "ui/graph/GraphPalette.hpp"

namespace pingscope::ui::palette {

namespace {

QColor withAlpha(int r, int g, int b, qreal alpha) {
    QColor color(r, g, b);
    color.setAlphaF(static_cast<float>(alpha));
    return color;
}

} // namespace

QColor ok(qreal alpha) {
    return withAlpha(76, 175, 80, alpha);
}

QColor warning(qreal alpha) {
    return withAlpha(255, 193, 7, alpha);
}

QColor critical(qreal alpha) {
    return withAlpha(244, 67, 54, alpha);
}

QColor packetLoss(qreal alpha) {
    return withAlpha(255, 152, 0, alpha);
}

QColor outage() {
    return critical(0.7);
}

QColor averageLine() {
    return QColor(33, 150, 243);
}

QColor boundLine() {
    return withAlpha(33, 150, 243, 0.4);
}

QColor gridLine() {
    return withAlpha(255, 255, 255, 0.1);
}

QColor axisLine() {
    return QColor(0x44, 0x44, 0x44);
}

QColor axisLabel() {
    return QColor(0x88, 0x88, 0x88);
}

QColor placeholderText() {
    return QColor(0x66, 0x66, 0x66);
}

QColor forStatus(core::TargetStatus status, qreal alpha) {
    switch (status) {
    case core::TargetStatus::Ok:
        return ok(alpha);
    case core::TargetStatus::Warning:
        return warning(alpha);
    case core::TargetStatus::Critical:
        return critical(alpha);
    }
    return ok(alpha);
}

QColor forUptime(core::UptimeLevel level) {
    switch (level) {
    case core::UptimeLevel::Good:
        return ok();
    case core::UptimeLevel::Degraded:
        return warning();
    case core::UptimeLevel::Poor:
        return critical();
    }
    return ok();
}

} // namespace pingscope::ui::palette
