#pragma once

#include <QColor>
#include <QPointF>
#include <QRectF>

namespace qrpaint {

// Minimal drawing capability the renderers need. Platforms implement it over
// their own canvas; PainterSurface covers every QPaintDevice.
class RenderSurface {
public:
    virtual ~RenderSurface() = default;

    virtual void fillBackground(const QColor &color) = 0;
    virtual void drawFilledCircle(const QPointF &center, qreal radius, const QColor &color) = 0;
    // Circle inscribed in bounds, stroked with the pen centred on the outline.
    virtual void drawRing(const QRectF &bounds, qreal strokeWidth, const QColor &color) = 0;
};

} // namespace qrpaint
