#pragma once

#include <QRectF>

#include "RenderSurface.h"

class QPainter;

namespace qrpaint {

class PainterSurface : public RenderSurface {
public:
    // area is the region fillBackground covers; the painter must outlive the surface.
    // Painter state is restored after every primitive.
    PainterSurface(QPainter &painter, const QRectF &area);

    void fillBackground(const QColor &color) override;
    void drawFilledCircle(const QPointF &center, qreal radius, const QColor &color) override;
    void drawRing(const QRectF &bounds, qreal strokeWidth, const QColor &color) override;

private:
    QPainter &m_painter;
    QRectF m_area;
};

} // namespace qrpaint
