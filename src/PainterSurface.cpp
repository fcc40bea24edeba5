#include "PainterSurface.h"

#include <QBrush>
#include <QPainter>
#include <QPen>

namespace qrpaint {

namespace {

class PainterStateGuard {
public:
    explicit PainterStateGuard(QPainter &painter) : p_(painter) { p_.save(); }
    ~PainterStateGuard() { p_.restore(); }
private:
    QPainter &p_;
};

} // namespace

PainterSurface::PainterSurface(QPainter &painter, const QRectF &area)
    : m_painter(painter)
    , m_area(area)
{
}

void PainterSurface::fillBackground(const QColor &color)
{
    m_painter.fillRect(m_area, color);
}

void PainterSurface::drawFilledCircle(const QPointF &center, qreal radius, const QColor &color)
{
    PainterStateGuard guard(m_painter);
    m_painter.setRenderHint(QPainter::Antialiasing, true);
    m_painter.setPen(Qt::NoPen);
    m_painter.setBrush(color);
    m_painter.drawEllipse(center, radius, radius);
}

void PainterSurface::drawRing(const QRectF &bounds, qreal strokeWidth, const QColor &color)
{
    PainterStateGuard guard(m_painter);
    m_painter.setRenderHint(QPainter::Antialiasing, true);
    QPen pen(color, strokeWidth, Qt::SolidLine, Qt::FlatCap, Qt::MiterJoin);
    m_painter.setPen(pen);
    m_painter.setBrush(Qt::NoBrush);
    m_painter.drawEllipse(bounds);
}

} // namespace qrpaint
