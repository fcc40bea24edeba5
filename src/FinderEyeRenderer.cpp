#include "FinderEyeRenderer.h"

namespace qrpaint {

FinderEyeGeometry FinderEyeRenderer::computeEye(FinderCorner corner, double moduleSize, int moduleCount)
{
    const QPoint origin = finderOrigin(corner, moduleCount);
    const double ringSide = kRingModules * moduleSize;
    const double dotSide = kDotModules * moduleSize;
    const double inset = kDotInset * moduleSize;

    FinderEyeGeometry eye;
    eye.corner = corner;
    eye.outer = QRectF(origin.x() * moduleSize, origin.y() * moduleSize, ringSide, ringSide);
    eye.inner = QRectF(eye.outer.left() + inset, eye.outer.top() + inset, dotSide, dotSide);
    return eye;
}

FinderEyes FinderEyeRenderer::computeEyes(double moduleSize, int moduleCount)
{
    FinderEyes eyes;
    for (std::size_t i = 0; i < kFinderCorners.size(); ++i) {
        eyes[i] = computeEye(kFinderCorners[i], moduleSize, moduleCount);
    }
    return eyes;
}

void FinderEyeRenderer::paint(RenderSurface &surface,
                              const FinderEyes &eyes,
                              double moduleSize,
                              const QColor &color)
{
    for (const FinderEyeGeometry &eye : eyes) {
        surface.drawRing(eye.outer, moduleSize, color);
        surface.drawFilledCircle(eye.inner.center(), eye.inner.width() / 2.0, color);
    }
}

} // namespace qrpaint
