#pragma once

#include <array>

#include <QColor>
#include <QRectF>

#include "FinderZones.h"
#include "RenderSurface.h"

namespace qrpaint {

struct FinderEyeGeometry {
    FinderCorner corner {FinderCorner::TopLeft};
    QRectF outer; // ring, stroked one module wide
    QRectF inner; // solid dot
};

using FinderEyes = std::array<FinderEyeGeometry, 3>;

class FinderEyeRenderer {
public:
    // Ring diameter in modules: the ring is stroked on the outline, so with a
    // one-module pen it covers the full 7-module pattern.
    static constexpr int kRingModules = kFinderSize - 1;
    static constexpr double kDotModules = kRingModules / 2.0;
    static constexpr double kDotInset = (kRingModules - kDotModules) / 2.0;

    [[nodiscard]] static FinderEyeGeometry computeEye(FinderCorner corner, double moduleSize, int moduleCount);
    [[nodiscard]] static FinderEyes computeEyes(double moduleSize, int moduleCount);

    static void paint(RenderSurface &surface,
                      const FinderEyes &eyes,
                      double moduleSize,
                      const QColor &color);
};

} // namespace qrpaint
