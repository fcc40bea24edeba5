#pragma once

#include <QColor>

#include "ModuleGrid.h"
#include "RenderSurface.h"

namespace qrpaint {

class ModuleRenderer {
public:
    // Draws a dot for every dark module outside the finder zones and returns how
    // many were drawn. Dots are centred on the module's top-left corner.
    static int paint(RenderSurface &surface,
                     const ModuleGrid &grid,
                     double moduleSize,
                     const QColor &color);

    [[nodiscard]] static double dotRadius(double moduleSize) { return moduleSize / 3.0; }
};

} // namespace qrpaint
