#include "ModuleRenderer.h"

#include "FinderZones.h"

namespace qrpaint {

int ModuleRenderer::paint(RenderSurface &surface,
                          const ModuleGrid &grid,
                          double moduleSize,
                          const QColor &color)
{
    const int count = grid.size();
    const double radius = dotRadius(moduleSize);
    int drawn = 0;

    for (int x = 0; x < count; ++x) {
        for (int y = 0; y < count; ++y) {
            if (isFinderModule(x, y, count)) {
                continue; // replaced by the eyes
            }
            if (!grid.isDark(y, x)) {
                continue;
            }
            surface.drawFilledCircle(QPointF(x * moduleSize, y * moduleSize), radius, color);
            ++drawn;
        }
    }

    return drawn;
}

} // namespace qrpaint
