#include "FinderZones.h"

namespace qrpaint {

bool isTopLeftFinder(int x, int y)
{
    return x < kFinderSize && y < kFinderSize;
}

bool isTopRightFinder(int x, int y, int moduleCount)
{
    return x > moduleCount - kFinderSize - 1 && y < kFinderSize;
}

bool isBottomLeftFinder(int x, int y, int moduleCount)
{
    return x < kFinderSize && y > moduleCount - kFinderSize - 1;
}

bool isFinderModule(int x, int y, int moduleCount)
{
    return isTopLeftFinder(x, y) || isTopRightFinder(x, y, moduleCount) ||
           isBottomLeftFinder(x, y, moduleCount);
}

std::optional<FinderCorner> finderCornerAt(int x, int y, int moduleCount)
{
    if (isTopLeftFinder(x, y)) {
        return FinderCorner::TopLeft;
    }
    if (isTopRightFinder(x, y, moduleCount)) {
        return FinderCorner::TopRight;
    }
    if (isBottomLeftFinder(x, y, moduleCount)) {
        return FinderCorner::BottomLeft;
    }
    return std::nullopt;
}

QPoint finderOrigin(FinderCorner corner, int moduleCount)
{
    const int far = moduleCount - kFinderSize;
    switch (corner) {
    case FinderCorner::TopRight:
        return {far, 0};
    case FinderCorner::BottomLeft:
        return {0, far};
    case FinderCorner::TopLeft:
    default:
        return {0, 0};
    }
}

} // namespace qrpaint
