#pragma once

#include <array>
#include <optional>

#include <QPoint>

namespace qrpaint {

// Finder patterns are 7x7 modules and sit in three of the four corners.
constexpr int kFinderSize = 7;

enum class FinderCorner {
    TopLeft,
    TopRight,
    BottomLeft
};

constexpr std::array<FinderCorner, 3> kFinderCorners {FinderCorner::TopLeft,
                                                      FinderCorner::TopRight,
                                                      FinderCorner::BottomLeft};

[[nodiscard]] bool isTopLeftFinder(int x, int y);
[[nodiscard]] bool isTopRightFinder(int x, int y, int moduleCount);
[[nodiscard]] bool isBottomLeftFinder(int x, int y, int moduleCount);

// True when (x, y) falls in any finder zone. Zones overlap for moduleCount < 15.
[[nodiscard]] bool isFinderModule(int x, int y, int moduleCount);

[[nodiscard]] std::optional<FinderCorner> finderCornerAt(int x, int y, int moduleCount);

// Top-left module of the zone.
[[nodiscard]] QPoint finderOrigin(FinderCorner corner, int moduleCount);

} // namespace qrpaint
