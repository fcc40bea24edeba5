#include <gtest/gtest.h>

#include "FinderEyeRenderer.h"
#include "RecordingSurface.h"

namespace qrpaint {
namespace {

using test::DrawCommand;
using test::RecordingSurface;

TEST(FinderEyeRenderer, TopLeftEyeForVersionOneAtModuleSizeTen)
{
    const FinderEyeGeometry eye = FinderEyeRenderer::computeEye(FinderCorner::TopLeft, 10.0, 21);
    EXPECT_EQ(eye.outer, QRectF(0.0, 0.0, 60.0, 60.0));
    EXPECT_EQ(eye.inner, QRectF(15.0, 15.0, 30.0, 30.0));
}

TEST(FinderEyeRenderer, EyesAnchorAtTheirCorners)
{
    const double m = 4.5;
    const int n = 33;
    const FinderEyes eyes = FinderEyeRenderer::computeEyes(m, n);

    EXPECT_EQ(eyes[0].corner, FinderCorner::TopLeft);
    EXPECT_EQ(eyes[1].corner, FinderCorner::TopRight);
    EXPECT_EQ(eyes[2].corner, FinderCorner::BottomLeft);

    EXPECT_DOUBLE_EQ(eyes[1].outer.left(), (n - 7) * m);
    EXPECT_DOUBLE_EQ(eyes[1].outer.top(), 0.0);
    EXPECT_DOUBLE_EQ(eyes[2].outer.left(), 0.0);
    EXPECT_DOUBLE_EQ(eyes[2].outer.top(), (n - 7) * m);

    for (const FinderEyeGeometry &eye : eyes) {
        EXPECT_DOUBLE_EQ(eye.outer.width(), 6 * m);
        EXPECT_DOUBLE_EQ(eye.outer.height(), 6 * m);
        EXPECT_DOUBLE_EQ(eye.inner.width(), 3 * m);
        EXPECT_DOUBLE_EQ(eye.inner.left() - eye.outer.left(), 1.5 * m);
        EXPECT_DOUBLE_EQ(eye.inner.top() - eye.outer.top(), 1.5 * m);
        EXPECT_EQ(eye.inner.center(), eye.outer.center());
    }
}

TEST(FinderEyeRenderer, DrawsRingThenDotPerEye)
{
    RecordingSurface surface;
    const FinderEyes eyes = FinderEyeRenderer::computeEyes(10.0, 21);
    FinderEyeRenderer::paint(surface, eyes, 10.0, QColor(Qt::blue));

    ASSERT_EQ(surface.commands.size(), 6U);
    for (std::size_t i = 0; i < eyes.size(); ++i) {
        const DrawCommand &ring = surface.commands[2 * i];
        const DrawCommand &dot = surface.commands[2 * i + 1];

        EXPECT_EQ(ring.type, DrawCommand::Type::Ring);
        EXPECT_EQ(ring.bounds, eyes[i].outer);
        EXPECT_DOUBLE_EQ(ring.strokeWidth, 10.0);
        EXPECT_EQ(ring.color, QColor(Qt::blue));

        EXPECT_EQ(dot.type, DrawCommand::Type::Circle);
        EXPECT_EQ(dot.center, eyes[i].inner.center());
        EXPECT_DOUBLE_EQ(dot.radius, 15.0);
    }
}

} // namespace
} // namespace qrpaint
