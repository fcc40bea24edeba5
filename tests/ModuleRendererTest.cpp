#include <gtest/gtest.h>

#include "FinderZones.h"
#include "ModuleRenderer.h"
#include "RecordingSurface.h"

namespace qrpaint {
namespace {

using test::DrawCommand;
using test::RecordingSurface;

ModuleGrid solidGrid(int n)
{
    return ModuleGrid(cv::Mat(n, n, CV_8UC1, cv::Scalar(1)));
}

TEST(ModuleRenderer, SkipsFinderZonesOnASolidGrid)
{
    RecordingSurface surface;
    const int drawn = ModuleRenderer::paint(surface, solidGrid(21), 10.0, Qt::black);

    EXPECT_EQ(drawn, 21 * 21 - 3 * 49);
    EXPECT_EQ(surface.commands.size(), static_cast<std::size_t>(drawn));
    for (const DrawCommand &cmd : surface.commands) {
        ASSERT_EQ(cmd.type, DrawCommand::Type::Circle);
        const int x = static_cast<int>(cmd.center.x() / 10.0);
        const int y = static_cast<int>(cmd.center.y() / 10.0);
        EXPECT_FALSE(isFinderModule(x, y, 21)) << "x=" << x << " y=" << y;
    }
}

TEST(ModuleRenderer, DotsSitOnTheModuleTopLeftCorner)
{
    cv::Mat modules = cv::Mat::zeros(21, 21, CV_8UC1);
    modules.at<uchar>(9, 12) = 1; // row 9, column 12
    RecordingSurface surface;

    const int drawn = ModuleRenderer::paint(surface, ModuleGrid(modules), 8.0, QColor(Qt::red));

    ASSERT_EQ(drawn, 1);
    const DrawCommand &cmd = surface.commands.front();
    EXPECT_DOUBLE_EQ(cmd.center.x(), 12 * 8.0);
    EXPECT_DOUBLE_EQ(cmd.center.y(), 9 * 8.0);
    EXPECT_DOUBLE_EQ(cmd.radius, 8.0 / 3.0);
    EXPECT_EQ(cmd.color, QColor(Qt::red));
}

TEST(ModuleRenderer, LightModulesDrawNothing)
{
    RecordingSurface surface;
    EXPECT_EQ(ModuleRenderer::paint(surface, ModuleGrid(cv::Mat::zeros(25, 25, CV_8UC1)), 4.0, Qt::black), 0);
    EXPECT_TRUE(surface.commands.empty());
}

TEST(ModuleRenderer, VisitsEveryCellOnce)
{
    cv::Mat modules = cv::Mat::zeros(29, 29, CV_8UC1);
    for (int row = 0; row < 29; ++row) {
        for (int col = 0; col < 29; ++col) {
            modules.at<uchar>(row, col) = ((row * 31 + col * 17) % 3 == 0) ? 1 : 0;
        }
    }
    int expected = 0;
    for (int row = 0; row < 29; ++row) {
        for (int col = 0; col < 29; ++col) {
            if (modules.at<uchar>(row, col) && !isFinderModule(col, row, 29)) {
                ++expected;
            }
        }
    }

    RecordingSurface surface;
    EXPECT_EQ(ModuleRenderer::paint(surface, ModuleGrid(modules), 1.0, Qt::black), expected);
}

} // namespace
} // namespace qrpaint
