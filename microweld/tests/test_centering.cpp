#include "microweld/centering.h"
#include "microweld/extent_collector.h"

#include <gtest/gtest.h>

using namespace microweld::core;

namespace {

BoundingBox makeBox(double minX, double minY, double maxX, double maxY) {
    BoundingBox box;
    box.minX = minX;
    box.minY = minY;
    box.maxX = maxX;
    box.maxY = maxY;
    box.hasBounds = true;
    return box;
}

} // namespace

TEST(ExtentCollectorTest, EmptyStreamHasNoBounds) {
    ExtentCollector collector;
    BoundingBox box = collector.finalize();

    EXPECT_FALSE(box.hasBounds);
    EXPECT_EQ(box.minX, 0.0);
    EXPECT_EQ(box.maxY, 0.0);
    EXPECT_EQ(collector.pointCount(), 0u);
}

TEST(ExtentCollectorTest, FoldsPointsAndIgnoresOtherEvents) {
    ExtentCollector collector;
    collector.handle(PathStart{"a"});
    collector.handle(PointAdded{3, -2});
    collector.handle(PointAdded{-1, 7});
    collector.handle(PointAdded{10, 4});
    collector.handle(PathComplete{"a"});

    BoundingBox box = collector.finalize();
    ASSERT_TRUE(box.hasBounds);
    EXPECT_DOUBLE_EQ(box.minX, -1.0);
    EXPECT_DOUBLE_EQ(box.minY, -2.0);
    EXPECT_DOUBLE_EQ(box.maxX, 10.0);
    EXPECT_DOUBLE_EQ(box.maxY, 7.0);
    EXPECT_EQ(collector.pointCount(), 3u);

    // finalize() does not consume anything
    BoundingBox again = collector.finalize();
    EXPECT_DOUBLE_EQ(again.maxX, box.maxX);

    collector.reset();
    EXPECT_FALSE(collector.finalize().hasBounds);
}

TEST(ExtentCollectorTest, SubscribesToPointsOnly) {
    ExtentCollector collector;
    EXPECT_TRUE(maskContains(collector.subscribedEvents(), EventKind::POINT_ADDED));
    EXPECT_FALSE(maskContains(collector.subscribedEvents(), EventKind::PATH_START));
    EXPECT_FALSE(maskContains(collector.subscribedEvents(), EventKind::PATH_COMPLETE));
}

TEST(CenteringTest, NoBoundsGivesZeroOffset) {
    CenteringOffset offset = Centering::calculateOffset(BoundingBox(), 250.0, 220.0);
    EXPECT_EQ(offset.dx, 0.0);
    EXPECT_EQ(offset.dy, 0.0);
}

TEST(CenteringTest, OffsetMovesPatternCenterToSurfaceCenter) {
    const BoundingBox boxes[] = {
        makeBox(0, 0, 10, 10),
        makeBox(-40, 12.5, -3, 80),
        makeBox(100, 100, 100.001, 230),
        makeBox(5, 5, 5, 5),
    };

    for (const auto& box : boxes) {
        CenteringOffset offset = Centering::calculateOffset(box, 250.0, 220.0);
        BoundingBox centered = Centering::applyOffset(box, offset);

        EXPECT_NEAR(centered.center().x, 125.0, 1e-6);
        EXPECT_NEAR(centered.center().y, 110.0, 1e-6);
        EXPECT_NEAR(centered.width(), box.width(), 1e-9);
        EXPECT_NEAR(centered.height(), box.height(), 1e-9);
    }
}

TEST(CenteringTest, EndToEndPatternOffset) {
    // Points (0,0), (10,0), (10,10) on a 250 x 220 surface
    CenteringOffset offset = Centering::calculateOffset(makeBox(0, 0, 10, 10), 250.0, 220.0);
    EXPECT_DOUBLE_EQ(offset.dx, 120.0);
    EXPECT_DOUBLE_EQ(offset.dy, 105.0);
}

TEST(CenteringTest, OversizedPatternStillGetsOffset) {
    BoundingBox box = makeBox(0, 0, 400, 100);
    CenteringOffset offset = Centering::calculateOffset(box, 250.0, 220.0);

    EXPECT_DOUBLE_EQ(offset.dx, -75.0);
    EXPECT_FALSE(Centering::fitsSurface(Centering::applyOffset(box, offset), 250.0, 220.0));
}

TEST(CenteringTest, GetBoundsOfPaths) {
    std::vector<Path> paths;
    paths.emplace_back("a", OperationClass::NORMAL,
                       std::vector<Point2D>{Point2D(1, 2), Point2D(3, 4)});
    paths.emplace_back("empty", OperationClass::NORMAL);
    paths.emplace_back("b", OperationClass::STOP,
                       std::vector<Point2D>{Point2D(-5, 8)});

    BoundingBox box = Centering::getBounds(paths);
    ASSERT_TRUE(box.hasBounds);
    EXPECT_DOUBLE_EQ(box.minX, -5.0);
    EXPECT_DOUBLE_EQ(box.minY, 2.0);
    EXPECT_DOUBLE_EQ(box.maxX, 3.0);
    EXPECT_DOUBLE_EQ(box.maxY, 8.0);

    EXPECT_FALSE(Centering::getBounds({}).hasBounds);
}

TEST(CenteringTest, FormatCenteringInfo) {
    BoundingBox box = makeBox(0, 0, 10, 10);
    std::string info = Centering::formatCenteringInfo(box, CenteringOffset(120, 105), 250, 220);

    EXPECT_NE(info.find("Pattern size: 10.000 x 10.000 mm"), std::string::npos);
    EXPECT_NE(info.find("Centering offset: (+120.000, +105.000)"), std::string::npos);
    EXPECT_EQ(info.find("exceeds"), std::string::npos);

    EXPECT_EQ(Centering::formatCenteringInfo(BoundingBox(), CenteringOffset(), 250, 220),
              "No points, nothing to center");
}
