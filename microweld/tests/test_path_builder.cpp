#include "microweld/path_builder.h"

#include <gtest/gtest.h>

using namespace microweld::core;

namespace {

Vectorizer makeVectorizer(double spacing) {
    VectorizerConfig config;
    config.dotSpacing = spacing;
    return Vectorizer(config);
}

void expectNoConsecutiveDuplicates(const Path& path) {
    const auto& points = path.getPoints();
    for (size_t i = 1; i < points.size(); i++) {
        EXPECT_NE(points[i - 1].position, points[i].position) << "at index " << i;
    }
}

} // namespace

TEST(PathBuilderTest, SquareHasNoDuplicateCorners) {
    Vectorizer vectorizer = makeVectorizer(2.0);
    PathBuilder builder(vectorizer, "square");
    builder.moveTo(Point2D(0, 0))
           .lineTo(Point2D(10, 0))
           .lineTo(Point2D(10, 10))
           .lineTo(Point2D(0, 10))
           .close();

    Path path = builder.build();
    EXPECT_EQ(path.getId(), "square");
    // 5 dots per side plus the closing point
    EXPECT_EQ(path.size(), 21u);
    EXPECT_EQ(path.getPoints().front().position, Point2D(0, 0));
    EXPECT_EQ(path.getPoints().back().position, Point2D(0, 0));
    expectNoConsecutiveDuplicates(path);
}

TEST(PathBuilderTest, ShortSegmentAppendsEndPoint) {
    Vectorizer vectorizer = makeVectorizer(5.0);
    PathBuilder builder(vectorizer, "short");
    builder.moveTo(Point2D(0, 0)).lineTo(Point2D(1, 0));

    Path path = builder.build();
    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path.getPoint(1).position, Point2D(1, 0));
}

TEST(PathBuilderTest, SmoothCubicReflectsPreviousControl) {
    Vectorizer vectorizer = makeVectorizer(0.5);

    PathBuilder smooth(vectorizer, "smooth");
    smooth.moveTo(Point2D(0, 0))
          .cubicTo(Point2D(0, 5), Point2D(5, 5), Point2D(5, 0))
          .smoothCubicTo(Point2D(10, -5), Point2D(10, 0));

    PathBuilder explicitCurve(vectorizer, "explicit");
    explicitCurve.moveTo(Point2D(0, 0))
                 .cubicTo(Point2D(0, 5), Point2D(5, 5), Point2D(5, 0))
                 .cubicTo(Point2D(5, -5), Point2D(10, -5), Point2D(10, 0));

    Path a = smooth.build();
    Path b = explicitCurve.build();
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a.getPoint(i).position, b.getPoint(i).position);
    }
}

TEST(PathBuilderTest, SmoothQuadWithoutPreviousCurveUsesCurrentPoint) {
    Vectorizer vectorizer = makeVectorizer(1.0);

    PathBuilder builder(vectorizer, "t");
    builder.moveTo(Point2D(0, 0)).lineTo(Point2D(4, 0)).smoothQuadTo(Point2D(8, 0));

    Path path = builder.build();
    EXPECT_GT(path.size(), 4u);

    // Control point coincides with (4, 0), so the curve stays on the x axis
    for (const auto& p : path.getPoints()) {
        EXPECT_NEAR(p.position.y, 0.0, 1e-12);
    }
}

TEST(PathBuilderTest, NonPositiveArcRadiusFallsBackToCenter) {
    Vectorizer vectorizer;
    PathBuilder builder(vectorizer, "bad-arc");
    builder.arc(Point2D(3, 4), 0.0, 0.0, 90.0);

    Path path = builder.build();
    ASSERT_EQ(path.size(), 1u);
    EXPECT_EQ(path.getPoint(0).position, Point2D(3, 4));
}

TEST(PathBuilderTest, ArcAfterMoveIsJoinedToCurrentPoint) {
    Vectorizer vectorizer = makeVectorizer(1.0);
    PathBuilder builder(vectorizer, "joined");
    builder.moveTo(Point2D(0, 0)).arc(Point2D(10, 0), 5.0, 0.0, 180.0);

    Path path = builder.build();
    ASSERT_GT(path.size(), 2u);
    EXPECT_EQ(path.getPoints().front().position, Point2D(0, 0));
    EXPECT_EQ(path.getPoints().back().position, Point2D(5, 0));
    expectNoConsecutiveDuplicates(path);

    for (size_t i = 1; i < path.size(); i++) {
        double gap = path.getPoint(i - 1).position.distanceTo(path.getPoint(i).position);
        EXPECT_LE(gap, 1.0 + 1e-9) << "gap before point " << i;
    }
}

TEST(PathBuilderTest, CircleEndsWhereItStarts) {
    Vectorizer vectorizer = makeVectorizer(1.0);
    PathBuilder builder(vectorizer, "circle");
    builder.circle(Point2D(0, 0), 5.0);

    Path path = builder.build();
    ASSERT_GT(path.size(), 3u);
    EXPECT_EQ(path.getPoints().front().position, path.getPoints().back().position);
    expectNoConsecutiveDuplicates(path);
}

TEST(PathBuilderTest, PolylineWithBulgeJoinsWithoutDuplicates) {
    Vectorizer vectorizer = makeVectorizer(1.0);
    std::vector<PolylineVertex> vertices = {
        PolylineVertex(Point2D(0, 0)),
        PolylineVertex(Point2D(4, 0), 1.0),
        PolylineVertex(Point2D(4, 4)),
    };

    Path path = PathBuilder::polyline(vectorizer, "poly", OperationClass::FRANGIBLE, vertices, false);

    EXPECT_EQ(path.getOperationClass(), OperationClass::FRANGIBLE);
    EXPECT_EQ(path.getPoints().front().position, Point2D(0, 0));
    EXPECT_EQ(path.getPoints().back().position, Point2D(4, 4));
    expectNoConsecutiveDuplicates(path);

    // Positive bulge bows to the left of (4,0) -> (4,4), towards -x
    bool sawArcPoint = false;
    for (const auto& p : path.getPoints()) {
        if (p.position.y > 0.5 && p.position.y < 3.5) {
            EXPECT_LT(p.position.x, 4.0);
            sawArcPoint = true;
        }
    }
    EXPECT_TRUE(sawArcPoint);
}

TEST(PathBuilderTest, ClosedPolylineReturnsToStart) {
    Vectorizer vectorizer = makeVectorizer(1.0);
    std::vector<PolylineVertex> vertices = {
        PolylineVertex(Point2D(0, 0)),
        PolylineVertex(Point2D(3, 0)),
        PolylineVertex(Point2D(3, 3)),
    };

    Path path = PathBuilder::polyline(vectorizer, "tri", OperationClass::NORMAL, vertices, true);
    EXPECT_EQ(path.getPoints().back().position, Point2D(0, 0));
}

TEST(PathBuilderTest, EmptyPolylineYieldsEmptyPath) {
    Vectorizer vectorizer;
    Path path = PathBuilder::polyline(vectorizer, "none", OperationClass::NORMAL, {}, false);
    EXPECT_TRUE(path.empty());
}

TEST(PathBuilderTest, PauseMessageIsKept) {
    Vectorizer vectorizer;
    PathBuilder builder(vectorizer, "stop", OperationClass::STOP);
    builder.setPauseMessage("Check alignment").moveTo(Point2D(1, 1));

    Path path = builder.build();
    EXPECT_EQ(path.getOperationClass(), OperationClass::STOP);
    EXPECT_EQ(path.getPauseMessage(), "Check alignment");
}
