#include "pathdata.h"

#include <gtest/gtest.h>

using namespace svgdraw;

TEST(PathData, AbsoluteLines)
{
	bool ok;
	QPainterPath p = parsePathData("M 10 10 L 20 10 H 30 V 40 Z", &ok);
	EXPECT_TRUE(ok);
	ASSERT_EQ(p.elementCount(), 5);
	EXPECT_EQ(QPointF(p.elementAt(0)), QPointF(10, 10));
	EXPECT_EQ(QPointF(p.elementAt(1)), QPointF(20, 10));
	EXPECT_EQ(QPointF(p.elementAt(2)), QPointF(30, 10));
	EXPECT_EQ(QPointF(p.elementAt(3)), QPointF(30, 40));
	EXPECT_EQ(QPointF(p.elementAt(4)), QPointF(10, 10));
}

TEST(PathData, RelativeAndImplicitLineto)
{
	QPainterPath p = parsePathData("m10,10 5,0 0,5 l-5,0");
	ASSERT_EQ(p.elementCount(), 4);
	EXPECT_TRUE(p.elementAt(0).isMoveTo());
	EXPECT_TRUE(p.elementAt(1).isLineTo());
	EXPECT_EQ(QPointF(p.elementAt(1)), QPointF(15, 10));
	EXPECT_EQ(QPointF(p.elementAt(2)), QPointF(15, 15));
	EXPECT_EQ(QPointF(p.elementAt(3)), QPointF(10, 15));
}

TEST(PathData, CloseResetsCurrentPoint)
{
	QPainterPath p = parsePathData("M5,5 L10,5 z l1,1");
	EXPECT_EQ(p.currentPosition(), QPointF(6, 6));
}

TEST(PathData, CurvesEndWhereExpected)
{
	EXPECT_EQ(parsePathData("M0,0 C0,10 10,10 10,0").currentPosition(), QPointF(10, 0));
	EXPECT_EQ(parsePathData("M0,0 C0,10 10,10 10,0 s10,-10 20,0").currentPosition(), QPointF(30, 0));
	EXPECT_EQ(parsePathData("M0,0 Q5,10 10,0 T20,0").currentPosition(), QPointF(20, 0));
}

TEST(PathData, SmoothCurveReflectsControlPoint)
{
	QPainterPath p = parsePathData("M0,0 C0,10 10,10 10,0 S20,-10 20,0");
	// moveTo + 3 elements per cubic
	ASSERT_EQ(p.elementCount(), 7);
	EXPECT_EQ(QPointF(p.elementAt(4)), QPointF(10, -10));
}

TEST(PathData, ArcEndsAtTarget)
{
	QPainterPath p = parsePathData("M0,0 A10,10 0 0 1 20,0");
	QPointF end = p.currentPosition();
	EXPECT_NEAR(end.x(), 20, 1e-6);
	EXPECT_NEAR(end.y(), 0, 1e-6);
	EXPECT_GT(p.elementCount(), 2);
}

TEST(PathData, ArcWithZeroRadiusIsLine)
{
	QPainterPath p = parsePathData("M0,0 A0,5 0 0 1 20,0");
	ASSERT_EQ(p.elementCount(), 2);
	EXPECT_TRUE(p.elementAt(1).isLineTo());
}

TEST(PathData, UnknownCommandKeepsParsedPart)
{
	bool ok;
	QPainterPath p = parsePathData("M0,0 L10,0 X 5 5 L20,20", &ok);
	EXPECT_FALSE(ok);
	EXPECT_EQ(p.elementCount(), 2);
	EXPECT_EQ(p.currentPosition(), QPointF(10, 0));
}

TEST(PathData, Points)
{
	QPolygonF pts = parsePoints("0,0 10,0, 10 10 0,10 5");
	ASSERT_EQ(pts.count(), 4);
	EXPECT_EQ(pts[2], QPointF(10, 10));
	EXPECT_EQ(pts[3], QPointF(0, 10));
	EXPECT_TRUE(parsePoints("").isEmpty());
}
