#include "brush.h"
#include "drawing.h"
#include "errors.h"

#include <QBrush>
#include <QLinearGradient>
#include <QPen>

#include <gtest/gtest.h>

using namespace svgdraw;

TEST(Brush, NoneIsTransparentSolid)
{
	Brush b = parseBrush("none");
	EXPECT_TRUE(b.isSolid());
	EXPECT_TRUE(b.isTransparent());
	EXPECT_EQ(b.color().alpha(), 0);
}

TEST(Brush, HexAndNamedRedAreEqual)
{
	Brush hex = parseBrush("#FF0000");
	Brush named = parseBrush("red");
	EXPECT_TRUE(hex.isSolid());
	EXPECT_EQ(hex, named);
	EXPECT_EQ(hex.color().rgba(), qRgba(255, 0, 0, 255));
}

TEST(Brush, ShortHexAndRgbFunction)
{
	EXPECT_EQ(parseColor("#0f0").rgba(), qRgba(0, 255, 0, 255));
	EXPECT_EQ(parseColor("rgb(1, 2, 3)").rgba(), qRgba(1, 2, 3, 255));
	// malformed components become zero
	EXPECT_EQ(parseColor("rgb(10, x, 300)").rgba(), qRgba(10, 0, 0, 255));
}

TEST(Brush, UnknownColourThrows)
{
	EXPECT_THROW(parseColor("notacolour"), FormatError);
	EXPECT_THROW(parseBrush("#12"), FormatError);
}

TEST(Brush, ApplyOpacityToColor)
{
	QColor c(10, 20, 30, 200);
	EXPECT_EQ(applyOpacityToColor(c, 1.0), c);
	EXPECT_EQ(applyOpacityToColor(c, 2.0), c);
	EXPECT_EQ(applyOpacityToColor(c, 0.5).alpha(), 100);
	EXPECT_EQ(applyOpacityToColor(c, -1).alpha(), 0);
	EXPECT_EQ(applyOpacityToColor(c, 0.5).red(), 10);
}

TEST(Brush, ApplyOpacityToGradientScalesEveryStop)
{
	Brush g = Brush::linearGradient();
	g.addStop(0, QColor(255, 0, 0));
	g.addStop(1, QColor(0, 0, 255, 100));
	Brush half = applyOpacityToBrush(g, 0.5);
	ASSERT_EQ(half.stops().count(), 2);
	EXPECT_EQ(half.stops()[0].second.alpha(), 128);
	EXPECT_EQ(half.stops()[1].second.alpha(), 50);
	// the source brush is a value, it keeps its stops
	EXPECT_EQ(g.stops()[0].second.alpha(), 255);
}

TEST(Brush, StopOffsetIsClamped)
{
	Brush g = Brush::radialGradient();
	g.addStop(-0.5, Qt::red);
	g.addStop(1.5, Qt::blue);
	EXPECT_EQ(g.stops()[0].first, 0);
	EXPECT_EQ(g.stops()[1].first, 1);
}

TEST(Brush, SameColor)
{
	EXPECT_TRUE(sameColor(Brush(QColor(Qt::red)), parseBrush("#ff0000")));
	EXPECT_FALSE(sameColor(Brush(QColor(Qt::red)), Brush(QColor(255, 0, 0, 128))));
	EXPECT_FALSE(sameColor(Brush::linearGradient(), Brush::linearGradient()));
}

TEST(Brush, LinearGradientToQBrush)
{
	Brush g = Brush::linearGradient();
	g.setStartPoint(QPointF(0, 0));
	g.setEndPoint(QPointF(1, 0));
	g.addStop(1, Qt::blue);
	g.addStop(0, Qt::red);
	g.setSpread(QGradient::ReflectSpread);
	g.setTransform(Transform::translate(5, 0));
	QBrush qb = g.toQBrush();
	ASSERT_EQ(qb.style(), Qt::LinearGradientPattern);
	const QGradient *qg = qb.gradient();
	ASSERT_NE(qg, nullptr);
	EXPECT_EQ(qg->spread(), QGradient::ReflectSpread);
	EXPECT_EQ(qg->coordinateMode(), QGradient::ObjectBoundingMode);
	ASSERT_EQ(qg->stops().count(), 2);
	EXPECT_EQ(qg->stops()[0].second, QColor(Qt::red));
	EXPECT_EQ(qb.transform(), QTransform::fromTranslate(5, 0));
}

TEST(Pen, Defaults)
{
	Pen pen(Brush(QColor(Qt::black)), 0);
	EXPECT_EQ(pen.thickness(), 1);
	EXPECT_EQ(pen.startCap(), Qt::FlatCap);
	EXPECT_EQ(pen.lineJoin(), Qt::MiterJoin);
	EXPECT_EQ(pen.miterLimit(), 4);
	EXPECT_TRUE(pen.dashPattern().isEmpty());
	pen.setMiterLimit(0.2);
	EXPECT_EQ(pen.miterLimit(), 1);
}

TEST(Pen, ToQPen)
{
	EXPECT_EQ(Pen().toQPen().style(), Qt::NoPen);

	Pen pen(Brush(QColor(Qt::green)), 2);
	pen.setLineCap(Qt::RoundCap);
	pen.setDashPattern(QVector<qreal>{4, 2, 6});
	QPen qp = pen.toQPen();
	EXPECT_EQ(qp.widthF(), 2);
	EXPECT_EQ(qp.capStyle(), Qt::RoundCap);
	EXPECT_EQ(qp.color(), QColor(Qt::green));
	// odd dash lists repeat, QPen counts in pen widths
	EXPECT_EQ(qp.dashPattern(), (QVector<qreal>{2, 1, 3, 2, 1, 3}));
}
