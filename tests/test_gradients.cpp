#include "definitions.h"
#include "shapes.h"
#include "svghandler.h"
#include "xmlelement.h"

#include <gtest/gtest.h>

using namespace svgdraw;

namespace {

Brush parse(const QByteArray &xml, const DefinitionsRegistry &registry = DefinitionsRegistry())
{
	const XmlElement el = XmlElement::parse(xml);
	return parseGradient(ElementContext(el, registry));
}

}

TEST(Gradients, LinearDefaults)
{
	Brush b = parse("<linearGradient/>");
	EXPECT_EQ(b.type(), Brush::Type::LinearGradient);
	EXPECT_EQ(b.startPoint(), QPointF(0, 0));
	EXPECT_EQ(b.endPoint(), QPointF(1, 1));
	EXPECT_EQ(b.spread(), QGradient::PadSpread);
	EXPECT_EQ(b.mappingMode(), QGradient::ObjectBoundingMode);
	EXPECT_TRUE(b.transform().isIdentity());
	EXPECT_TRUE(b.stops().isEmpty());
}

TEST(Gradients, LinearAttributes)
{
	Brush b = parse("<linearGradient x1='10%' y1='0' x2='0.9' y2='1' spreadMethod='reflect' "
					"gradientUnits='userSpaceOnUse' gradientTransform='rotate(90)'>"
					"<stop offset='0' stop-color='red'/>"
					"<stop offset='100%' stop-color='#0000ff' stop-opacity='0.5'/>"
					"</linearGradient>");
	EXPECT_NEAR(b.startPoint().x(), 0.1, 1e-9);
	EXPECT_EQ(b.endPoint(), QPointF(0.9, 1));
	EXPECT_EQ(b.spread(), QGradient::ReflectSpread);
	EXPECT_EQ(b.mappingMode(), QGradient::LogicalMode);
	EXPECT_EQ(b.transform(), Transform::rotate(90));
	ASSERT_EQ(b.stops().count(), 2);
	EXPECT_EQ(b.stops()[0].second, QColor(Qt::red));
	EXPECT_EQ(b.stops()[1].first, 1);
	EXPECT_EQ(b.stops()[1].second, QColor(0, 0, 255, 128));
}

TEST(Gradients, StopDefaultsAndStyleOverride)
{
	Brush b = parse("<linearGradient>"
					"<stop/>"
					"<stop offset='0.5' stop-color='red' style='stop-color:#00ff00;stop-opacity:0.5'/>"
					"<stop offset='1' stop-color='nonsense'/>"
					"</linearGradient>");
	ASSERT_EQ(b.stops().count(), 3);
	EXPECT_EQ(b.stops()[0].first, 0);
	EXPECT_EQ(b.stops()[0].second, QColor(Qt::black));
	EXPECT_EQ(b.stops()[1].second, QColor(0, 255, 0, 128));
	EXPECT_EQ(b.stops()[2].second, QColor(Qt::black));
}

TEST(Gradients, RadialDefaultsAndFocus)
{
	Brush b = parse("<radialGradient cx='0.3' cy='0.4' r='0.2'/>");
	EXPECT_EQ(b.type(), Brush::Type::RadialGradient);
	EXPECT_EQ(b.center(), QPointF(0.3, 0.4));
	EXPECT_EQ(b.radiusX(), 0.2);
	EXPECT_EQ(b.radiusY(), 0.2);
	// focal point follows the center when absent
	EXPECT_EQ(b.gradientOrigin(), QPointF(0.3, 0.4));

	Brush f = parse("<radialGradient fx='0.1' fy='0.2'/>");
	EXPECT_EQ(f.center(), QPointF(0.5, 0.5));
	EXPECT_EQ(f.gradientOrigin(), QPointF(0.1, 0.2));
	EXPECT_EQ(f.radiusX(), 0.5);
}

TEST(Gradients, HrefInheritsUnsetFields)
{
	DefinitionsRegistry registry;
	Brush base = Brush::linearGradient();
	base.setStartPoint(QPointF(0.2, 0.3));
	base.setEndPoint(QPointF(0.8, 0.9));
	base.addStop(0, Qt::red);
	base.addStop(1, Qt::blue);
	base.setSpread(QGradient::RepeatSpread);
	base.setMappingMode(QGradient::LogicalMode);
	registry.insert("base", base);

	Brush b = parse("<linearGradient xmlns:xlink='http://www.w3.org/1999/xlink' xlink:href='#base' x2='0.5' spreadMethod='pad'/>", registry);
	EXPECT_EQ(b.startPoint(), QPointF(0.2, 0.3));
	EXPECT_EQ(b.endPoint(), QPointF(0.5, 1));
	EXPECT_EQ(b.stops(), base.stops());
	EXPECT_EQ(b.spread(), QGradient::PadSpread);
	EXPECT_EQ(b.mappingMode(), QGradient::LogicalMode);
}

TEST(Gradients, HrefOwnStopsWin)
{
	DefinitionsRegistry registry;
	Brush base = Brush::linearGradient();
	base.addStop(0, Qt::red);
	base.addStop(1, Qt::blue);
	registry.insert("base", base);
	Brush b = parse("<linearGradient href='base'><stop offset='0.5' stop-color='green'/></linearGradient>", registry);
	ASSERT_EQ(b.stops().count(), 1);
	EXPECT_EQ(b.stops()[0].first, 0.5);
}

TEST(Gradients, HrefExplicitDefaultIsOverridden)
{
	DefinitionsRegistry registry;
	Brush base = Brush::linearGradient();
	base.setStartPoint(QPointF(0.4, 0.4));
	registry.insert("base", base);
	// an explicit 0,0 cannot be told apart from an absent start point
	Brush b = parse("<linearGradient href='#base' x1='0' y1='0'/>", registry);
	EXPECT_EQ(b.startPoint(), QPointF(0.4, 0.4));
}

TEST(Gradients, RadialInheritsFromRadial)
{
	DefinitionsRegistry registry;
	Brush base = Brush::radialGradient();
	base.setCenter(QPointF(0.1, 0.1));
	base.setGradientOrigin(QPointF(0.1, 0.1));
	base.setRadiusX(0.3);
	base.setRadiusY(0.3);
	base.addStop(0, Qt::red);
	registry.insert("base", base);
	Brush b = parse("<radialGradient href='#base'/>", registry);
	EXPECT_EQ(b.center(), QPointF(0.1, 0.1));
	EXPECT_EQ(b.radiusX(), 0.3);
	EXPECT_EQ(b.stops().count(), 1);
}

TEST(Gradients, UnknownHrefIsIgnored)
{
	Brush b = parse("<linearGradient href='#nothing' x1='0.5'/>");
	EXPECT_EQ(b.startPoint(), QPointF(0.5, 0));
	EXPECT_TRUE(b.stops().isEmpty());
}

TEST(Gradients, UserSpaceOnUseInDocument)
{
	SvgHandler handler;
	handler.load("<svg><defs>"
				 "<linearGradient id='abs' gradientUnits='userSpaceOnUse'/>"
				 "<linearGradient id='rel'/>"
				 "<linearGradient id='rel2' gradientUnits='objectBoundingBox'/>"
				 "</defs></svg>");
	EXPECT_EQ(handler.definitions().value<Brush>("abs").mappingMode(), QGradient::LogicalMode);
	EXPECT_EQ(handler.definitions().value<Brush>("rel").mappingMode(), QGradient::ObjectBoundingMode);
	EXPECT_EQ(handler.definitions().value<Brush>("rel2").mappingMode(), QGradient::ObjectBoundingMode);
}
