#include "shapes.h"

#include "definitions.h"
#include "errors.h"
#include "log.h"
#include "numbers.h"
#include "pathdata.h"
#include "svgnames.h"
#include "xmlelement.h"

namespace svgdraw {

qreal numberAttribute(const XmlElement &element, const QString &name, qreal default_value, bool *ok)
{
	if(ok)
		*ok = false;
	if(!element.hasAttribute(name))
		return default_value;
	QString s = element.attribute(name).trimmed();
	if(s.endsWith(QLatin1String("px")))
		s.chop(2);
	bool is_number;
	qreal v = toDouble(s, &is_number);
	if(!is_number) {
		nWarning() << element.name() << "invalid" << name << "value:" << element.attribute(name);
		return default_value;
	}
	if(ok)
		*ok = true;
	return v;
}

static qreal numberProperty(const PropertyMap &properties, Property property, qreal default_value)
{
	auto it = properties.constFind(property);
	if(it != properties.constEnd() && it->kind() == PropertyValue::Kind::Number)
		return it->toNumber();
	return default_value;
}

static Brush brushProperty(const PropertyMap &properties, Property property)
{
	auto it = properties.constFind(property);
	if(it != properties.constEnd() && it->kind() == PropertyValue::Kind::Brush)
		return it->toBrush();
	return Brush();
}

static Brush inheritedBrush(const ElementContext &ctx, const QString &value)
{
	try {
		return resolveBrush(value, ctx.registry());
	}
	catch (const FormatError &e) {
		nWarning() << "invalid inherited paint:" << e.what();
	}
	return Brush();
}

Brush resolveFill(const ElementContext &ctx, const PropertyMap &properties)
{
	Brush fill = brushProperty(properties, Property::Fill);
	if(fill.isNone() && ctx.inherited().hasFill)
		fill = inheritedBrush(ctx, ctx.inherited().fill);
	if(fill.isNone())
		fill = Brush(QColor(Qt::black));
	// fill:none stays transparent whatever the opacity says
	if(fill.isTransparent())
		return fill;
	const qreal opacity = ctx.inherited().opacity
			* numberProperty(properties, Property::Opacity, 1)
			* numberProperty(properties, Property::FillOpacity, 1);
	return applyOpacityToBrush(fill, opacity);
}

Pen resolveStroke(const ElementContext &ctx, const PropertyMap &properties)
{
	const GroupState &inherited = ctx.inherited();
	Brush brush = brushProperty(properties, Property::Stroke);
	if(brush.isNone() && inherited.hasStroke)
		brush = inheritedBrush(ctx, inherited.stroke);
	if(brush.isNone())
		return Pen();
	if(!brush.isTransparent()) {
		const qreal opacity = inherited.opacity
				* numberProperty(properties, Property::Opacity, 1)
				* numberProperty(properties, Property::StrokeOpacity, 1);
		brush = applyOpacityToBrush(brush, opacity);
	}
	Pen pen(brush, numberProperty(properties, Property::StrokeWidth, inherited.hasStrokeWidth? inherited.strokeWidth: 1));
	auto it = properties.constFind(Property::StrokeLinecap);
	if(it != properties.constEnd())
		pen.setLineCap(it->toLineCap());
	it = properties.constFind(Property::StrokeLinejoin);
	if(it != properties.constEnd())
		pen.setLineJoin(it->toLineJoin());
	pen.setMiterLimit(numberProperty(properties, Property::StrokeMiterlimit, pen.miterLimit()));
	it = properties.constFind(Property::StrokeDasharray);
	if(it != properties.constEnd())
		pen.setDashPattern(it->toNumberList());
	pen.setDashOffset(numberProperty(properties, Property::StrokeDashoffset, 0));
	return pen;
}

static Qt::FillRule resolveFillRule(const ElementContext &ctx, const PropertyMap &properties)
{
	auto it = properties.constFind(Property::FillRule);
	if(it != properties.constEnd())
		return it->toFillRule();
	if(ctx.inherited().hasFillRule)
		return parseFillRule(ctx.inherited().fillRule);
	return Qt::WindingFill;
}

static DrawingNode makeShape(const ElementContext &ctx, Geometry geometry, bool with_fill = true)
{
	const PropertyMap properties = resolveProperties(ctx.element(), ctx.registry());
	Brush fill = with_fill? resolveFill(ctx, properties): Brush();
	Pen stroke = resolveStroke(ctx, properties);
	if(geometry.type() == Geometry::Type::Path)
		geometry.setFillRule(resolveFillRule(ctx, properties));
	auto it = properties.constFind(Property::Transform);
	if(it != properties.constEnd()) {
		geometry.setTransform(it->toTransform());
		// the gradient has to follow the shape it paints
		if(fill.isGradient() && !geometry.transform().isIdentity()) {
			QVector<Transform> transforms;
			if(!fill.transform().isIdentity())
				transforms << fill.transform();
			transforms << geometry.transform();
			fill.setTransform(Transform::group(transforms));
		}
	}
	logSvgD() << "shape:" << ctx.element().name() << "bounds:" << geometry.bounds().width() << geometry.bounds().height();
	return DrawingNode::shape(geometry, fill, stroke);
}

DrawingNode parseRect(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	QRectF r(numberAttribute(el, names::x),
			 numberAttribute(el, names::y),
			 qMax(qreal(0), numberAttribute(el, names::width)),
			 qMax(qreal(0), numberAttribute(el, names::height)));
	return makeShape(ctx, Geometry::rect(r, numberAttribute(el, names::rx), numberAttribute(el, names::ry)));
}

DrawingNode parseCircle(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	qreal r = numberAttribute(el, names::r);
	return makeShape(ctx, Geometry::ellipse(QPointF(numberAttribute(el, names::cx), numberAttribute(el, names::cy)), r, r));
}

DrawingNode parseEllipse(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	return makeShape(ctx, Geometry::ellipse(QPointF(numberAttribute(el, names::cx), numberAttribute(el, names::cy)),
											numberAttribute(el, names::rx),
											numberAttribute(el, names::ry)));
}

DrawingNode parseLine(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	QLineF line(numberAttribute(el, names::x1), numberAttribute(el, names::y1),
				numberAttribute(el, names::x2), numberAttribute(el, names::y2));
	return makeShape(ctx, Geometry::line(line), false);
}

static QPainterPath polylinePath(const QPolygonF &points)
{
	QPainterPath ret;
	if(points.isEmpty())
		return ret;
	ret.moveTo(points.first());
	for (int i = 1; i < points.count(); ++i)
		ret.lineTo(points[i]);
	return ret;
}

DrawingNode parsePolyline(const ElementContext &ctx)
{
	return makeShape(ctx, Geometry::path(polylinePath(parsePoints(ctx.element().attribute(names::points)))));
}

DrawingNode parsePolygon(const ElementContext &ctx)
{
	QPolygonF points = parsePoints(ctx.element().attribute(names::points));
	if(!points.isEmpty() && points.first() != points.last())
		points << points.first();
	QPainterPath path = polylinePath(points);
	if(!points.isEmpty())
		path.closeSubpath();
	return makeShape(ctx, Geometry::path(path));
}

DrawingNode parsePath(const ElementContext &ctx)
{
	return makeShape(ctx, Geometry::path(parsePathData(ctx.element().attribute(names::d))));
}

bool isShapeElement(const QString &name)
{
	return name == names::rect
			|| name == names::circle
			|| name == names::ellipse
			|| name == names::line
			|| name == names::polyline
			|| name == names::polygon
			|| name == names::path
			|| name == names::text;
}

DrawingNode parseShape(const ElementContext &ctx)
{
	const QString name = ctx.element().name();
	if(name == names::rect)
		return parseRect(ctx);
	if(name == names::circle)
		return parseCircle(ctx);
	if(name == names::ellipse)
		return parseEllipse(ctx);
	if(name == names::line)
		return parseLine(ctx);
	if(name == names::polyline)
		return parsePolyline(ctx);
	if(name == names::polygon)
		return parsePolygon(ctx);
	if(name == names::path)
		return parsePath(ctx);
	if(name == names::text)
		return parseText(ctx);
	throw InvalidOperationError(QStringLiteral("Not a shape element: %1").arg(name));
}

}
