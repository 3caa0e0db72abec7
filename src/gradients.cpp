#include "shapes.h"

#include "definitions.h"
#include "errors.h"
#include "log.h"
#include "numbers.h"
#include "svgnames.h"
#include "xmlelement.h"

namespace svgdraw {

// gradient coordinates and stop offsets accept percentages of the unit square
static qreal fractionAttribute(const XmlElement &element, const QString &name, qreal default_value, bool *ok = nullptr)
{
	QString s = element.attribute(name).trimmed();
	if(s.endsWith('%')) {
		s.chop(1);
		bool is_number;
		qreal v = toDouble(s, &is_number);
		if(ok)
			*ok = is_number;
		return is_number? v / 100: default_value;
	}
	return numberAttribute(element, name, default_value, ok);
}

static QGradient::Spread parseSpread(const QString &value)
{
	if(value == names::reflect)
		return QGradient::ReflectSpread;
	if(value == names::repeat)
		return QGradient::RepeatSpread;
	return QGradient::PadSpread;
}

static void parseStops(const ElementContext &ctx, Brush &brush)
{
	for(const XmlElement &stop : ctx.element().children()) {
		if(stop.name() != names::stop)
			continue;
		qreal offset = fractionAttribute(stop, names::offset, 0);
		QColor color(Qt::black);
		if(stop.hasAttribute(names::stopColor)) {
			try {
				color = parseColor(stop.attribute(names::stopColor));
			}
			catch (const FormatError &e) {
				nWarning() << "invalid stop-color:" << e.what();
			}
		}
		// stop-opacity applies to the final stop-color
		bool ok;
		qreal opacity = numberAttribute(stop, names::stopOpacity, 1, &ok);
		if(ok)
			color = applyOpacityToColor(color, opacity);
		const PropertyMap style = parseStyle(stop.attribute(names::style), ctx.registry());
		auto it = style.constFind(Property::StopColor);
		if(it != style.constEnd())
			color = it->toColor();
		it = style.constFind(Property::StopOpacity);
		if(it != style.constEnd())
			color = applyOpacityToColor(color, it->toNumber());
		brush.addStop(offset, color);
	}
}

static void parseCommonAttributes(const ElementContext &ctx, Brush &brush)
{
	const XmlElement &el = ctx.element();
	if(el.hasAttribute(names::gradientUnits))
		brush.setMappingMode(el.attribute(names::gradientUnits).trimmed() == names::userSpaceOnUse? QGradient::LogicalMode: QGradient::ObjectBoundingMode);
	if(el.hasAttribute(names::spreadMethod))
		brush.setSpread(parseSpread(el.attribute(names::spreadMethod).trimmed()));
	if(el.hasAttribute(names::gradientTransform))
		brush.setTransform(parseTransform(el.attribute(names::gradientTransform)));
	parseStops(ctx, brush);
}

// the referenced gradient, Brush() when there is none
static Brush referencedGradient(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	if(!el.hasAttribute(names::href))
		return Brush();
	QString id = el.attribute(names::href).trimmed();
	if(id.startsWith('#'))
		id = id.mid(1);
	bool ok;
	Brush ret = ctx.registry().value<Brush>(id, Brush(), &ok);
	if(!ok || !ret.isGradient()) {
		nWarning() << el.name() << "references unknown gradient:" << id;
		return Brush();
	}
	return ret;
}

static void inheritCommon(const ElementContext &ctx, Brush &brush, const Brush &base)
{
	const XmlElement &el = ctx.element();
	if(brush.stops().isEmpty())
		brush.setStops(base.stops());
	if(!el.hasAttribute(names::gradientUnits))
		brush.setMappingMode(base.mappingMode());
	if(!el.hasAttribute(names::spreadMethod))
		brush.setSpread(base.spread());
	if(!el.hasAttribute(names::gradientTransform))
		brush.setTransform(base.transform());
}

Brush parseLinearGradient(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	Brush brush = Brush::linearGradient();
	QPointF start = brush.startPoint();
	QPointF end = brush.endPoint();
	start.setX(fractionAttribute(el, names::x1, start.x()));
	start.setY(fractionAttribute(el, names::y1, start.y()));
	end.setX(fractionAttribute(el, names::x2, end.x()));
	end.setY(fractionAttribute(el, names::y2, end.y()));
	brush.setStartPoint(start);
	brush.setEndPoint(end);
	parseCommonAttributes(ctx, brush);

	const Brush base = referencedGradient(ctx);
	if(base.isGradient()) {
		// a point still at its default is taken as unset
		if(base.type() == Brush::Type::LinearGradient) {
			if(brush.startPoint() == QPointF(0, 0))
				brush.setStartPoint(base.startPoint());
			if(brush.endPoint() == QPointF(1, 1))
				brush.setEndPoint(base.endPoint());
		}
		inheritCommon(ctx, brush, base);
	}
	logSvgD() << "linear gradient:" << el.attribute(names::id) << "stops:" << brush.stops().count();
	return brush;
}

Brush parseRadialGradient(const ElementContext &ctx)
{
	const XmlElement &el = ctx.element();
	Brush brush = Brush::radialGradient();
	QPointF center = brush.center();
	QPointF origin = brush.gradientOrigin();
	center.setX(fractionAttribute(el, names::cx, center.x()));
	center.setY(fractionAttribute(el, names::cy, center.y()));
	origin.setX(fractionAttribute(el, names::fx, origin.x()));
	origin.setY(fractionAttribute(el, names::fy, origin.y()));
	brush.setCenter(center);
	brush.setGradientOrigin(origin);
	bool has_r;
	qreal r = fractionAttribute(el, names::r, brush.radiusX(), &has_r);
	brush.setRadiusX(r);
	brush.setRadiusY(r);
	parseCommonAttributes(ctx, brush);

	const Brush base = referencedGradient(ctx);
	if(base.isGradient()) {
		if(base.type() == Brush::Type::RadialGradient) {
			if(brush.center() == QPointF(0.5, 0.5))
				brush.setCenter(base.center());
			if(brush.gradientOrigin() == QPointF(0.5, 0.5))
				brush.setGradientOrigin(base.gradientOrigin());
			if(!has_r) {
				brush.setRadiusX(base.radiusX());
				brush.setRadiusY(base.radiusY());
			}
		}
		inheritCommon(ctx, brush, base);
	}
	// the focal point defaults to the center
	QPointF focal = brush.gradientOrigin();
	if(!el.hasAttribute(names::fx) && focal.x() == 0.5)
		focal.setX(brush.center().x());
	if(!el.hasAttribute(names::fy) && focal.y() == 0.5)
		focal.setY(brush.center().y());
	brush.setGradientOrigin(focal);
	logSvgD() << "radial gradient:" << el.attribute(names::id) << "stops:" << brush.stops().count();
	return brush;
}

bool isGradientElement(const QString &name)
{
	return name == names::linearGradient || name == names::radialGradient;
}

Brush parseGradient(const ElementContext &ctx)
{
	const QString name = ctx.element().name();
	if(name == names::linearGradient)
		return parseLinearGradient(ctx);
	if(name == names::radialGradient)
		return parseRadialGradient(ctx);
	throw InvalidOperationError(QStringLiteral("Not a gradient element: %1").arg(name));
}

}
