#include "style.h"

#include "definitions.h"
#include "errors.h"
#include "log.h"
#include "numbers.h"
#include "svgnames.h"
#include "xmlelement.h"

#include <QRegExp>
#include <QStringList>

namespace svgdraw {

namespace {

struct PropertyName
{
	Property property;
	QLatin1String name;
};

const PropertyName property_names[] = {
	{Property::Fill, names::fill},
	{Property::FillOpacity, names::fillOpacity},
	{Property::FillRule, names::fillRule},
	{Property::Stroke, names::stroke},
	{Property::StrokeWidth, names::strokeWidth},
	{Property::StrokeLinecap, names::strokeLinecap},
	{Property::StrokeLinejoin, names::strokeLinejoin},
	{Property::StrokeMiterlimit, names::strokeMiterlimit},
	{Property::StrokeDasharray, names::strokeDasharray},
	{Property::StrokeDashoffset, names::strokeDashoffset},
	{Property::StrokeOpacity, names::strokeOpacity},
	{Property::Opacity, names::opacity},
	{Property::StopColor, names::stopColor},
	{Property::StopOpacity, names::stopOpacity},
	{Property::Transform, names::transform},
};

PropertyValue parseNumber(const QString &value)
{
	bool ok;
	qreal n = toDouble(value, &ok);
	if(!ok) {
		nWarning() << "invalid number:" << value;
		return PropertyValue();
	}
	return PropertyValue(n);
}

// value kind a url(#id) reference is coerced to
PropertyValue resolveReference(Property property, const QString &id, const DefinitionsRegistry &registry)
{
	switch (property) {
	case Property::Fill:
	case Property::Stroke:
		return PropertyValue(registry.value<Brush>(id, Brush(QColor(Qt::black))));
	case Property::StopColor: {
		Brush b = registry.value<Brush>(id);
		return PropertyValue(b.isSolid()? b.color(): QColor(Qt::black));
	}
	case Property::FillOpacity:
	case Property::StrokeWidth:
	case Property::StrokeDashoffset:
	case Property::StrokeOpacity:
	case Property::Opacity:
	case Property::StopOpacity:
		return PropertyValue(registry.value<qreal>(id, 0));
	case Property::StrokeMiterlimit:
		return PropertyValue(qMax(qreal(1), registry.value<qreal>(id, 0)));
	case Property::StrokeDasharray:
		return PropertyValue(QVector<qreal>());
	case Property::FillRule:
		return PropertyValue(Qt::WindingFill);
	case Property::StrokeLinecap:
		return PropertyValue(Qt::FlatCap);
	case Property::StrokeLinejoin:
		return PropertyValue(Qt::MiterJoin);
	case Property::Transform:
		return PropertyValue(registry.value<Transform>(id));
	}
	return PropertyValue();
}

}

bool propertyFromName(const QString &name, Property *property)
{
	for(const PropertyName &pn : property_names) {
		if(name == pn.name) {
			if(property)
				*property = pn.property;
			return true;
		}
	}
	return false;
}

CssAttributes splitStyle(const QString &style)
{
	CssAttributes ret;
	const int len = style.length();
	int index = 0;
	while (index < len) {
		if (style.at(index).isSpace() || style.at(index) == QLatin1Char(',')) {
			++index;
			continue;
		}
		int colon = style.indexOf(':', index);
		if(colon < 0)
			break;
		int semicolon = style.indexOf(';', colon);
		if(semicolon < 0)
			semicolon = len;
		const QString key = style.mid(index, colon - index).trimmed();
		const QString value = style.mid(colon + 1, semicolon - colon - 1).trimmed();
		if(!key.isEmpty())
			ret[key] = value;
		index = semicolon + 1;
	}
	return ret;
}

bool isUrlReference(const QString &value, QString *id)
{
	const QString s = value.trimmed();
	if(!s.startsWith(names::url, Qt::CaseInsensitive))
		return false;
	int start = s.indexOf('(');
	int end = s.indexOf(')', start);
	if(start <= 0 || end <= start)
		return false;
	QString ref = s.mid(start + 1, end - start - 1).trimmed();
	if(ref.startsWith('#'))
		ref = ref.mid(1);
	if(id)
		*id = ref;
	return true;
}

Qt::FillRule parseFillRule(const QString &value)
{
	if(value.trimmed().compare(names::evenodd, Qt::CaseInsensitive) == 0)
		return Qt::OddEvenFill;
	return Qt::WindingFill;
}

Qt::PenCapStyle parseLineCap(const QString &value)
{
	const QString s = value.trimmed();
	if(s.compare(names::round, Qt::CaseInsensitive) == 0)
		return Qt::RoundCap;
	if(s.compare(names::square, Qt::CaseInsensitive) == 0)
		return Qt::SquareCap;
	return Qt::FlatCap;
}

Qt::PenJoinStyle parseLineJoin(const QString &value)
{
	const QString s = value.trimmed();
	if(s.compare(names::round, Qt::CaseInsensitive) == 0)
		return Qt::RoundJoin;
	if(s.compare(names::bevel, Qt::CaseInsensitive) == 0)
		return Qt::BevelJoin;
	// miter-clip has no Qt counterpart
	return Qt::MiterJoin;
}

QVector<qreal> parseDashArray(const QString &value)
{
	QVector<qreal> ret;
	if(value.trimmed() == names::none)
		return ret;
	const QStringList parts = value.split(QRegExp(QStringLiteral("[\\s,]+")), QString::SkipEmptyParts);
	for(const QString &part : parts) {
		bool ok;
		qreal v = toDouble(part, &ok);
		ret << (ok? v: 0);
	}
	return ret;
}

Brush resolveBrush(const QString &value, const DefinitionsRegistry &registry)
{
	QString id;
	if(isUrlReference(value, &id))
		return registry.value<Brush>(id, Brush(QColor(Qt::black)));
	return parseBrush(value);
}

PropertyValue parsePropertyValue(Property property, const QString &value, const DefinitionsRegistry &registry)
{
	QString id;
	if(isUrlReference(value, &id))
		return resolveReference(property, id, registry);
	switch (property) {
	case Property::Fill:
	case Property::Stroke:
	case Property::StopColor:
		try {
			QColor c = parseColor(value);
			if(property == Property::StopColor)
				return PropertyValue(c);
			return PropertyValue(Brush(c));
		}
		catch (const FormatError &e) {
			nWarning() << "skipping paint value:" << e.what();
			return PropertyValue();
		}
	case Property::FillOpacity:
	case Property::StrokeWidth:
	case Property::StrokeDashoffset:
	case Property::StrokeOpacity:
	case Property::Opacity:
	case Property::StopOpacity:
		return parseNumber(value);
	case Property::StrokeMiterlimit: {
		PropertyValue v = parseNumber(value);
		if(v.isValid())
			return PropertyValue(qMax(qreal(1), v.toNumber()));
		return v;
	}
	case Property::StrokeDasharray:
		return PropertyValue(parseDashArray(value));
	case Property::FillRule:
		return PropertyValue(parseFillRule(value));
	case Property::StrokeLinecap:
		return PropertyValue(parseLineCap(value));
	case Property::StrokeLinejoin:
		return PropertyValue(parseLineJoin(value));
	case Property::Transform:
		return PropertyValue(parseTransform(value));
	}
	return PropertyValue();
}

static void insertProperties(PropertyMap &map, const CssAttributes &attributes, const DefinitionsRegistry &registry)
{
	for(auto it = attributes.constBegin(); it != attributes.constEnd(); ++it) {
		Property property;
		if(!propertyFromName(it.key(), &property))
			continue;
		PropertyValue v = parsePropertyValue(property, it.value(), registry);
		if(v.isValid())
			map[property] = v;
	}
}

PropertyMap parseStyle(const QString &style, const DefinitionsRegistry &registry)
{
	PropertyMap ret;
	insertProperties(ret, splitStyle(style), registry);
	return ret;
}

PropertyMap parsePresentationAttributes(const XmlElement &element, const DefinitionsRegistry &registry)
{
	PropertyMap ret;
	insertProperties(ret, element.attributes(), registry);
	return ret;
}

PropertyMap resolveProperties(const XmlElement &element, const DefinitionsRegistry &registry)
{
	PropertyMap ret = parsePresentationAttributes(element, registry);
	const PropertyMap style = parseStyle(element.attribute(names::style), registry);
	for(auto it = style.constBegin(); it != style.constEnd(); ++it)
		ret[it.key()] = it.value();
	return ret;
}

}
