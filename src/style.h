#ifndef SVGDRAW_STYLE_H
#define SVGDRAW_STYLE_H

#include "brush.h"
#include "transform.h"

#include <QMap>
#include <QString>
#include <QVector>

namespace svgdraw {

class DefinitionsRegistry;
class XmlElement;

enum class Property {
	Fill,
	FillOpacity,
	FillRule,
	Stroke,
	StrokeWidth,
	StrokeLinecap,
	StrokeLinejoin,
	StrokeMiterlimit,
	StrokeDasharray,
	StrokeDashoffset,
	StrokeOpacity,
	Opacity,
	StopColor,
	StopOpacity,
	Transform
};

// typed value of one style property, Invalid when the literal did not parse
class PropertyValue
{
public:
	enum class Kind {
		Invalid,
		Brush,
		Color,
		Number,
		NumberList,
		FillRule,
		LineCap,
		LineJoin,
		Transform
	};

	PropertyValue() {}
	explicit PropertyValue(const svgdraw::Brush &b) : m_kind(Kind::Brush), m_brush(b) {}
	explicit PropertyValue(const QColor &c) : m_kind(Kind::Color), m_color(c) {}
	explicit PropertyValue(qreal n) : m_kind(Kind::Number), m_number(n) {}
	explicit PropertyValue(const QVector<qreal> &l) : m_kind(Kind::NumberList), m_numbers(l) {}
	explicit PropertyValue(Qt::FillRule r) : m_kind(Kind::FillRule), m_fillRule(r) {}
	explicit PropertyValue(Qt::PenCapStyle c) : m_kind(Kind::LineCap), m_lineCap(c) {}
	explicit PropertyValue(Qt::PenJoinStyle j) : m_kind(Kind::LineJoin), m_lineJoin(j) {}
	explicit PropertyValue(const svgdraw::Transform &t) : m_kind(Kind::Transform), m_transform(t) {}

	Kind kind() const { return m_kind; }
	bool isValid() const { return m_kind != Kind::Invalid; }

	svgdraw::Brush toBrush() const { return m_brush; }
	QColor toColor() const { return m_color; }
	qreal toNumber() const { return m_number; }
	QVector<qreal> toNumberList() const { return m_numbers; }
	Qt::FillRule toFillRule() const { return m_fillRule; }
	Qt::PenCapStyle toLineCap() const { return m_lineCap; }
	Qt::PenJoinStyle toLineJoin() const { return m_lineJoin; }
	svgdraw::Transform toTransform() const { return m_transform; }
private:
	Kind m_kind = Kind::Invalid;
	svgdraw::Brush m_brush;
	QColor m_color;
	qreal m_number = 0;
	QVector<qreal> m_numbers;
	Qt::FillRule m_fillRule = Qt::WindingFill;
	Qt::PenCapStyle m_lineCap = Qt::FlatCap;
	Qt::PenJoinStyle m_lineJoin = Qt::MiterJoin;
	svgdraw::Transform m_transform;
};

using PropertyMap = QMap<Property, PropertyValue>;
using CssAttributes = QMap<QString, QString>;

bool propertyFromName(const QString &name, Property *property);

// raw key: value; pairs of a style attribute, later keys win
CssAttributes splitStyle(const QString &style);

// url(#id) or url(id), id is returned without '#'
bool isUrlReference(const QString &value, QString *id = nullptr);

/*
 * Parses value for property. A url(#id) value is looked up in the registry
 * and coerced to the property type, a miss gives the property default
 * (black brush, 0, identity). Malformed colours and numbers give an invalid
 * value, a malformed transform throws FormatError.
 */
PropertyValue parsePropertyValue(Property property, const QString &value, const DefinitionsRegistry &registry);

// unknown keys are ignored
PropertyMap parseStyle(const QString &style, const DefinitionsRegistry &registry);
// presentation attributes with the same names as the style keys
PropertyMap parsePresentationAttributes(const XmlElement &element, const DefinitionsRegistry &registry);
// presentation attributes overridden by the style attribute
PropertyMap resolveProperties(const XmlElement &element, const DefinitionsRegistry &registry);

// brush or url(#id) reference, missing reference gives black, throws FormatError on a bad colour
Brush resolveBrush(const QString &value, const DefinitionsRegistry &registry);

Qt::FillRule parseFillRule(const QString &value);
Qt::PenCapStyle parseLineCap(const QString &value);
Qt::PenJoinStyle parseLineJoin(const QString &value);
QVector<qreal> parseDashArray(const QString &value);

}

#endif // SVGDRAW_STYLE_H
